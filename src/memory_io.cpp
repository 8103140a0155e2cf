/**
 * @file memory_io.cpp
 * @brief Memory-mapped media input implementation
 */

#include "reel_cut/memory_io.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

extern "C" {
#include <libavformat/avio.h>
#include <libavutil/error.h>
}

#include <fmt/core.h>

namespace reel_cut {

// **---- MappedFile Implementation ----**

void MappedFile::release() noexcept {
  if (data_)
    munmap(data_, size_);
  if (fd_ != -1)
    close(fd_);
  data_ = nullptr;
  size_ = 0;
  fd_ = -1;
}

MappedFile::~MappedFile() { release(); }

MappedFile::MappedFile(MappedFile &&other) noexcept
    : data_(other.data_), size_(other.size_), fd_(other.fd_) {
  other.data_ = nullptr;
  other.size_ = 0;
  other.fd_ = -1;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    release();
    data_ = other.data_;
    size_ = other.size_;
    fd_ = other.fd_;

    other.data_ = nullptr;
    other.size_ = 0;
    other.fd_ = -1;
  }
  return *this;
}

// **---- MemoryLoader Implementation ----**

bool MemoryLoader::load_file(const std::string &path, MappedFile &file,
                             std::string &error) {
  int fd = open(path.c_str(), O_RDONLY);
  if (fd == -1) {
    error = fmt::format("cannot open {}: {}", path, std::strerror(errno));
    return false;
  }

  struct stat sb;
  if (fstat(fd, &sb) == -1) {
    error = fmt::format("cannot stat {}: {}", path, std::strerror(errno));
    close(fd);
    return false;
  }

  if (sb.st_size <= 0) {
    error = fmt::format("file is empty: {}", path);
    close(fd);
    return false;
  }

  /// Read-only private mapping, paged in lazily while decoding
  void *addr = mmap(nullptr, sb.st_size, PROT_READ, MAP_PRIVATE, fd, 0);
  if (addr == MAP_FAILED) {
    error = fmt::format("cannot mmap {}: {}", path, std::strerror(errno));
    close(fd);
    return false;
  }

  ///\note MADV_SEQUENTIAL enables aggressive read-ahead
  madvise(addr, sb.st_size, MADV_SEQUENTIAL);

  file.release();
  file.data_ = static_cast<uint8_t *>(addr);
  file.size_ = static_cast<size_t>(sb.st_size);
  file.fd_ = fd;
  return true;
}

int MemoryLoader::read(void *opaque, uint8_t *buf, int buf_size) {
  MemReaderState *bd = static_cast<MemReaderState *>(opaque);
  size_t bytes_left = bd->size - bd->pos;
  if (bytes_left == 0)
    return AVERROR_EOF;
  size_t copy = std::min(bytes_left, static_cast<size_t>(buf_size));
  memcpy(buf, bd->ptr + bd->pos, copy);
  bd->pos += copy;
  return static_cast<int>(copy);
}

int64_t MemoryLoader::seek(void *opaque, int64_t offset, int whence) {
  MemReaderState *bd = static_cast<MemReaderState *>(opaque);

  if (whence & AVSEEK_SIZE)
    return static_cast<int64_t>(bd->size);

  int64_t new_pos = static_cast<int64_t>(bd->pos);
  switch (whence & ~AVSEEK_FORCE) {
  case SEEK_SET:
    new_pos = offset;
    break;
  case SEEK_CUR:
    new_pos += offset;
    break;
  case SEEK_END:
    new_pos = static_cast<int64_t>(bd->size) + offset;
    break;
  default:
    return AVERROR(EINVAL);
  }

  new_pos = std::max<int64_t>(0, std::min<int64_t>(new_pos, bd->size));
  bd->pos = static_cast<size_t>(new_pos);
  return new_pos;
}

} // namespace reel_cut
