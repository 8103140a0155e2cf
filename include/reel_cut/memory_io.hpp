/**
 * @file memory_io.hpp
 * @brief Memory-mapped media input for FFmpeg
 *
 * @details Provides:
 *          - MemReaderState: State for custom FFmpeg I/O from memory buffer
 *
 *          - MappedFile: RAII read-only mapping of a media file
 *
 *          - MemoryLoader: File mapping and FFmpeg I/O callbacks
 *
 * @note Every analyzer thread maps the same downloaded file. The kernel shares
 *       the page cache between the mappings, so the file is read from disk
 *       once per job.
 */

#ifndef REEL_CUT_MEMORY_IO_HPP
#define REEL_CUT_MEMORY_IO_HPP

#include <cstdint>
#include <string>

#include "types.hpp"

namespace reel_cut {

/// Size of the AVIO read buffer handed to FFmpeg
constexpr size_t AVIO_BUFFER_SIZE = 256 * 1024; //< 256KB

/**
 * @brief MemReaderState: State for custom FFmpeg I/O from memory buffer.
 * @note Cache-line aligned since this is accessed heavily in the I/O callback.
 */
struct alignas(CACHE_LINE_SIZE) MemReaderState {
  const uint8_t *ptr; //< Pointer to buffer start
  size_t size;        //< Total buffer size
  size_t pos;         //< Current read position
};

/**
 * @class MappedFile
 * @brief RAII wrapper for memory-mapped files.
 * @note Handles automatic cleanup (munmap/close) on destruction.
 *       Supports move semantics but not copy.
 */
class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile();

  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;

  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  const uint8_t *data() const { return data_; }
  size_t size() const { return size_; }
  bool is_valid() const { return data_ != nullptr; }

private:
  friend class MemoryLoader;
  uint8_t *data_ = nullptr;
  size_t size_ = 0;
  int fd_ = -1;

  void release() noexcept;
};

/**
 * @class MemoryLoader
 * @brief Maps media files and provides custom I/O callbacks for FFmpeg.
 */
class MemoryLoader {
public:
  /**
   * @brief Map an entire file into memory using mmap.
   * @param path Path to the file
   * @param file Output MappedFile object (takes ownership of the mapping)
   * @param error Output: reason on failure
   * @return true on success, false on failure
   */
  static bool load_file(const std::string &path, MappedFile &file,
                        std::string &error);

  /**
   * @brief FFmpeg read callback for custom I/O.
   */
  static int read(void *opaque, uint8_t *buf, int buf_size);

  /**
   * @brief FFmpeg seek callback for custom I/O.
   * @note Handles all seek modes including AVSEEK_SIZE.
   */
  static int64_t seek(void *opaque, int64_t offset, int whence);
};

} // namespace reel_cut

#endif // REEL_CUT_MEMORY_IO_HPP
