/**
 * @file vision_client.cpp
 * @brief Ollama vision client implementation
 */

#include "reel_cut/vision_client.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <unistd.h>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "reel_cut/config.hpp"
#include "reel_cut/logging.hpp"
#include "reel_cut/system.hpp"

namespace fs = std::filesystem;

namespace reel_cut {

namespace {

constexpr int TAGS_TIMEOUT_SEC = 5;
constexpr double TEMPERATURE = 0.3;
constexpr int NUM_PREDICT = 300;

/**
 * @class ScratchFile
 * @brief Uniquely named temporary file removed on destruction.
 */
class ScratchFile {
  std::string path_;

public:
  explicit ScratchFile(const fs::path &dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    std::string templ = (dir / "ollama-XXXXXX.json").string();
    int fd = mkstemps(templ.data(), 5);
    if (fd != -1) {
      close(fd);
      path_ = templ;
    }
  }
  ~ScratchFile() {
    if (!path_.empty())
      std::remove(path_.c_str());
  }
  ScratchFile(const ScratchFile &) = delete;
  ScratchFile &operator=(const ScratchFile &) = delete;

  const std::string &path() const { return path_; }
  bool valid() const { return !path_.empty(); }
};

} // namespace

std::string base64_encode(const uint8_t *data, size_t size) {
  static const char table[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve((size + 2) / 3 * 4);

  size_t i = 0;
  for (; i + 2 < size; i += 3) {
    uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) |
                 data[i + 2];
    out.push_back(table[(n >> 18) & 63]);
    out.push_back(table[(n >> 12) & 63]);
    out.push_back(table[(n >> 6) & 63]);
    out.push_back(table[n & 63]);
  }
  if (i + 1 == size) {
    uint32_t n = uint32_t(data[i]) << 16;
    out.push_back(table[(n >> 18) & 63]);
    out.push_back(table[(n >> 12) & 63]);
    out.append("==");
  } else if (i + 2 == size) {
    uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
    out.push_back(table[(n >> 18) & 63]);
    out.push_back(table[(n >> 12) & 63]);
    out.push_back(table[(n >> 6) & 63]);
    out.push_back('=');
  }
  return out;
}

bool tags_list_model(const std::string &tags_json, const std::string &model) {
  nlohmann::json tags = nlohmann::json::parse(tags_json, nullptr, false);
  if (tags.is_discarded() || !tags.contains("models") ||
      !tags["models"].is_array())
    return false;

  for (const auto &m : tags["models"]) {
    if (!m.contains("name") || !m["name"].is_string())
      continue;
    const std::string name = m["name"].get<std::string>();
    if (name == model || name.rfind(model + ":", 0) == 0)
      return true;
  }
  return false;
}

// **---- OllamaClient ----**

OllamaClient::OllamaClient(std::string host, std::string model,
                           int timeout_sec, std::string curl_bin,
                           fs::path scratch_dir)
    : host_(std::move(host)), model_(std::move(model)),
      timeout_sec_(timeout_sec), curl_bin_(std::move(curl_bin)),
      scratch_dir_(std::move(scratch_dir)) {
  while (!host_.empty() && host_.back() == '/')
    host_.pop_back();
}

OllamaClient OllamaClient::from_config() {
  return OllamaClient(Config::ollama_host(), Config::ollama_model(),
                      Config::ollama_timeout_sec(), Config::curl_bin(),
                      fs::path(Config::temp_dir()) / "scratch");
}

bool OllamaClient::check_available(std::string &why) {
  std::string cmd = fmt::format("{} -sS --max-time {} {} 2>/dev/null",
                                shell_quote(curl_bin_), TAGS_TIMEOUT_SEC,
                                shell_quote(host_ + "/api/tags"));
  CommandResult r = run_command(cmd);
  if (r.exit_code != 0) {
    why = fmt::format("Ollama not reachable at {} (curl exit {})", host_,
                      r.exit_code);
    return false;
  }
  if (!tags_list_model(r.output, model_)) {
    why = fmt::format("model {} not installed (ollama pull {})", model_,
                      model_);
    return false;
  }
  return true;
}

bool OllamaClient::describe(const std::vector<uint8_t> &jpeg,
                            const std::string &prompt, std::string &reply,
                            std::string &error) {
  nlohmann::json body;
  body["model"] = model_;
  body["stream"] = false;
  nlohmann::json message;
  message["role"] = "user";
  message["content"] = prompt;
  message["images"] = nlohmann::json::array();
  message["images"].push_back(base64_encode(jpeg.data(), jpeg.size()));
  body["messages"] = nlohmann::json::array();
  body["messages"].push_back(std::move(message));
  body["options"] = {{"temperature", TEMPERATURE},
                     {"num_predict", NUM_PREDICT}};

  ScratchFile request(scratch_dir_);
  if (!request.valid()) {
    error = "cannot create request file";
    return false;
  }
  {
    std::ofstream out(request.path(), std::ios::binary);
    out << body.dump();
    if (!out) {
      error = "cannot write request file";
      return false;
    }
  }

  std::string cmd = fmt::format(
      "{} -sS --max-time {} -H 'Content-Type: application/json' "
      "--data-binary @{} {} 2>&1",
      shell_quote(curl_bin_), timeout_sec_, shell_quote(request.path()),
      shell_quote(host_ + "/api/chat"));
  CommandResult r = run_command(cmd);
  if (r.exit_code != 0) {
    error = fmt::format("curl exit {}: {}", r.exit_code,
                        r.output.substr(0, 200));
    return false;
  }

  nlohmann::json response = nlohmann::json::parse(r.output, nullptr, false);
  if (response.is_discarded() || !response.is_object()) {
    error = "invalid response from Ollama";
    return false;
  }
  if (response.contains("error")) {
    error = fmt::format("Ollama error: {}", response["error"].dump());
    return false;
  }
  if (!response.contains("message") || !response["message"].is_object() ||
      !response["message"].contains("content") ||
      !response["message"]["content"].is_string()) {
    error = "Ollama reply has no message content";
    return false;
  }
  reply = response["message"]["content"].get<std::string>();
  return true;
}

} // namespace reel_cut
