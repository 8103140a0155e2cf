/**
 * @file vision_client.hpp
 * @brief Vision model client used by the semantic analyzer
 *
 * @details OllamaClient talks to a local Ollama server through the curl CLI:
 *
 *          - GET  /api/tags  lists installed models (availability check)
 *
 *          - POST /api/chat  sends one base64 JPEG frame with the prompt
 *
 *          The request body is written to a temporary file and passed with
 *          --data-binary so large frames never hit the command line.
 */

#ifndef REEL_CUT_VISION_CLIENT_HPP
#define REEL_CUT_VISION_CLIENT_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace reel_cut {

/**
 * @class VisionClient
 * @brief Describes single frames with a vision-capable model.
 */
class VisionClient {
public:
  virtual ~VisionClient() = default;

  /**
   * @brief Check that the model can be used.
   * @param why Output: reason when unavailable
   */
  virtual bool check_available(std::string &why) = 0;

  /**
   * @brief Ask the model about one JPEG frame.
   * @param reply Output: the model's text answer
   * @param error Output: transport or protocol error
   * @return false on transport failure
   */
  virtual bool describe(const std::vector<uint8_t> &jpeg,
                        const std::string &prompt, std::string &reply,
                        std::string &error) = 0;
};

/// Standard base64 with padding
std::string base64_encode(const uint8_t *data, size_t size);

/**
 * @brief Whether an Ollama /api/tags reply lists the model.
 * @note "llava" matches "llava" and "llava:<tag>".
 */
bool tags_list_model(const std::string &tags_json, const std::string &model);

class OllamaClient : public VisionClient {
  std::string host_;
  std::string model_;
  int timeout_sec_;
  std::string curl_bin_;
  std::filesystem::path scratch_dir_;

public:
  OllamaClient(std::string host, std::string model, int timeout_sec,
               std::string curl_bin, std::filesystem::path scratch_dir);

  /// Client configured from OLLAMA_* settings, scratch files in the temp dir
  static OllamaClient from_config();

  bool check_available(std::string &why) override;
  bool describe(const std::vector<uint8_t> &jpeg, const std::string &prompt,
                std::string &reply, std::string &error) override;
};

} // namespace reel_cut

#endif // REEL_CUT_VISION_CLIENT_HPP
