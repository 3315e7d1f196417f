#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "log.hpp"
#include "model_inventory.hpp"

// Blocking speech-to-text. Callers serialize access through InferenceGate.
// Failures throw std::runtime_error.
class TranscriptionEngine {
public:
  virtual ~TranscriptionEngine() = default;
  virtual std::string transcribe(const std::vector<uint8_t>& audio,
                                 const std::string& model_name) = 0;
};

// Runs an external recognizer. `{model}` and `{audio}` in the template are
// replaced by the quoted model path and a temporary WAV file; stdout is the
// transcript.
class CommandTranscriptionEngine : public TranscriptionEngine {
public:
  CommandTranscriptionEngine(std::string command_template,
                             std::shared_ptr<ModelInventory> inventory,
                             std::shared_ptr<Logger> logger = nullptr,
                             std::filesystem::path scratch_dir = std::filesystem::temp_directory_path());

  std::string transcribe(const std::vector<uint8_t>& audio,
                         const std::string& model_name) override;

  static std::string shell_quote(const std::string& value);

private:
  std::string command_template_;
  std::shared_ptr<ModelInventory> inventory_;
  std::shared_ptr<Logger> logger_;
  std::filesystem::path scratch_dir_;
};
