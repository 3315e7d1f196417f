#include "transcription_engine.hpp"

#include <stdlib.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cstdio>
#include <stdexcept>

#include "utils.hpp"

namespace {

// Removes the temp file on scope exit.
class ScratchFile {
public:
  explicit ScratchFile(const std::filesystem::path& dir) {
    std::string pattern = (dir / "voiceshare-XXXXXX.wav").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    fd_ = mkstemps(buf.data(), 4);
    if(fd_ < 0) {
      throw std::runtime_error("Failed to create temp file in " + dir.string());
    }
    path_ = buf.data();
  }
  ~ScratchFile() {
    if(fd_ >= 0) ::close(fd_);
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
  ScratchFile(const ScratchFile&) = delete;
  ScratchFile& operator=(const ScratchFile&) = delete;

  void write_all(const std::vector<uint8_t>& data) {
    std::size_t written = 0;
    while(written < data.size()) {
      ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
      if(n <= 0) throw std::runtime_error("Failed to write audio data");
      written += static_cast<std::size_t>(n);
    }
    ::close(fd_);
    fd_ = -1;
  }

  const std::filesystem::path& path() const { return path_; }

private:
  int fd_ = -1;
  std::filesystem::path path_;
};

void replace_all(std::string& text, const std::string& token, const std::string& value) {
  std::size_t pos = 0;
  while((pos = text.find(token, pos)) != std::string::npos) {
    text.replace(pos, token.size(), value);
    pos += value.size();
  }
}

} // namespace

CommandTranscriptionEngine::CommandTranscriptionEngine(std::string command_template,
                                                       std::shared_ptr<ModelInventory> inventory,
                                                       std::shared_ptr<Logger> logger,
                                                       std::filesystem::path scratch_dir)
  : command_template_(std::move(command_template)),
    inventory_(std::move(inventory)),
    logger_(std::move(logger)),
    scratch_dir_(std::move(scratch_dir)) {}

std::string CommandTranscriptionEngine::shell_quote(const std::string& value) {
  std::string out = "'";
  for(char c : value) {
    if(c == '\'') out += "'\\''";
    else out += c;
  }
  out += "'";
  return out;
}

std::string CommandTranscriptionEngine::transcribe(const std::vector<uint8_t>& audio,
                                                   const std::string& model_name) {
  if(audio.empty()) {
    throw std::runtime_error("Empty audio data");
  }
  auto model = inventory_ ? inventory_->model_path(model_name) : std::nullopt;
  if(!model) {
    throw std::runtime_error("Model '" + model_name + "' not found or not downloaded");
  }

  ScratchFile scratch(scratch_dir_);
  scratch.write_all(audio);

  std::string command = command_template_;
  replace_all(command, "{model}", shell_quote(model->string()));
  replace_all(command, "{audio}", shell_quote(scratch.path().string()));
  log_debug(logger_.get(), "Running inference: {}", command);

  FILE* pipe = popen(command.c_str(), "r");
  if(!pipe) {
    throw std::runtime_error("Failed to launch inference command");
  }
  std::string output;
  std::array<char, 4096> buf{};
  std::size_t n = 0;
  while((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0) {
    output.append(buf.data(), n);
  }
  int status = pclose(pipe);
  if(status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    throw std::runtime_error("Inference command failed with status " + std::to_string(status));
  }
  return trim_copy(output);
}
