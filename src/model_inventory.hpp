#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Which models are present locally. Implementations must be safe to call
// from several threads.
class ModelInventory {
public:
  virtual ~ModelInventory() = default;

  virtual std::vector<std::string> downloaded_models() const = 0;
  virtual std::optional<std::filesystem::path> model_path(const std::string& name) const = 0;
  virtual std::string display_name(const std::string& name) const { return name; }

  bool has_downloaded_model() const { return !downloaded_models().empty(); }
  bool has_model(const std::string& name) const { return model_path(name).has_value(); }
};

// Models stored as whisper.cpp files: <dir>/ggml-<name>.bin
class DirectoryModelInventory : public ModelInventory {
public:
  explicit DirectoryModelInventory(std::filesystem::path model_dir);

  std::vector<std::string> downloaded_models() const override;
  std::optional<std::filesystem::path> model_path(const std::string& name) const override;
  std::string display_name(const std::string& name) const override;

  const std::filesystem::path& model_dir() const { return model_dir_; }

private:
  std::filesystem::path model_dir_;
};
