#include "model_inventory.hpp"

#include <algorithm>
#include <cctype>

namespace {

constexpr const char* kModelPrefix = "ggml-";
constexpr const char* kModelSuffix = ".bin";

bool is_safe_model_name(const std::string& name) {
  if(name.empty()) return false;
  return std::all_of(name.begin(), name.end(), [](unsigned char ch){
    return std::isalnum(ch) || ch == '-' || ch == '.' || ch == '_';
  }) && name.find("..") == std::string::npos;
}

} // namespace

DirectoryModelInventory::DirectoryModelInventory(std::filesystem::path model_dir)
  : model_dir_(std::move(model_dir)) {}

std::vector<std::string> DirectoryModelInventory::downloaded_models() const {
  std::vector<std::string> names;
  std::error_code ec;
  if(!std::filesystem::is_directory(model_dir_, ec)) return names;
  const std::string prefix = kModelPrefix;
  const std::string suffix = kModelSuffix;
  for(std::filesystem::directory_iterator it(model_dir_, ec), end; !ec && it != end; it.increment(ec)) {
    if(!it->is_regular_file(ec)) continue;
    const std::string file = it->path().filename().string();
    if(file.size() <= prefix.size() + suffix.size()) continue;
    if(file.compare(0, prefix.size(), prefix) != 0) continue;
    if(file.compare(file.size() - suffix.size(), suffix.size(), suffix) != 0) continue;
    names.push_back(file.substr(prefix.size(), file.size() - prefix.size() - suffix.size()));
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::optional<std::filesystem::path> DirectoryModelInventory::model_path(const std::string& name) const {
  if(!is_safe_model_name(name)) return std::nullopt;
  auto path = model_dir_ / (std::string(kModelPrefix) + name + kModelSuffix);
  std::error_code ec;
  if(!std::filesystem::is_regular_file(path, ec)) return std::nullopt;
  return path;
}

std::string DirectoryModelInventory::display_name(const std::string& name) const {
  std::string out = name;
  std::replace(out.begin(), out.end(), '-', ' ');
  if(!out.empty()) out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
  return out;
}
