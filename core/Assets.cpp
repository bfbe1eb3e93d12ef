#include "core/Assets.hpp"
#include <filesystem>
#include <string>

namespace assets {

namespace fs = std::filesystem;

namespace {

fs::path FindAssetsRoot() {
  std::error_code ec;
  fs::path current = fs::current_path(ec);
  if (ec) {
    return fs::path("assets");
  }

  for (int i = 0; i < 4; ++i) {
    if (fs::exists(current / "assets", ec)) {
      return current / "assets";
    }
    if (!current.has_parent_path() || current.parent_path() == current) {
      break;
    }
    current = current.parent_path();
  }
  return fs::path("assets");
}

} // namespace

const char *Path(const char *relative) {
  static thread_local std::string s_PathBuf;
  s_PathBuf = (FindAssetsRoot() / relative).string();
  return s_PathBuf.c_str();
}

bool Exists(const char *relative) {
  std::error_code ec;
  return fs::exists(fs::path(Path(relative)), ec);
}

} // namespace assets
