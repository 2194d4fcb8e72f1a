#include "docfill/scratch.hpp"

#include <stdlib.h>

#include <filesystem>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "docfill/error.hpp"

namespace fs = std::filesystem;

namespace docfill {

ScratchDir::ScratchDir(const std::string& prefix) {
  std::error_code ec;
  fs::path base = fs::temp_directory_path(ec);
  if (ec) {
    base = "/tmp";
  }
  std::string templ = (base / (prefix + "_XXXXXX")).string();
  std::vector<char> buf(templ.begin(), templ.end());
  buf.push_back('\0');
  if (mkdtemp(buf.data()) == nullptr) {
    throw Error("Cannot create scratch directory under " + base.string());
  }
  path_ = buf.data();
}

ScratchDir::~ScratchDir() {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    spdlog::debug("Could not remove scratch directory {}: {}", path_, ec.message());
  }
}

ScratchDir::ScratchDir(ScratchDir&& other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
  if (this != &other) {
    std::error_code ec;
    if (!path_.empty()) {
      fs::remove_all(path_, ec);
    }
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

} // namespace docfill
