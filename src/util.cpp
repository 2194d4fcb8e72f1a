/// Small string and filesystem helpers shared by the pipeline.

#include "docfill_internal.hpp"

#include <cctype>
#include <filesystem>
#include <system_error>

#include "docfill/error.hpp"

namespace fs = std::filesystem;

namespace docfill {

std::string trimCopy(const std::string& s) {
  size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) {
    ++i;
  }
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) {
    --j;
  }
  return s.substr(i, j - i);
}

std::string toLowerAscii(std::string s) {
  for (auto& c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

std::string toUpperAscii(std::string s) {
  for (auto& c : s) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return s;
}

std::string replaceAll(std::string s, const std::string& from, const std::string& to) {
  if (from.empty()) {
    return s;
  }
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
  return s;
}

bool endsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string extensionOf(const std::string& path) {
  return toLowerAscii(fs::path(path).extension().string());
}

std::string stemOf(const std::string& path) {
  return fs::path(path).stem().string();
}

void moveFile(const std::string& from, const std::string& to) {
  std::error_code ec;
  fs::rename(from, to, ec);
  if (!ec) {
    return;
  }
  // EXDEV and friends: scratch space may live on another device.
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    throw Error("Could not move '" + from + "' to '" + to + "': " + ec.message());
  }
  fs::remove(from, ec);
}

} // namespace docfill
