#pragma once

#include <string>

namespace docfill {

// Fresh private directory under the system temp directory, removed with its
// contents on destruction. Throws Error when it cannot be created.
class ScratchDir {
public:
  explicit ScratchDir(const std::string& prefix = "docfill");
  ~ScratchDir();

  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;
  ScratchDir(ScratchDir&& other) noexcept;
  ScratchDir& operator=(ScratchDir&& other) noexcept;

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

} // namespace docfill
