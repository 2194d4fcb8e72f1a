#pragma once

#include <string>
#include <vector>

namespace docfill {

std::string trimCopy(const std::string& s);
std::string toLowerAscii(std::string s);
std::string toUpperAscii(std::string s);
std::string replaceAll(std::string s, const std::string& from, const std::string& to);
bool endsWith(const std::string& s, const std::string& suffix);

// Lower-cased extension including the dot ("" when there is none).
std::string extensionOf(const std::string& path);
std::string stemOf(const std::string& path);

// rename(), falling back to copy + remove across filesystems.
void moveFile(const std::string& from, const std::string& to);

} // namespace docfill
