/// OPC zip container access (miniz) with lazily parsed XML parts (tinyxml2).

#include "docfill/package.hpp"

#include <tinyxml2.h>

#include <miniz.h>

#include <cctype>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <vector>

#include "docfill/error.hpp"
#include "docfill_internal.hpp"

namespace docfill {

namespace {

static std::string readBinaryFile(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    return std::string();
  }
  return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

// tinyxml2 drops text nodes made only of whitespace, which would glue words together
// in runs like <w:t xml:space="preserve"> </w:t>. Turn such content into character
// references so it survives parsing as a real text node.
static std::string protectWhitespaceText(const std::string& xml) {
  std::string out;
  out.reserve(xml.size());
  size_t i = 0;
  while (i < xml.size()) {
    char c = xml[i];
    out.push_back(c);
    ++i;
    if (c != '>' || i < 2 || xml[i - 2] == '/' || xml[i - 2] == '?' || xml[i - 2] == '-') {
      continue;
    }
    size_t j = i;
    while (j < xml.size() && std::isspace(static_cast<unsigned char>(xml[j]))) {
      ++j;
    }
    if (j == i || j + 1 >= xml.size() || xml[j] != '<' || xml[j + 1] != '/') {
      continue;
    }
    // Only after a start tag.
    size_t lt = xml.rfind('<', i - 1);
    if (lt == std::string::npos || lt + 1 >= xml.size() || xml[lt + 1] == '/' || xml[lt + 1] == '!') {
      continue;
    }
    for (size_t k = i; k < j; ++k) {
      out += "&#" + std::to_string(static_cast<int>(static_cast<unsigned char>(xml[k]))) + ";";
    }
    i = j;
  }
  return out;
}

static std::string serializeXml(const tinyxml2::XMLDocument& doc) {
  tinyxml2::XMLPrinter printer(nullptr, true);
  doc.Print(&printer);
  return std::string(printer.CStr(), static_cast<size_t>(printer.CStrSize() > 0 ? printer.CStrSize() - 1 : 0));
}

class ZipReaderGuard {
public:
  explicit ZipReaderGuard(mz_zip_archive& zip) : zip_(zip) {}
  ZipReaderGuard(const ZipReaderGuard&) = delete;
  ZipReaderGuard& operator=(const ZipReaderGuard&) = delete;
  ~ZipReaderGuard() { mz_zip_reader_end(&zip_); }

private:
  mz_zip_archive& zip_;
};

class ZipWriterGuard {
public:
  explicit ZipWriterGuard(mz_zip_archive& zip) : zip_(zip) {}
  ZipWriterGuard(const ZipWriterGuard&) = delete;
  ZipWriterGuard& operator=(const ZipWriterGuard&) = delete;
  ~ZipWriterGuard() { mz_zip_writer_end(&zip_); }

private:
  mz_zip_archive& zip_;
};

// Owns a block returned by mz_zip_reader_extract_to_heap.
class HeapBuffer {
public:
  explicit HeapBuffer(void* ptr) : ptr_(ptr) {}
  HeapBuffer(const HeapBuffer&) = delete;
  HeapBuffer& operator=(const HeapBuffer&) = delete;
  ~HeapBuffer() {
    if (ptr_) {
      mz_free(ptr_);
    }
  }

private:
  void* ptr_;
};

static std::string dirnameOf(const std::string& part) {
  auto pos = part.find_last_of('/');
  if (pos == std::string::npos) {
    return std::string();
  }
  return part.substr(0, pos);
}

} // namespace

Package::Package() = default;
Package::~Package() = default;
Package::Package(Package&&) noexcept = default;
Package& Package::operator=(Package&&) noexcept = default;

Package Package::open(const std::string& path) {
  std::string bytes = readBinaryFile(path);
  if (bytes.empty()) {
    throw PackageError("Cannot read package: " + path);
  }
  mz_zip_archive zip;
  std::memset(&zip, 0, sizeof(zip));
  if (!mz_zip_reader_init_mem(&zip, bytes.data(), bytes.size(), 0)) {
    throw PackageError("Not a zip package: " + path);
  }
  ZipReaderGuard guard(zip);
  Package pkg;
  const int count = static_cast<int>(mz_zip_reader_get_num_files(&zip));
  for (int i = 0; i < count; ++i) {
    mz_zip_archive_file_stat stat;
    if (!mz_zip_reader_file_stat(&zip, i, &stat)) {
      continue;
    }
    if (mz_zip_reader_is_file_a_directory(&zip, i)) {
      continue;
    }
    size_t out_size = 0;
    void* ptr = mz_zip_reader_extract_to_heap(&zip, i, &out_size, 0);
    if (ptr == nullptr && stat.m_uncomp_size != 0) {
      throw PackageError(std::string("Cannot extract '") + stat.m_filename + "' from " + path);
    }
    HeapBuffer extracted(ptr);
    std::string name = stat.m_filename;
    std::string data = ptr ? std::string(static_cast<const char*>(ptr), out_size) : std::string();
    if (pkg.data_.find(name) == pkg.data_.end()) {
      pkg.order_.push_back(name);
    }
    pkg.data_[name] = std::move(data);
  }
  return pkg;
}

bool Package::hasPart(const std::string& name) const {
  return data_.find(name) != data_.end();
}

std::string Package::partData(const std::string& name) const {
  auto xit = xml_.find(name);
  if (xit != xml_.end() && xit->second) {
    return serializeXml(*xit->second);
  }
  auto it = data_.find(name);
  if (it == data_.end()) {
    throw PackageError("Missing package part: " + name);
  }
  return it->second;
}

void Package::setPartData(const std::string& name, std::string data) {
  if (data_.find(name) == data_.end()) {
    order_.push_back(name);
  }
  data_[name] = std::move(data);
  xml_.erase(name);
}

tinyxml2::XMLDocument* Package::xmlPart(const std::string& name) {
  auto xit = xml_.find(name);
  if (xit != xml_.end()) {
    return xit->second.get();
  }
  auto it = data_.find(name);
  if (it == data_.end()) {
    return nullptr;
  }
  auto doc = std::make_unique<tinyxml2::XMLDocument>(true, tinyxml2::PRESERVE_WHITESPACE);
  std::string text = protectWhitespaceText(it->second);
  if (doc->Parse(text.c_str(), text.size()) != tinyxml2::XML_SUCCESS) {
    throw PackageError("Malformed XML in part '" + name + "': " + doc->ErrorStr());
  }
  auto* raw = doc.get();
  xml_.emplace(name, std::move(doc));
  return raw;
}

std::string Package::relationshipsPartFor(const std::string& source_part) {
  if (source_part.empty()) {
    return "_rels/.rels";
  }
  auto pos = source_part.find_last_of('/');
  if (pos == std::string::npos) {
    return "_rels/" + source_part + ".rels";
  }
  return source_part.substr(0, pos) + "/_rels/" + source_part.substr(pos + 1) + ".rels";
}

std::string Package::resolvePartName(const std::string& source_part, const std::string& target) {
  std::string joined;
  if (!target.empty() && target[0] == '/') {
    joined = target.substr(1);
  } else {
    std::string base = dirnameOf(source_part);
    joined = base.empty() ? target : base + "/" + target;
  }
  std::vector<std::string> parts;
  std::stringstream ss(joined);
  std::string seg;
  while (std::getline(ss, seg, '/')) {
    if (seg.empty() || seg == ".") {
      continue;
    }
    if (seg == "..") {
      if (!parts.empty()) {
        parts.pop_back();
      }
      continue;
    }
    parts.push_back(seg);
  }
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i != 0U) {
      out += "/";
    }
    out += parts[i];
  }
  return out;
}

std::vector<Relationship> Package::relationships(const std::string& source_part) {
  std::vector<Relationship> out;
  tinyxml2::XMLDocument* rels = xmlPart(relationshipsPartFor(source_part));
  if (rels == nullptr || rels->RootElement() == nullptr) {
    return out;
  }
  for (auto* el = rels->RootElement()->FirstChildElement("Relationship"); el;
       el = el->NextSiblingElement("Relationship")) {
    Relationship rel;
    rel.id = el->Attribute("Id") ? el->Attribute("Id") : "";
    rel.type = el->Attribute("Type") ? el->Attribute("Type") : "";
    std::string target = el->Attribute("Target") ? el->Attribute("Target") : "";
    const char* mode = el->Attribute("TargetMode");
    rel.external = mode != nullptr && std::string(mode) == "External";
    rel.target = rel.external ? target : resolvePartName(source_part, target);
    out.push_back(std::move(rel));
  }
  return out;
}

const Relationship* Package::findRelationship(const std::vector<Relationship>& rels,
                                              const std::string& type_suffix) const {
  for (const auto& rel : rels) {
    if (endsWith(rel.type, "/" + type_suffix)) {
      return &rel;
    }
  }
  return nullptr;
}

void Package::save(const std::string& path) const {
  mz_zip_archive zip;
  std::memset(&zip, 0, sizeof(zip));
  if (!mz_zip_writer_init_file(&zip, path.c_str(), 0)) {
    throw PackageError("Cannot create package: " + path);
  }
  ZipWriterGuard guard(zip);
  for (const auto& name : order_) {
    std::string data = partData(name);
    if (!mz_zip_writer_add_mem(&zip, name.c_str(), data.data(), data.size(), MZ_DEFAULT_COMPRESSION)) {
      throw PackageError("Cannot write part '" + name + "' to " + path);
    }
  }
  if (!mz_zip_writer_finalize_archive(&zip)) {
    throw PackageError("Cannot finalize package: " + path);
  }
}

} // namespace docfill
