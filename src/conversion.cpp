/// Subprocess plumbing and the LibreOffice conversion engine.

#include "docfill/conversion.hpp"

#include <sys/wait.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>

#include <spdlog/spdlog.h>

#include "docfill/error.hpp"
#include "docfill_internal.hpp"

namespace fs = std::filesystem;

namespace docfill {

namespace {

// Diagnostics carried in exceptions are capped; soffice can be chatty.
constexpr size_t cMaxDiagnosticOutput = 4000;

static std::string tailOf(const std::string& s) {
  if (s.size() <= cMaxDiagnosticOutput) {
    return s;
  }
  return s.substr(s.size() - cMaxDiagnosticOutput);
}

} // namespace

std::string shellQuote(const std::string& arg) {
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out += "'";
  return out;
}

CommandResult runCommand(const std::vector<std::string>& argv) {
  std::string cmd;
  for (const auto& arg : argv) {
    if (!cmd.empty()) {
      cmd.push_back(' ');
    }
    cmd += shellQuote(arg);
  }
  cmd += " 2>&1";
  spdlog::debug("Executing: {}", cmd);
  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    throw Error("Failed to execute command: " + cmd + " (" + std::strerror(errno) + ")");
  }
  CommandResult result;
  char buffer[4096];
  size_t bytes_read = 0;
  while ((bytes_read = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
    result.output.append(buffer, bytes_read);
  }
  int status = pclose(pipe);
  if (status == -1) {
    throw Error("pclose failed for command: " + cmd + " (" + std::strerror(errno) + ")");
  }
  // pclose returns the status in wait() format
  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  spdlog::debug("Command exited with code {}", result.exit_code);
  return result;
}

LibreOfficeEngine::LibreOfficeEngine(std::string soffice_bin)
  : soffice_bin_(soffice_bin.empty() ? std::string("soffice") : std::move(soffice_bin)) {}

std::string LibreOfficeEngine::convert(const std::string& input, const std::string& output_dir,
                                       const std::string& target_format, const std::string& format_options) {
  std::string conv = format_options.empty() ? target_format : target_format + ":" + format_options;
  // Argument order matters: --convert-to, then --outdir, then the file.
  CommandResult res =
    runCommand({soffice_bin_, "--headless", "--convert-to", conv, "--outdir", output_dir, input});
  if (res.exit_code != 0) {
    throw ConversionError("LibreOffice exited with code " + std::to_string(res.exit_code) + " converting " + input +
                            ": " + tailOf(trimCopy(res.output)),
                          res.exit_code, res.output);
  }
  std::string ext = target_format.substr(0, target_format.find(':'));
  fs::path produced = fs::path(output_dir) / (stemOf(input) + "." + ext);
  std::error_code ec;
  if (!fs::exists(produced, ec)) {
    throw MissingArtifactError("LibreOffice did not produce " + produced.string() + ": " + tailOf(trimCopy(res.output)),
                               res.exit_code, res.output);
  }
  return produced.string();
}

bool LibreOfficeEngine::probe(std::string* version) const {
  CommandResult res;
  try {
    res = runCommand({soffice_bin_, "--version"});
  } catch (const Error& e) {
    if (version) {
      *version = e.what();
    }
    return false;
  }
  if (version) {
    *version = trimCopy(res.output);
  }
  return res.exit_code == 0;
}

} // namespace docfill
