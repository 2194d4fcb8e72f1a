#pragma once

#include <string>
#include <vector>

namespace docfill {

struct CommandResult {
  int exit_code = -1;
  std::string output; // stdout and stderr, interleaved
};

// Quotes an argument for /bin/sh.
std::string shellQuote(const std::string& arg);

// Runs argv through the shell and captures its output. Throws Error when the
// process cannot be started.
CommandResult runCommand(const std::vector<std::string>& argv);

// External format transcoder.
class ConversionEngine {
public:
  virtual ~ConversionEngine() = default;

  // Converts input into output_dir and returns the produced file path.
  // target_format is the file extension of the result ("docx", "pdf");
  // format_options are appended to the engine's filter spec when non-empty.
  // Throws ConversionError on engine failure and MissingArtifactError when the
  // expected file was not produced.
  virtual std::string convert(const std::string& input, const std::string& output_dir,
                              const std::string& target_format, const std::string& format_options) = 0;
};

// soffice --headless --convert-to <fmt[:opts]> --outdir <dir> <file>
class LibreOfficeEngine : public ConversionEngine {
public:
  explicit LibreOfficeEngine(std::string soffice_bin);

  std::string convert(const std::string& input, const std::string& output_dir, const std::string& target_format,
                      const std::string& format_options) override;

  // Runs "<soffice> --version". Returns false when the binary is not usable.
  bool probe(std::string* version) const;

  const std::string& binary() const { return soffice_bin_; }

private:
  std::string soffice_bin_;
};

} // namespace docfill
