#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace docfill {

// Base of every error raised by the rendering pipeline.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Bad configuration, missing required column, bad filename pattern or template name.
class ConfigurationError : public Error {
public:
  using Error::Error;
};

// Template file not found.
class ResolutionError : public Error {
public:
  using Error::Error;
};

class UnsupportedFormatError : public ResolutionError {
public:
  using ResolutionError::ResolutionError;
};

// External conversion engine failure. Carries the exit status and captured output.
class ConversionError : public Error {
public:
  explicit ConversionError(const std::string& message, int exit_code = 0, std::string output = std::string())
    : Error(message), exit_code_(exit_code), output_(std::move(output)) {}

  int exitCode() const { return exit_code_; }
  const std::string& output() const { return output_; }

private:
  int exit_code_ = 0;
  std::string output_;
};

// The engine reported success but the expected file is not there.
class MissingArtifactError : public ConversionError {
public:
  using ConversionError::ConversionError;
};

// Unreadable zip container or malformed XML part.
class PackageError : public Error {
public:
  using Error::Error;
};

} // namespace docfill
