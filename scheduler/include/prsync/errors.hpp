#pragma once

#include <stdexcept>
#include <string>

namespace prsync {

class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg) : std::runtime_error(msg) {}
};

// Bad flags, remote endpoints or missing tools. Raised before any transfer starts.
class ConfigurationError : public Error {
  public:
    explicit ConfigurationError(const std::string &msg) : Error(msg) {}
};

class EnumerationError : public Error {
  public:
    explicit EnumerationError(const std::string &msg) : Error(msg) {}
};

class MalformedListing : public EnumerationError {
  public:
    MalformedListing(std::size_t line_number, const std::string &line)
        : EnumerationError("malformed listing at line " + std::to_string(line_number) + ": '" + line + "'"),
          line_number_(line_number) {}

    std::size_t line_number() const noexcept { return line_number_; }

  private:
    std::size_t line_number_;
};

class ProcessError : public Error {
  public:
    explicit ProcessError(const std::string &msg) : Error(msg) {}
};

class TransferError : public Error {
  public:
    explicit TransferError(const std::string &msg) : Error(msg) {}
};

} // namespace prsync
