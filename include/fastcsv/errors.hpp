#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace fcsv {

// Illegal CSV formatting found while reading a record.
class MalformedCsvError : public std::runtime_error {
public:
  MalformedCsvError(const std::string& what, std::uint64_t line)
    : std::runtime_error(what + " (line " + std::to_string(line) + ")"), line_(line) {}

  std::uint64_t line() const noexcept { return line_; }

private:
  std::uint64_t line_;
};

// Bad construction options: unknown keys, unknown converter names, bad values.
class ConfigError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Failure of the byte source or sink underneath a stream.
class SourceError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

}
