#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace fcsv {

// Readable, seekable byte source a stream pulls records from.
class Source {
public:
  virtual ~Source() = default;

  // Append everything up to and including the next `sep` (or the rest of the
  // data) to `out`. Returns false, leaving `out` untouched, when nothing is left.
  virtual bool gets(std::string_view sep, std::string& out) = 0;

  // Up to `n` bytes from the current position; shorter only at end of data.
  virtual std::string read(std::size_t n) = 0;

  virtual bool eof() = 0;
  virtual std::uint64_t tell() const = 0;
  virtual void seek(std::uint64_t pos) = 0;
};

// Writable byte sink a stream appends rendered records to.
class Sink {
public:
  virtual ~Sink() = default;
  virtual void write(std::string_view bytes) = 0;
  virtual void flush() {}
};

// In-memory source over an owned string.
class StringSource : public Source {
public:
  explicit StringSource(std::string data) : data_(std::move(data)) {}

  bool gets(std::string_view sep, std::string& out) override;
  std::string read(std::size_t n) override;
  bool eof() override { return pos_ >= data_.size(); }
  std::uint64_t tell() const override { return pos_; }
  void seek(std::uint64_t pos) override;

  const std::string& str() const noexcept { return data_; }

private:
  std::string data_;
  std::size_t pos_{0};
};

// In-memory sink; `str()` returns everything written so far.
class StringSink : public Sink {
public:
  StringSink() = default;

  void write(std::string_view bytes) override { data_.append(bytes); }
  const std::string& str() const noexcept { return data_; }
  std::string take() { return std::move(data_); }

private:
  std::string data_;
};

}
