#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

#include "fastcsv/source.hpp"

namespace fcsv {

// Chunk-buffered file source. Data read ahead stays in the buffer until
// consumed, so seeking back inside it works even on pipes (stdin).
class FileSource : public Source {
public:
  struct Config {
    std::size_t chunk_bytes = 512 * 1024; // 512 KiB per fread
  };

  explicit FileSource(const std::string& path);      // uses default Config{}
  FileSource(const std::string& path, Config cfg);   // explicit Config
  FileSource(std::FILE* f, Config cfg);              // borrowed handle, not closed
  ~FileSource() override;

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  bool gets(std::string_view sep, std::string& out) override;
  std::string read(std::size_t n) override;
  bool eof() override;
  std::uint64_t tell() const override;
  void seek(std::uint64_t pos) override;

  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

// FILE*-backed sink. Opens with "wb" (or "ab" when appending).
class FileSink : public Sink {
public:
  explicit FileSink(const std::string& path, bool append = false);
  explicit FileSink(std::FILE* f);                   // borrowed handle, not closed
  ~FileSink() override;

  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  void write(std::string_view bytes) override;
  void flush() override;

  std::uint64_t bytes_written() const noexcept { return bytes_; }

private:
  std::FILE* f_{nullptr};
  bool owned_{false};
  std::uint64_t bytes_{0};
};

}
