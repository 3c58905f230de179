#include "fastcsv/file_source.hpp"
#include "fastcsv/errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string_view>
#include <vector>

namespace fcsv {

static std::string errno_text(const char* what, const std::string& path) {
  std::string s = what;
  if (!path.empty()) s += " '" + path + "'";
  s += ": ";
  s += std::strerror(errno);
  return s;
}

struct FileSource::Impl {
  std::FILE* f{nullptr};
  bool owned{false};
  Config cfg;
  std::vector<char> buf;
  std::size_t head{0};      // next unread byte in buf
  std::size_t tail{0};      // end of valid data in buf
  std::uint64_t base{0};    // file offset of buf[0]
  bool eof_hit{false};
  std::uint64_t bytes{0};

  // Pull one more chunk. Consumed bytes are dropped only when `compact` is
  // set and a full chunk of them has piled up. Only gets() compacts, so bytes
  // taken by read()/eof() (separator discovery) can always be seeked back over.
  bool fill(bool compact) {
    if (eof_hit) return false;
    if (compact && head >= cfg.chunk_bytes) {
      std::memmove(buf.data(), buf.data() + head, tail - head);
      base += head;
      tail -= head;
      head = 0;
    }
    if (buf.size() - tail < cfg.chunk_bytes) buf.resize(tail + cfg.chunk_bytes);

    std::size_t n = std::fread(buf.data() + tail, 1, cfg.chunk_bytes, f);
    if (n == 0) {
      if (std::ferror(f)) throw SourceError(errno_text("read failed", {}));
      eof_hit = true;
      return false;
    }
    tail += n;
    bytes += n;
    return true;
  }

  bool gets(std::string_view sep, std::string& out) {
    std::size_t scan_off = 0; // relative to head
    while (true) {
      std::string_view win(buf.data() + head, tail - head);
      std::size_t hit = sep.empty() ? std::string_view::npos : win.find(sep, scan_off);
      if (hit != std::string_view::npos) {
        out.append(win.data(), hit + sep.size());
        head += hit + sep.size();
        return true;
      }

      // a separator may straddle the refill boundary
      const std::size_t keep = sep.size() > 1 ? sep.size() - 1 : 0;
      scan_off = win.size() > keep ? win.size() - keep : 0;

      if (!fill(true)) {
        if (head == tail) return false;
        out.append(buf.data() + head, tail - head);
        head = tail;
        return true;
      }
    }
  }
};

FileSource::FileSource(const std::string& path)
  : FileSource(path, Config{}) {}

FileSource::FileSource(const std::string& path, Config cfg)
  : p_(new Impl{}) {
  p_->cfg = cfg;
  if (p_->cfg.chunk_bytes == 0) p_->cfg.chunk_bytes = 1;
  p_->f = std::fopen(path.c_str(), "rb");
  if (!p_->f) {
    std::string msg = errno_text("cannot open", path);
    delete p_;
    throw SourceError(msg);
  }
  p_->owned = true;
}

FileSource::FileSource(std::FILE* f, Config cfg)
  : p_(new Impl{}) {
  p_->f = f;
  p_->cfg = cfg;
  if (p_->cfg.chunk_bytes == 0) p_->cfg.chunk_bytes = 1;
}

FileSource::~FileSource() {
  if (p_->owned && p_->f) std::fclose(p_->f);
  delete p_;
}

bool FileSource::gets(std::string_view sep, std::string& out) { return p_->gets(sep, out); }

std::string FileSource::read(std::size_t n) {
  while (p_->tail - p_->head < n && p_->fill(false)) {}
  std::size_t take = std::min(n, p_->tail - p_->head);
  std::string out(p_->buf.data() + p_->head, take);
  p_->head += take;
  return out;
}

bool FileSource::eof() { return p_->head == p_->tail && !p_->fill(false); }

std::uint64_t FileSource::tell() const { return p_->base + p_->head; }

void FileSource::seek(std::uint64_t pos) {
  if (pos >= p_->base && pos <= p_->base + p_->tail) {
    p_->head = static_cast<std::size_t>(pos - p_->base);
    return;
  }
  if (std::fseek(p_->f, static_cast<long>(pos), SEEK_SET) != 0)
    throw SourceError(errno_text("seek failed", {}));
  std::clearerr(p_->f);
  p_->base = pos;
  p_->head = p_->tail = 0;
  p_->eof_hit = false;
}

std::uint64_t FileSource::bytes_read() const noexcept { return p_->bytes; }

// ---- sink -----------------------------------------------------------------

FileSink::FileSink(const std::string& path, bool append)
  : f_(std::fopen(path.c_str(), append ? "ab" : "wb")), owned_(true) {
  if (!f_) throw SourceError(errno_text("cannot open", path));
}

FileSink::FileSink(std::FILE* f) : f_(f), owned_(false) {}

FileSink::~FileSink() {
  if (!f_) return;
  if (owned_) std::fclose(f_);
  else std::fflush(f_);
}

void FileSink::write(std::string_view bytes) {
  if (bytes.empty()) return;
  std::size_t n = std::fwrite(bytes.data(), 1, bytes.size(), f_);
  bytes_ += n;
  if (n != bytes.size()) throw SourceError(errno_text("write failed", {}));
}

void FileSink::flush() {
  if (std::fflush(f_) != 0) throw SourceError(errno_text("flush failed", {}));
}

}
