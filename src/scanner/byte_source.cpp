#include "typed_csv/byte_source.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <istream>
#include <sys/types.h>
#include <vector>

namespace tc {

namespace {

// 64-bit positioning; `long` is 32 bits on some targets.
int seek_to(std::FILE* f, std::uint64_t offset) {
#if defined(_WIN32)
  return _fseeki64(f, static_cast<__int64>(offset), SEEK_SET);
#else
  return fseeko(f, static_cast<off_t>(offset), SEEK_SET);
#endif
}

class FileSource final : public ByteSource {
public:
  FileSource(std::string path, std::FILE* f, std::uint64_t size)
    : path_(std::move(path)), f_(f), size_(size) {}
  ~FileSource() override { if (f_) std::fclose(f_); }

  bool read(std::uint64_t offset, std::size_t n, std::string& out) override {
    if (offset >= size_ || n == 0) return true;
    if (pos_ != offset) {
      if (seek_to(f_, offset) != 0) {
        err_ = path_ + ": seek failed: " + std::strerror(errno);
        return false;
      }
      pos_ = offset;
    }
    const std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(n, size_ - offset));
    const std::size_t old = out.size();
    out.resize(old + want);
    std::size_t got = std::fread(&out[old], 1, want, f_);
    if (got < want && std::ferror(f_)) {
      out.resize(old);
      err_ = path_ + ": read failed: " + std::strerror(errno);
      return false;
    }
    out.resize(old + got);
    pos_ += got;
    bytes_ += got;
    return true;
  }

  std::optional<std::uint64_t> size() const override { return size_; }
  std::string describe() const override { return path_; }

private:
  std::string path_;
  std::FILE* f_;
  std::uint64_t size_;
  std::uint64_t pos_{0};
};

class BufferSource final : public ByteSource {
public:
  explicit BufferSource(std::string_view data) : data_(data) {}
  explicit BufferSource(std::string owned) : owned_(std::move(owned)), data_(owned_) {}

  bool read(std::uint64_t offset, std::size_t n, std::string& out) override {
    if (offset >= data_.size()) return true;
    std::string_view piece = data_.substr(static_cast<std::size_t>(offset), n);
    out.append(piece.data(), piece.size());
    bytes_ += piece.size();
    return true;
  }

  std::optional<std::uint64_t> size() const override { return data_.size(); }
  std::string describe() const override { return "<buffer " + std::to_string(data_.size()) + " bytes>"; }

private:
  std::string owned_;
  std::string_view data_;
};

class StreamSource final : public ByteSource {
public:
  explicit StreamSource(std::istream& in) : in_(in) {}

  bool read(std::uint64_t offset, std::size_t n, std::string& out) override {
    if (offset < pos_) {
      err_ = "stream source cannot seek backwards";
      return false;
    }
    std::vector<char> buf(std::min<std::size_t>(n ? n : 1, 64 * 1024));
    while (pos_ < offset && in_) {               // discard up to offset
      auto step = static_cast<std::streamsize>(std::min<std::uint64_t>(buf.size(), offset - pos_));
      in_.read(buf.data(), step);
      pos_ += static_cast<std::uint64_t>(in_.gcount());
    }
    std::size_t left = n;
    while (left > 0 && in_) {
      auto step = static_cast<std::streamsize>(std::min(buf.size(), left));
      in_.read(buf.data(), step);
      auto got = static_cast<std::size_t>(in_.gcount());
      out.append(buf.data(), got);
      pos_ += got;
      bytes_ += got;
      left -= got;
    }
    if (in_.bad()) {
      err_ = "stream read failed";
      return false;
    }
    return true;
  }

  std::optional<std::uint64_t> size() const override { return std::nullopt; }
  std::string describe() const override { return "<stream>"; }

private:
  std::istream& in_;
  std::uint64_t pos_{0};
};

}

std::unique_ptr<ByteSource> open_file_source(const std::string& path, ReadError& err) {
  namespace fs = std::filesystem;
  std::error_code ec;
  auto st = fs::status(path, ec);
  if (ec || !fs::exists(st)) {
    err = ReadError::make(ErrorKind::InputNotFound, "no such file: " + path);
    return nullptr;
  }
  if (!fs::is_regular_file(st)) {
    err = ReadError::make(ErrorKind::InputNotFound, "not a regular file: " + path);
    return nullptr;
  }
  std::uint64_t size = fs::file_size(path, ec);
  if (ec) {
    err = ReadError::make(ErrorKind::IoError, path + ": " + ec.message());
    return nullptr;
  }
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) {
    err = ReadError::make(ErrorKind::IoError, path + ": " + std::strerror(errno));
    return nullptr;
  }
  return std::make_unique<FileSource>(path, f, size);
}

std::unique_ptr<ByteSource> make_buffer_source(std::string_view data) {
  return std::make_unique<BufferSource>(data);
}

std::unique_ptr<ByteSource> make_owned_buffer_source(std::string data) {
  return std::make_unique<BufferSource>(std::move(data));
}

std::unique_ptr<ByteSource> make_stream_source(std::istream& in) {
  return std::make_unique<StreamSource>(in);
}

}
