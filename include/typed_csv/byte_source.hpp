#pragma once
#include "typed_csv/error.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tc {

// Producer of already-decoded input bytes. Reads are positional; sources that
// cannot seek (streams) only accept non-decreasing offsets.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Appends up to `n` bytes starting at `offset` to `out`. Appending nothing
  // means end of input. Returns false on an I/O error (see last_error()).
  virtual bool read(std::uint64_t offset, std::size_t n, std::string& out) = 0;

  // Total size when known up front (files, buffers).
  virtual std::optional<std::uint64_t> size() const = 0;

  virtual std::string describe() const = 0;

  const std::string& last_error() const noexcept { return err_; }
  std::uint64_t bytes_read() const noexcept { return bytes_; }

protected:
  std::string err_;
  std::uint64_t bytes_{0};
};

// Local file. Fails with InputNotFound when `path` is missing or not a
// regular file (directories included).
std::unique_ptr<ByteSource> open_file_source(const std::string& path, ReadError& err);

// In-memory bytes; the view must outlive the source.
std::unique_ptr<ByteSource> make_buffer_source(std::string_view data);
std::unique_ptr<ByteSource> make_owned_buffer_source(std::string data);

// Forward-only stream (e.g. the output of an external decompressor).
std::unique_ptr<ByteSource> make_stream_source(std::istream& in);

}
