#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace tc {

// One tokenized row. Field views point into the tokenizer's input buffer or
// its row arena and are only valid until the next row is pulled.
// Fields are already trimmed (outside quotes) and unquoted.
class RowView {
public:
  std::size_t size() const noexcept { return fields_.size(); }

  std::string_view at(std::size_t i) const {
    return i < fields_.size() ? fields_[i] : std::string_view{};
  }
  bool quoted(std::size_t i) const {
    return i < quoted_.size() && quoted_[i] != 0;
  }

  // Byte offset of the row's first byte, relative to the window start.
  std::size_t offset() const noexcept { return offset_; }
  // 1-based physical line of the row's first byte within the window.
  std::size_t line() const noexcept { return line_; }

  const std::vector<std::string_view>& fields() const noexcept { return fields_; }

  // Filled by the tokenizer.
  void reset(std::size_t offset, std::size_t line) {
    fields_.clear();
    quoted_.clear();
    offset_ = offset;
    line_ = line;
  }
  void push(std::string_view f, bool q) { fields_.push_back(f); quoted_.push_back(q ? 1 : 0); }

private:
  std::vector<std::string_view> fields_;
  std::vector<std::uint8_t> quoted_;
  std::size_t offset_{0};
  std::size_t line_{0};
};

}
