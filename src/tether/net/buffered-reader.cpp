
#include "stdinc.hpp"

#include "buffered-reader.hpp"

#include "tether/utils/error-codes.hpp"

namespace tether::net {

BufferedReader::BufferedReader(Connection& connection, std::size_t capacity)
    : connection_{connection} {
  buffer_.resize(capacity == 0 ? 1 : capacity);
}

std::error_code BufferedReader::fill_() {
  Expects(is_empty());
  begin_ = end_ = 0;
  std::error_code ec;
  const auto n = connection_.read_some(std::span<std::byte>{buffer_.data(), buffer_.size()}, ec);
  end_ = n;
  if (n > 0)
    return {};
  return ec ? ec : make_error_code(ecode::end_of_stream);
}

std::error_code BufferedReader::read(std::span<std::byte> out) {
  std::size_t offset = 0;
  while (offset < out.size()) {
    if (is_empty()) {
      if (auto ec = fill_()) {
        return (offset > 0 && ec == ecode::end_of_stream) ? make_error_code(ecode::premature_eof)
                                                          : ec;
      }
    }
    const auto n = std::min(out.size() - offset, end_ - begin_);
    std::memcpy(out.data() + offset, buffer_.data() + begin_, n);
    begin_ += n;
    offset += n;
  }
  return {};
}

std::error_code BufferedReader::read_string(std::size_t size, std::string& out) {
  const auto offset = out.size();
  out.resize(offset + size);
  auto ec = read(std::as_writable_bytes(std::span<char>{out.data() + offset, size}));
  if (ec)
    out.resize(offset);
  return ec;
}

std::error_code BufferedReader::skip(std::size_t size) {
  while (size > 0) {
    if (is_empty()) {
      if (auto ec = fill_())
        return (ec == ecode::end_of_stream) ? make_error_code(ecode::premature_eof) : ec;
    }
    const auto n = std::min(size, end_ - begin_);
    begin_ += n;
    size -= n;
  }
  return {};
}

} // namespace tether::net
