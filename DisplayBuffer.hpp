#ifndef DISPLAY_BUFFER_DOT_HPP
#define DISPLAY_BUFFER_DOT_HPP

#include <cstddef>
#include <string_view>

#include <glog/logging.h>

#include <fmt/format.h>

// Fixed capacity staging area for the canonical text of one address, so
// the formatter can apply width, fill and alignment to the whole thing.
// N is the longest text the type can produce; anything longer is a bug.

template <std::size_t N>
class DisplayBuffer {
public:
  auto out() { return fmt::appender(buf_); }

  std::string_view view() const
  {
    CHECK_LE(buf_.size(), N) << "display buffer overflow: «"
                             << std::string_view(buf_.data(), buf_.size())
                             << "»";
    return std::string_view(buf_.data(), buf_.size());
  }

  static constexpr std::size_t capacity() { return N; }

private:
  fmt::basic_memory_buffer<char, N> buf_;
};

// The formatter for every address type: stage the canonical text, then let
// the string_view formatter pad and truncate it.
template <typename T, std::size_t N>
struct staged_formatter : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(T const& value, FormatContext& ctx) const -> decltype(ctx.out())
  {
    DisplayBuffer<N> buf;
    value.format_to(buf.out());
    return fmt::formatter<std::string_view>::format(buf.view(), ctx);
  }
};

#endif // DISPLAY_BUFFER_DOT_HPP
