#ifndef SCANNER_DOT_HPP
#define SCANNER_DOT_HPP

#include "Addr-error.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

#include <tao/pegtl.hpp>

// Cursor over the text of an address.  The readers built on it return
// std::nullopt on failure; a read wrapped in read_atomically() leaves the
// cursor where it found it when it fails.

class Scanner {
public:
  explicit Scanner(std::string_view input);

  Scanner(Scanner const&) = delete;
  Scanner& operator=(Scanner const&) = delete;

  bool             empty() const { return in_.empty(); }
  std::string_view remaining() const;

  template <typename Read>
  auto read_atomically(Read&& read) -> std::invoke_result_t<Read, Scanner&>
  {
    auto m      = in_.mark<tao::pegtl::rewind_mode::required>();
    auto result = std::forward<Read>(read)(*this);
    static_cast<void>(m(result.has_value()));
    return result;
  }

  // The whole input must be consumed.
  template <typename Read>
  auto parse_with(Read&& read, Addr::kind k)
      -> std::invoke_result_t<Read, Scanner&>
  {
    auto result = std::forward<Read>(read)(*this);
    if (result && empty())
      return result;
    log_failure_(k);
    return std::nullopt;
  }

  std::optional<char> peek_char() const;
  std::optional<char> read_char();

  bool read_given_char(char target);

  // The separator is expected only before the second and later items.
  template <typename Read>
  auto read_separator(char sep, std::size_t index, Read&& read)
      -> std::invoke_result_t<Read, Scanner&>
  {
    return read_atomically(
        [sep, index, &read](Scanner& s) -> std::invoke_result_t<Read, Scanner&> {
          if (index > 0 && !s.read_given_char(sep))
            return std::nullopt;
          return read(s);
        });
  }

  template <typename T>
  std::optional<T> read_number(unsigned                   radix,
                               std::optional<std::size_t> max_digits,
                               bool                       allow_zero_prefix);

private:
  void log_failure_(Addr::kind k) const;

  static std::optional<unsigned> digit_value_(char c, unsigned radix);

  std::string_view input_;

  tao::pegtl::memory_input<tao::pegtl::tracking_mode::lazy> in_;
};

template <typename T>
std::optional<T> Scanner::read_number(unsigned                   radix,
                                      std::optional<std::size_t> max_digits,
                                      bool allow_zero_prefix)
{
  static_assert(std::is_unsigned_v<T>);

  return read_atomically([=](Scanner& s) -> std::optional<T> {
    auto const has_leading_zero = s.peek_char() == '0';

    auto        value       = T{0};
    std::size_t digit_count = 0;
    for (;;) {
      auto const c = s.peek_char();
      if (!c)
        break;
      auto const digit = digit_value_(*c, radix);
      if (!digit)
        break;
      s.in_.bump(1);

      ++digit_count;
      if (max_digits && digit_count > *max_digits)
        return std::nullopt;

      // value * radix + digit must fit in T
      auto constexpr max = std::numeric_limits<T>::max();
      if (value > (max - *digit) / radix)
        return std::nullopt;
      value = static_cast<T>(value * radix + *digit);
    }

    if (digit_count == 0)
      return std::nullopt;

    if (!allow_zero_prefix && has_leading_zero && digit_count > 1)
      return std::nullopt;

    return value;
  });
}

#endif // SCANNER_DOT_HPP
