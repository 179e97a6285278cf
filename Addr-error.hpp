#ifndef ADDR_ERROR_DOT_HPP
#define ADDR_ERROR_DOT_HPP

#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Addr {

// Which grammar rejected the input.
enum class kind : uint8_t {
  l3,
  scion,
  ip,
  ipv4,
  ipv6,
  socket,
  socket_scion,
  socket_v4,
  socket_v6,
};

auto description(kind k) -> std::string_view;

// "invalid IPv4 address syntax «1.2.3»"
auto message(kind k, std::string_view input) -> std::string;

class parse_error : public std::invalid_argument {
public:
  parse_error(kind k, std::string_view input);

  kind which() const { return kind_; }

private:
  kind kind_;
};

inline std::ostream& operator<<(std::ostream& os, kind k)
{
  return os << description(k);
}

// Shared tail of every set_(): copy a successful parse into out, or
// report the failure as the caller asked.
template <typename T>
bool assign(std::optional<T> const& parsed,
            kind              k,
            std::string_view  input,
            bool              should_throw,
            std::string&      msg,
            T&                out)
{
  if (!parsed) {
    if (should_throw)
      throw parse_error(k, input);
    msg = message(k, input);
    return false;
  }
  out = *parsed;
  return true;
}

} // namespace Addr

#endif // ADDR_ERROR_DOT_HPP
