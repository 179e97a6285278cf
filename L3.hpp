#ifndef L3_DOT_HPP
#define L3_DOT_HPP

#include "DisplayBuffer.hpp"
#include "IP.hpp"
#include "SCION.hpp"

#include <compare>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/format.h>

class Scanner;

// Network layer address: plain IP, or SCION.

namespace L3 {

auto constexpr max_text_size{SCION::max_text_size};

class Address {
public:
  using variant_type = std::variant<IP::Address, SCION::Address>;

  Address() = default;
  Address(IP::Address const& addr)
    : addr_(addr)
  {
  }
  Address(SCION::Address const& addr)
    : addr_(addr)
  {
  }

  explicit Address(std::string_view addr);

  static bool validate(std::string_view addr, std::string& msg, Address& out);
  static std::optional<Address> parse(std::string_view addr);

  bool is_ip() const { return std::holds_alternative<IP::Address>(addr_); }
  bool is_scion() const
  {
    return std::holds_alternative<SCION::Address>(addr_);
  }

  IP::Address const* ip() const { return std::get_if<IP::Address>(&addr_); }
  SCION::Address const* scion() const
  {
    return std::get_if<SCION::Address>(&addr_);
  }

  variant_type const& get() const { return addr_; }

  template <typename OutputIt>
  OutputIt format_to(OutputIt out) const
  {
    return std::visit([out](auto const& a) { return a.format_to(out); },
                      addr_);
  }

  std::string to_string() const;

  bool operator==(Address const& rhs) const = default;
  auto operator<=>(Address const& rhs) const = default;

private:
  variant_type addr_;
};

auto read(Scanner& s) -> std::optional<Address>;

std::ostream& operator<<(std::ostream& os, Address const& addr);

} // namespace L3

template <>
struct fmt::formatter<L3::Address>
  : staged_formatter<L3::Address, L3::max_text_size> {
};

#endif // L3_DOT_HPP
