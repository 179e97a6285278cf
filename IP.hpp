#ifndef IP_DOT_HPP
#define IP_DOT_HPP

#include "DisplayBuffer.hpp"
#include "IP4.hpp"
#include "IP6.hpp"

#include <compare>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/format.h>

class Scanner;

namespace IP {

auto constexpr max_text_size{IP6::max_text_size};

// Either family.  Every IPv4 address orders before every IPv6 address.

class Address {
public:
  using variant_type = std::variant<IP4::Address, IP6::Address>;

  Address() = default;
  Address(IP4::Address const& addr)
    : addr_(addr)
  {
  }
  Address(IP6::Address const& addr)
    : addr_(addr)
  {
  }

  explicit Address(std::string_view addr);

  static bool validate(std::string_view addr, std::string& msg, Address& out);
  static std::optional<Address> parse(std::string_view addr);

  bool is_ipv4() const { return std::holds_alternative<IP4::Address>(addr_); }
  bool is_ipv6() const { return std::holds_alternative<IP6::Address>(addr_); }

  IP4::Address const* ipv4() const { return std::get_if<IP4::Address>(&addr_); }
  IP6::Address const* ipv6() const { return std::get_if<IP6::Address>(&addr_); }

  variant_type const& get() const { return addr_; }

  bool is_unspecified() const;
  bool is_loopback() const;
  bool is_global() const;
  bool is_multicast() const;
  bool is_documentation() const;
  bool is_benchmarking() const;

  // An IPv4-mapped IPv6 address becomes the IPv4 address.
  Address to_canonical() const;

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

auto is_address(std::string_view addr) -> bool;

std::ostream& operator<<(std::ostream& os, Address const& addr);

} // namespace IP

template <>
struct fmt::formatter<IP::Address>
  : staged_formatter<IP::Address, IP::max_text_size> {
};

namespace std {
template <>
struct hash<IP::Address> {
  std::size_t operator()(IP::Address const& k) const
  {
    return hash<IP::Address::variant_type>()(k.get());
  }
};
} // namespace std

#endif // IP_DOT_HPP
