#ifndef IP4_DOT_HPP
#define IP4_DOT_HPP

#include "DisplayBuffer.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

class Scanner;

namespace IP6 {
class Address;
}

namespace IP4 {

// "255.255.255.255"
auto constexpr max_text_size{std::size_t(15)};

class Address {
public:
  using bytes_type = std::array<uint8_t, 4>;

  constexpr Address() = default;
  constexpr Address(uint8_t a, uint8_t b, uint8_t c, uint8_t d)
    : octets_{a, b, c, d}
  {
  }
  constexpr explicit Address(bytes_type const& octets)
    : octets_(octets)
  {
  }

  explicit Address(std::string_view addr);

  static bool validate(std::string_view addr, std::string& msg, Address& out);
  static std::optional<Address> parse(std::string_view addr);

  static constexpr Address unspecified() { return Address{0, 0, 0, 0}; }
  static constexpr Address localhost() { return Address{127, 0, 0, 1}; }
  static constexpr Address broadcast() { return Address{255, 255, 255, 255}; }

  static constexpr Address from_bits(uint32_t bits)
  {
    return Address{uint8_t(bits >> 24), uint8_t(bits >> 16),
                   uint8_t(bits >> 8), uint8_t(bits)};
  }
  constexpr uint32_t to_bits() const
  {
    return (uint32_t(octets_[0]) << 24) | (uint32_t(octets_[1]) << 16) |
           (uint32_t(octets_[2]) << 8) | uint32_t(octets_[3]);
  }

  constexpr bytes_type const& octets() const { return octets_; }

  bool is_unspecified() const;
  bool is_loopback() const;
  bool is_private() const;
  bool is_link_local() const;
  bool is_shared() const;
  bool is_benchmarking() const;
  bool is_reserved() const;
  bool is_multicast() const;
  bool is_broadcast() const;
  bool is_documentation() const;
  bool is_global() const;

  IP6::Address to_ipv6_compatible() const;
  IP6::Address to_ipv6_mapped() const;

  template <typename OutputIt>
  OutputIt format_to(OutputIt out) const
  {
    return fmt::format_to(out, "{}.{}.{}.{}", octets_[0], octets_[1],
                          octets_[2], octets_[3]);
  }

  std::string to_string() const;

  constexpr bool operator==(Address const& rhs) const = default;
  constexpr auto operator<=>(Address const& rhs) const = default;

  Address& operator&=(Address const& rhs);
  Address& operator|=(Address const& rhs);

private:
  bytes_type octets_{};
};

Address operator&(Address lhs, Address const& rhs);
Address operator|(Address lhs, Address const& rhs);
Address operator~(Address const& addr);

auto read(Scanner& s) -> std::optional<Address>;

auto is_address(std::string_view addr) -> bool;

std::ostream& operator<<(std::ostream& os, Address const& addr);

} // namespace IP4

template <>
struct fmt::formatter<IP4::Address>
  : staged_formatter<IP4::Address, IP4::max_text_size> {
};

namespace std {
template <>
struct hash<IP4::Address> {
  std::size_t operator()(IP4::Address const& k) const
  {
    return hash<uint32_t>()(k.to_bits());
  }
};
} // namespace std

#endif // IP4_DOT_HPP
