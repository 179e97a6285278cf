#ifndef IP6_DOT_HPP
#define IP6_DOT_HPP

#include "DisplayBuffer.hpp"
#include "IP4.hpp"

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
using namespace std::literals::string_view_literals;

// "ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff"
auto constexpr max_text_size{std::size_t(39)};

// Bracketed form, as used in socket and SCION addresses.
auto constexpr lit_pfx{"["sv};
auto constexpr lit_pfx_sz{std::size(lit_pfx)};

auto constexpr lit_sfx{"]"sv};
auto constexpr lit_sfx_sz{std::size(lit_sfx)};

auto constexpr lit_extra_sz{lit_pfx_sz + lit_sfx_sz};

auto constexpr loopback_literal{"[::1]"};

// RFC 7346 section 2
enum class Multicast_scope : uint8_t {
  interface_local    = 1,
  link_local         = 2,
  realm_local        = 3,
  admin_local        = 4,
  site_local         = 5,
  organization_local = 8,
  global             = 14,
};

class Address {
public:
  using bytes_type    = std::array<uint8_t, 16>;
  using segments_type = std::array<uint16_t, 8>;

  constexpr Address() = default;
  constexpr explicit Address(bytes_type const& octets)
    : octets_(octets)
  {
  }
  constexpr explicit Address(segments_type const& segments)
  {
    for (std::size_t i = 0; i < segments.size(); ++i) {
      octets_[2 * i]     = uint8_t(segments[i] >> 8);
      octets_[2 * i + 1] = uint8_t(segments[i]);
    }
  }
  constexpr Address(uint16_t a,
                    uint16_t b,
                    uint16_t c,
                    uint16_t d,
                    uint16_t e,
                    uint16_t f,
                    uint16_t g,
                    uint16_t h)
    : Address(segments_type{a, b, c, d, e, f, g, h})
  {
  }

  explicit Address(std::string_view addr);

  static bool validate(std::string_view addr, std::string& msg, Address& out);
  static std::optional<Address> parse(std::string_view addr);

  static constexpr Address unspecified() { return Address{}; }
  static constexpr Address localhost()
  {
    return Address{0, 0, 0, 0, 0, 0, 0, 1};
  }

  constexpr bytes_type const& octets() const { return octets_; }
  constexpr segments_type     segments() const
  {
    segments_type segs{};
    for (std::size_t i = 0; i < segs.size(); ++i)
      segs[i] = uint16_t((octets_[2 * i] << 8) | octets_[2 * i + 1]);
    return segs;
  }

  bool is_unspecified() const;
  bool is_loopback() const;
  bool is_unique_local() const;
  bool is_unicast_link_local() const;
  bool is_documentation() const;
  bool is_benchmarking() const;
  bool is_multicast() const;
  bool is_unicast() const;
  bool is_unicast_global() const;
  bool is_global() const;

  std::optional<Multicast_scope> multicast_scope() const;

  // ::ffff:a.b.c.d only
  std::optional<IP4::Address> to_ipv4_mapped() const;
  // ::ffff:a.b.c.d or the deprecated ::a.b.c.d
  std::optional<IP4::Address> to_ipv4() const;

  template <typename OutputIt>
  OutputIt format_to(OutputIt out) const;

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
Address operator~(Address addr);

auto read(Scanner& s) -> std::optional<Address>;

auto is_address(std::string_view addr) -> bool;
auto is_address_literal(std::string_view addr) -> bool;
auto to_address_literal(Address const& addr) -> std::string;

constexpr auto as_address(std::string_view address_literal) -> std::string_view
{
  return address_literal.substr(lit_pfx_sz,
                                address_literal.length() - lit_extra_sz);
}

std::ostream& operator<<(std::ostream& os, Address const& addr);

// RFC 5952 section 4: the first longest run of two or more zero segments
// becomes "::", hex digits are lower case, and an IPv4-mapped address
// keeps its dotted quad.
template <typename OutputIt>
OutputIt Address::format_to(OutputIt out) const
{
  if (auto const v4 = to_ipv4_mapped(); v4) {
    out = fmt::format_to(out, "::ffff:");
    return v4->format_to(out);
  }

  auto const segs = segments();

  std::size_t zero_start = 0;
  std::size_t zero_len   = 0;
  for (std::size_t i = 0; i < segs.size();) {
    if (segs[i] != 0) {
      ++i;
      continue;
    }
    auto j = i;
    while (j < segs.size() && segs[j] == 0)
      ++j;
    if (j - i > zero_len) {
      zero_start = i;
      zero_len   = j - i;
    }
    i = j;
  }

  auto write_segments = [&out, &segs](std::size_t from, std::size_t to) {
    for (auto i = from; i < to; ++i) {
      if (i != from)
        *out++ = ':';
      out = fmt::format_to(out, "{:x}", segs[i]);
    }
  };

  if (zero_len > 1) {
    write_segments(0, zero_start);
    out = fmt::format_to(out, "::");
    write_segments(zero_start + zero_len, segs.size());
  }
  else {
    write_segments(0, segs.size());
  }
  return out;
}

} // namespace IP6

template <>
struct fmt::formatter<IP6::Address>
  : staged_formatter<IP6::Address, IP6::max_text_size> {
};

namespace std {
template <>
struct hash<IP6::Address> {
  std::size_t operator()(IP6::Address const& k) const
  {
    auto const& o = k.octets();
    return hash<std::string_view>()(
        std::string_view(reinterpret_cast<char const*>(o.data()), o.size()));
  }
};
} // namespace std

#endif // IP6_DOT_HPP
