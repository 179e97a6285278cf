#ifndef SCION_DOT_HPP
#define SCION_DOT_HPP

#include "DisplayBuffer.hpp"
#include "IA.hpp"
#include "IP.hpp"

#include <compare>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

class Scanner;

namespace SCION {

// "65535-ffff:ffff:ffff,[ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff]"
auto constexpr max_text_size{IA::max_text_size + 1 + IP6::max_text_size +
                             IP6::lit_extra_sz};

// A host in an isolation domain and autonomous system.

class Address {
public:
  Address() = default;
  Address(IA::ia_t ia, IP::Address const& host);
  Address(IA::isd_t isd, IA::as_t as, IP::Address const& host);

  explicit Address(std::string_view addr);

  static bool validate(std::string_view addr, std::string& msg, Address& out);
  static std::optional<Address> parse(std::string_view addr);

  IA::ia_t  ia() const { return ia_; }
  IA::isd_t isd() const { return IA::isd_from_ia(ia_); }
  IA::as_t  as() const { return IA::as_from_ia(ia_); }

  IP::Address const& host() const { return host_; }

  void set_ia(IA::ia_t ia) { ia_ = ia; }
  void set_isd(IA::isd_t isd);
  void set_as(IA::as_t as);
  void set_host(IP::Address const& host) { host_ = host; }

  template <typename OutputIt>
  OutputIt format_to(OutputIt out) const
  {
    out = fmt::format_to(out, "{}-{},", isd(), IA::as_to_string(as()));
    if (auto const v6 = host_.ipv6(); v6) {
      out = fmt::format_to(out, "{}", IP6::lit_pfx);
      out = v6->format_to(out);
      return fmt::format_to(out, "{}", IP6::lit_sfx);
    }
    return host_.format_to(out);
  }

  std::string to_string() const;

  bool operator==(Address const& rhs) const = default;
  auto operator<=>(Address const& rhs) const = default;

private:
  IA::ia_t    ia_{0};
  IP::Address host_;
};

auto read(Scanner& s) -> std::optional<Address>;

auto is_address(std::string_view addr) -> bool;

std::ostream& operator<<(std::ostream& os, Address const& addr);

} // namespace SCION

template <>
struct fmt::formatter<SCION::Address>
  : staged_formatter<SCION::Address, SCION::max_text_size> {
};

namespace std {
template <>
struct hash<SCION::Address> {
  std::size_t operator()(SCION::Address const& k) const
  {
    return hash<IA::ia_t>()(k.ia()) ^ (hash<IP::Address>()(k.host()) << 1);
  }
};
} // namespace std

#endif // SCION_DOT_HPP
