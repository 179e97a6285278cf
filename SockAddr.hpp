#ifndef SOCKADDR_DOT_HPP
#define SOCKADDR_DOT_HPP

#include "DisplayBuffer.hpp"
#include "IA.hpp"
#include "IP.hpp"
#include "IP4.hpp"
#include "IP6.hpp"
#include "L3.hpp"
#include "SCION.hpp"

#include <compare>
#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/format.h>

class Scanner;

// Transport endpoints: an address and a port.

namespace SockAddr {

// ":65535"
auto constexpr port_text_size{std::size_t(6)};

auto constexpr v4_max_text_size{IP4::max_text_size + port_text_size};

// "[" addr "%4294967295" "]" ":65535"
auto constexpr v6_max_text_size{IP6::lit_extra_sz + IP6::max_text_size + 11 +
                                port_text_size};

auto constexpr scion_max_text_size{SCION::max_text_size + port_text_size};

auto constexpr max_text_size{scion_max_text_size};

class V4 {
public:
  V4() = default;
  V4(IP4::Address const& ip, uint16_t port)
    : ip_(ip)
    , port_(port)
  {
  }

  explicit V4(std::string_view addr);

  static bool validate(std::string_view addr, std::string& msg, V4& out);
  static std::optional<V4> parse(std::string_view addr);

  IP4::Address const& ip() const { return ip_; }
  uint16_t            port() const { return port_; }

  void set_ip(IP4::Address const& ip) { ip_ = ip; }
  void set_port(uint16_t port) { port_ = port; }

  template <typename OutputIt>
  OutputIt format_to(OutputIt out) const
  {
    out = ip_.format_to(out);
    return fmt::format_to(out, ":{}", port_);
  }

  std::string to_string() const;

  bool operator==(V4 const& rhs) const = default;
  auto operator<=>(V4 const& rhs) const = default;

private:
  IP4::Address ip_;
  uint16_t     port_{0};
};

// Flow info and scope id follow sockaddr_in6.  Only the scope id has a
// text form.

class V6 {
public:
  V6() = default;
  V6(IP6::Address const& ip,
     uint16_t            port,
     uint32_t            flowinfo = 0,
     uint32_t            scope_id = 0)
    : ip_(ip)
    , port_(port)
    , flowinfo_(flowinfo)
    , scope_id_(scope_id)
  {
  }

  explicit V6(std::string_view addr);

  static bool validate(std::string_view addr, std::string& msg, V6& out);
  static std::optional<V6> parse(std::string_view addr);

  IP6::Address const& ip() const { return ip_; }
  uint16_t            port() const { return port_; }
  uint32_t            flowinfo() const { return flowinfo_; }
  uint32_t            scope_id() const { return scope_id_; }

  void set_ip(IP6::Address const& ip) { ip_ = ip; }
  void set_port(uint16_t port) { port_ = port; }
  void set_flowinfo(uint32_t flowinfo) { flowinfo_ = flowinfo; }
  void set_scope_id(uint32_t scope_id) { scope_id_ = scope_id; }

  template <typename OutputIt>
  OutputIt format_to(OutputIt out) const
  {
    out = fmt::format_to(out, "{}", IP6::lit_pfx);
    out = ip_.format_to(out);
    if (scope_id_ != 0)
      out = fmt::format_to(out, "%{}", scope_id_);
    return fmt::format_to(out, "{}:{}", IP6::lit_sfx, port_);
  }

  std::string to_string() const;

  bool operator==(V6 const& rhs) const = default;
  auto operator<=>(V6 const& rhs) const = default;

private:
  IP6::Address ip_;
  uint16_t     port_{0};
  uint32_t     flowinfo_{0};
  uint32_t     scope_id_{0};
};

class Scion {
public:
  Scion() = default;
  Scion(SCION::Address const& addr, uint16_t port)
    : addr_(addr)
    , port_(port)
  {
  }
  Scion(IA::ia_t ia, IP::Address const& host, uint16_t port)
    : addr_(ia, host)
    , port_(port)
  {
  }

  explicit Scion(std::string_view addr);

  static bool validate(std::string_view addr, std::string& msg, Scion& out);
  static std::optional<Scion> parse(std::string_view addr);

  SCION::Address const& addr() const { return addr_; }
  IA::ia_t              ia() const { return addr_.ia(); }
  IP::Address const&    host() const { return addr_.host(); }
  uint16_t              port() const { return port_; }

  void set_addr(SCION::Address const& addr) { addr_ = addr; }
  void set_ia(IA::ia_t ia) { addr_.set_ia(ia); }
  void set_host(IP::Address const& host) { addr_.set_host(host); }
  void set_port(uint16_t port) { port_ = port; }

  template <typename OutputIt>
  OutputIt format_to(OutputIt out) const
  {
    out = addr_.format_to(out);
    return fmt::format_to(out, ":{}", port_);
  }

  std::string to_string() const;

  bool operator==(Scion const& rhs) const = default;
  auto operator<=>(Scion const& rhs) const = default;

private:
  SCION::Address addr_;
  uint16_t       port_{0};
};

// Any of the three.  Ordered V4, then V6, then SCION.

class Address {
public:
  using variant_type = std::variant<V4, V6, Scion>;

  Address() = default;
  Address(V4 const& addr)
    : addr_(addr)
  {
  }
  Address(V6 const& addr)
    : addr_(addr)
  {
  }
  Address(Scion const& addr)
    : addr_(addr)
  {
  }

  explicit Address(std::string_view addr);

  static bool validate(std::string_view addr, std::string& msg, Address& out);
  static std::optional<Address> parse(std::string_view addr);

  static Address new_ip(IP::Address const& ip, uint16_t port);
  static Address new_scion(IA::ia_t ia, IP::Address const& ip, uint16_t port);

  bool is_ipv4() const { return std::holds_alternative<V4>(addr_); }
  bool is_ipv6() const { return std::holds_alternative<V6>(addr_); }
  bool is_scion() const { return std::holds_alternative<Scion>(addr_); }

  V4 const*    v4() const { return std::get_if<V4>(&addr_); }
  V6 const*    v6() const { return std::get_if<V6>(&addr_); }
  Scion const* scion() const { return std::get_if<Scion>(&addr_); }

  variant_type const& get() const { return addr_; }

  // The IP address, which for SCION is the host within the AS.
  IP::Address host() const;
  uint16_t    port() const;

  void set_port(uint16_t port);

  // Same family replaces the address; a different family rebuilds the
  // socket address around the same port.  SCION keeps its ISD-AS.
  void set_ip(IP::Address const& ip);

  void set_host(L3::Address const& host);

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

auto read_v4(Scanner& s) -> std::optional<V4>;
auto read_v6(Scanner& s) -> std::optional<V6>;
auto read_scion(Scanner& s) -> std::optional<Scion>;
auto read(Scanner& s) -> std::optional<Address>;

std::ostream& operator<<(std::ostream& os, V4 const& addr);
std::ostream& operator<<(std::ostream& os, V6 const& addr);
std::ostream& operator<<(std::ostream& os, Scion const& addr);
std::ostream& operator<<(std::ostream& os, Address const& addr);

} // namespace SockAddr

template <>
struct fmt::formatter<SockAddr::V4>
  : staged_formatter<SockAddr::V4, SockAddr::v4_max_text_size> {
};

template <>
struct fmt::formatter<SockAddr::V6>
  : staged_formatter<SockAddr::V6, SockAddr::v6_max_text_size> {
};

template <>
struct fmt::formatter<SockAddr::Scion>
  : staged_formatter<SockAddr::Scion, SockAddr::scion_max_text_size> {
};

template <>
struct fmt::formatter<SockAddr::Address>
  : staged_formatter<SockAddr::Address, SockAddr::max_text_size> {
};

#endif // SOCKADDR_DOT_HPP
