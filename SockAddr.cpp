#include "SockAddr.hpp"

#include "Addr-error.hpp"
#include "Scanner.hpp"

#include <iterator>

#include <glog/logging.h>

namespace SockAddr {

namespace {
// ":" port, any number of digits as long as the value fits.
std::optional<uint16_t> read_port(Scanner& s)
{
  return s.read_atomically([](Scanner& s) -> std::optional<uint16_t> {
    if (!s.read_given_char(':'))
      return {};
    return s.read_number<uint16_t>(10, std::nullopt, true);
  });
}

// "%" zone index
std::optional<uint32_t> read_scope_id(Scanner& s)
{
  return s.read_atomically([](Scanner& s) -> std::optional<uint32_t> {
    if (!s.read_given_char('%'))
      return {};
    return s.read_number<uint32_t>(10, std::nullopt, true);
  });
}

template <typename T>
std::string text_of(T const& addr)
{
  std::string ret;
  addr.format_to(std::back_inserter(ret));
  return ret;
}

template <std::size_t N, typename T>
std::ostream& print_staged(std::ostream& os, T const& addr)
{
  DisplayBuffer<N> buf;
  addr.format_to(buf.out());
  return os << buf.view();
}
} // namespace

auto read_v4(Scanner& s) -> std::optional<V4>
{
  return s.read_atomically([](Scanner& s) -> std::optional<V4> {
    auto const ip = IP4::read(s);
    if (!ip)
      return {};
    auto const port = read_port(s);
    if (!port)
      return {};
    return V4{*ip, *port};
  });
}

auto read_v6(Scanner& s) -> std::optional<V6>
{
  return s.read_atomically([](Scanner& s) -> std::optional<V6> {
    if (!s.read_given_char('['))
      return {};
    auto const ip = IP6::read(s);
    if (!ip)
      return {};
    auto const scope_id = read_scope_id(s);
    if (!s.read_given_char(']'))
      return {};
    auto const port = read_port(s);
    if (!port)
      return {};
    return V6{*ip, *port, 0, scope_id.value_or(0)};
  });
}

auto read_scion(Scanner& s) -> std::optional<Scion>
{
  return s.read_atomically([](Scanner& s) -> std::optional<Scion> {
    auto const addr = SCION::read(s);
    if (!addr)
      return {};
    auto const port = read_port(s);
    if (!port)
      return {};
    return Scion{*addr, *port};
  });
}

auto read(Scanner& s) -> std::optional<Address>
{
  if (auto const v4 = read_v4(s); v4)
    return Address{*v4};
  if (auto const v6 = read_v6(s); v6)
    return Address{*v6};
  if (auto const scion = read_scion(s); scion)
    return Address{*scion};
  return {};
}

//.............................................................................

V4::V4(std::string_view addr)
{
  std::string msg;
  Addr::assign(parse(addr), Addr::kind::socket_v4, addr, true /* throw */,
               msg, *this);
}

bool V4::validate(std::string_view addr, std::string& msg, V4& out)
{
  return Addr::assign(parse(addr), Addr::kind::socket_v4, addr,
                      false /* don't throw */, msg, out);
}

std::optional<V4> V4::parse(std::string_view addr)
{
  Scanner s{addr};
  return s.parse_with(read_v4, Addr::kind::socket_v4);
}

std::string V4::to_string() const { return text_of(*this); }

V6::V6(std::string_view addr)
{
  std::string msg;
  Addr::assign(parse(addr), Addr::kind::socket_v6, addr, true /* throw */,
               msg, *this);
}

bool V6::validate(std::string_view addr, std::string& msg, V6& out)
{
  return Addr::assign(parse(addr), Addr::kind::socket_v6, addr,
                      false /* don't throw */, msg, out);
}

std::optional<V6> V6::parse(std::string_view addr)
{
  Scanner s{addr};
  return s.parse_with(read_v6, Addr::kind::socket_v6);
}

std::string V6::to_string() const { return text_of(*this); }

Scion::Scion(std::string_view addr)
{
  std::string msg;
  Addr::assign(parse(addr), Addr::kind::socket_scion, addr, true /* throw */,
               msg, *this);
}

bool Scion::validate(std::string_view addr, std::string& msg, Scion& out)
{
  return Addr::assign(parse(addr), Addr::kind::socket_scion, addr,
                      false /* don't throw */, msg, out);
}

std::optional<Scion> Scion::parse(std::string_view addr)
{
  Scanner s{addr};
  return s.parse_with(read_scion, Addr::kind::socket_scion);
}

std::string Scion::to_string() const { return text_of(*this); }

//.............................................................................

Address::Address(std::string_view addr)
{
  std::string msg;
  Addr::assign(parse(addr), Addr::kind::socket, addr, true /* throw */, msg,
               *this);
}

bool Address::validate(std::string_view addr, std::string& msg, Address& out)
{
  return Addr::assign(parse(addr), Addr::kind::socket, addr,
                      false /* don't throw */, msg, out);
}

std::optional<Address> Address::parse(std::string_view addr)
{
  Scanner s{addr};
  return s.parse_with(read, Addr::kind::socket);
}

Address Address::new_ip(IP::Address const& ip, uint16_t port)
{
  if (auto const v4 = ip.ipv4(); v4)
    return Address{V4{*v4, port}};
  return Address{V6{*ip.ipv6(), port}};
}

Address Address::new_scion(IA::ia_t ia, IP::Address const& ip, uint16_t port)
{
  return Address{Scion{ia, ip, port}};
}

IP::Address Address::host() const
{
  if (auto const a = v4(); a)
    return a->ip();
  if (auto const a = v6(); a)
    return a->ip();
  return scion()->host();
}

uint16_t Address::port() const
{
  return std::visit([](auto const& a) { return a.port(); }, addr_);
}

void Address::set_port(uint16_t port)
{
  std::visit([port](auto& a) { a.set_port(port); }, addr_);
}

void Address::set_ip(IP::Address const& ip)
{
  if (auto const a = std::get_if<Scion>(&addr_); a) {
    a->set_host(ip);
    return;
  }
  if (auto const a = std::get_if<V4>(&addr_); a && ip.is_ipv4()) {
    a->set_ip(*ip.ipv4());
    return;
  }
  if (auto const a = std::get_if<V6>(&addr_); a && ip.is_ipv6()) {
    a->set_ip(*ip.ipv6());
    return;
  }
  *this = new_ip(ip, port());
}

void Address::set_host(L3::Address const& host)
{
  if (auto const ip = host.ip(); ip) {
    set_ip(*ip);
    return;
  }

  auto const& scion_host = *host.scion();
  if (auto const a = std::get_if<Scion>(&addr_); a) {
    a->set_addr(scion_host);
    return;
  }

  // A plain IP socket only takes the SCION host's IP, and only within
  // its own family.
  auto const& ip = scion_host.host();
  auto const v4 = std::get_if<V4>(&addr_);
  auto const v6 = std::get_if<V6>(&addr_);
  if (v4 && ip.is_ipv4())
    v4->set_ip(*ip.ipv4());
  else if (v6 && ip.is_ipv6())
    v6->set_ip(*ip.ipv6());
  else
    VLOG(1) << "ignoring SCION host " << scion_host << " for " << *this;
}

std::string Address::to_string() const { return text_of(*this); }

std::ostream& operator<<(std::ostream& os, V4 const& addr)
{
  return print_staged<v4_max_text_size>(os, addr);
}

std::ostream& operator<<(std::ostream& os, V6 const& addr)
{
  return print_staged<v6_max_text_size>(os, addr);
}

std::ostream& operator<<(std::ostream& os, Scion const& addr)
{
  return print_staged<scion_max_text_size>(os, addr);
}

std::ostream& operator<<(std::ostream& os, Address const& addr)
{
  return print_staged<max_text_size>(os, addr);
}

} // namespace SockAddr
