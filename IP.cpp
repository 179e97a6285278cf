#include "IP.hpp"

#include "Addr-error.hpp"
#include "Scanner.hpp"

#include <iterator>

#include <glog/logging.h>

namespace IP {

auto read(Scanner& s) -> std::optional<Address>
{
  if (auto const v4 = IP4::read(s); v4)
    return Address{*v4};
  if (auto const v6 = IP6::read(s); v6)
    return Address{*v6};
  return {};
}

Address::Address(std::string_view addr)
{
  std::string msg;
  Addr::assign(parse(addr), Addr::kind::ip, addr, true /* throw */, msg,
               *this);
}

bool Address::validate(std::string_view addr, std::string& msg, Address& out)
{
  return Addr::assign(parse(addr), Addr::kind::ip, addr,
                      false /* don't throw */, msg, out);
}

std::optional<Address> Address::parse(std::string_view addr)
{
  Scanner s{addr};
  return s.parse_with(read, Addr::kind::ip);
}

auto is_address(std::string_view addr) -> bool
{
  return Address::parse(addr).has_value();
}

bool Address::is_unspecified() const
{
  return std::visit([](auto const& a) { return a.is_unspecified(); }, addr_);
}

bool Address::is_loopback() const
{
  return std::visit([](auto const& a) { return a.is_loopback(); }, addr_);
}

bool Address::is_global() const
{
  return std::visit([](auto const& a) { return a.is_global(); }, addr_);
}

bool Address::is_multicast() const
{
  return std::visit([](auto const& a) { return a.is_multicast(); }, addr_);
}

bool Address::is_documentation() const
{
  return std::visit([](auto const& a) { return a.is_documentation(); },
                    addr_);
}

bool Address::is_benchmarking() const
{
  return std::visit([](auto const& a) { return a.is_benchmarking(); }, addr_);
}

Address Address::to_canonical() const
{
  if (auto const v6 = ipv6(); v6) {
    if (auto const v4 = v6->to_ipv4_mapped(); v4)
      return Address{*v4};
  }
  return *this;
}

std::string Address::to_string() const
{
  std::string ret;
  ret.reserve(max_text_size);
  format_to(std::back_inserter(ret));
  return ret;
}

std::ostream& operator<<(std::ostream& os, Address const& addr)
{
  DisplayBuffer<max_text_size> buf;
  addr.format_to(buf.out());
  return os << buf.view();
}

} // namespace IP
