#include "IP4.hpp"

#include "Addr-error.hpp"
#include "IP6.hpp"
#include "Scanner.hpp"

#include <algorithm>
#include <iterator>

#include <glog/logging.h>

#include <fmt/format.h>

namespace IP4 {

Address::Address(std::string_view addr)
{
  std::string msg;
  Addr::assign(parse(addr), Addr::kind::ipv4, addr, true /* throw */, msg,
               *this);
}

bool Address::validate(std::string_view addr, std::string& msg, Address& out)
{
  return Addr::assign(parse(addr), Addr::kind::ipv4, addr,
                      false /* don't throw */, msg, out);
}

std::optional<Address> Address::parse(std::string_view addr)
{
  // Nothing longer than "255.255.255.255" can be an address.
  if (addr.size() > max_text_size) {
    VLOG(1) << Addr::message(Addr::kind::ipv4, addr) << " too long";
    return {};
  }
  Scanner s{addr};
  return s.parse_with(read, Addr::kind::ipv4);
}

auto read(Scanner& s) -> std::optional<Address>
{
  return s.read_atomically([](Scanner& s) -> std::optional<Address> {
    Address::bytes_type octets;
    for (std::size_t i = 0; i < octets.size(); ++i) {
      // No leading zeros: "010" might be meant as octal.
      auto const octet = s.read_separator('.', i, [](Scanner& s) {
        return s.read_number<uint8_t>(10, 3, false);
      });
      if (!octet)
        return {};
      octets[i] = *octet;
    }
    return Address{octets};
  });
}

auto is_address(std::string_view addr) -> bool
{
  return Address::parse(addr).has_value();
}

// <https://www.iana.org/assignments/iana-ipv4-special-registry/>

bool Address::is_unspecified() const { return to_bits() == 0; }

bool Address::is_loopback() const { return octets_[0] == 127; }

// <https://tools.ietf.org/html/rfc1918#section-3>

// 10.0.0.0        -   10.255.255.255  (10/8 prefix)
// 172.16.0.0      -   172.31.255.255  (172.16/12 prefix)
// 192.168.0.0     -   192.168.255.255 (192.168/16 prefix)

bool Address::is_private() const
{
  if (octets_[0] == 10)
    return true;
  if (octets_[0] == 172)
    return (16 <= octets_[1]) && (octets_[1] <= 31);
  return (octets_[0] == 192) && (octets_[1] == 168);
}

bool Address::is_link_local() const
{
  return (octets_[0] == 169) && (octets_[1] == 254);
}

// 100.64.0.0/10, RFC 6598
bool Address::is_shared() const
{
  return (octets_[0] == 100) && ((octets_[1] & 0b1100'0000) == 0b0100'0000);
}

// 198.18.0.0/15, RFC 2544
bool Address::is_benchmarking() const
{
  return (octets_[0] == 198) && ((octets_[1] & 0xfe) == 18);
}

// 240.0.0.0/4, less the broadcast address
bool Address::is_reserved() const
{
  return ((octets_[0] & 0xf0) == 240) && !is_broadcast();
}

bool Address::is_multicast() const
{
  return (octets_[0] >= 224) && (octets_[0] <= 239);
}

bool Address::is_broadcast() const { return *this == broadcast(); }

// TEST-NET-1, TEST-NET-2, TEST-NET-3
bool Address::is_documentation() const
{
  auto const& o = octets_;
  return ((o[0] == 192) && (o[1] == 0) && (o[2] == 2)) ||
         ((o[0] == 198) && (o[1] == 51) && (o[2] == 100)) ||
         ((o[0] == 203) && (o[1] == 0) && (o[2] == 113));
}

bool Address::is_global() const
{
  // 192.0.0.9 and 192.0.0.10 are globally routable anycast.
  if (to_bits() == 0xc000'0009 || to_bits() == 0xc000'000a)
    return true;

  if (octets_[0] == 0) // "this network"
    return false;
  if ((octets_[0] == 192) && (octets_[1] == 0) && (octets_[2] == 0))
    return false;

  return !is_private() && !is_loopback() && !is_link_local() &&
         !is_shared() && !is_benchmarking() && !is_reserved() &&
         !is_broadcast() && !is_documentation();
}

IP6::Address Address::to_ipv6_compatible() const
{
  IP6::Address::bytes_type bytes{};
  std::copy(octets_.begin(), octets_.end(), bytes.begin() + 12);
  return IP6::Address{bytes};
}

IP6::Address Address::to_ipv6_mapped() const
{
  IP6::Address::bytes_type bytes{};
  bytes[10] = 0xff;
  bytes[11] = 0xff;
  std::copy(octets_.begin(), octets_.end(), bytes.begin() + 12);
  return IP6::Address{bytes};
}

std::string Address::to_string() const
{
  std::string ret;
  ret.reserve(max_text_size);
  format_to(std::back_inserter(ret));
  return ret;
}

Address& Address::operator&=(Address const& rhs)
{
  for (std::size_t i = 0; i < octets_.size(); ++i)
    octets_[i] &= rhs.octets_[i];
  return *this;
}

Address& Address::operator|=(Address const& rhs)
{
  for (std::size_t i = 0; i < octets_.size(); ++i)
    octets_[i] |= rhs.octets_[i];
  return *this;
}

Address operator&(Address lhs, Address const& rhs) { return lhs &= rhs; }

Address operator|(Address lhs, Address const& rhs) { return lhs |= rhs; }

Address operator~(Address const& addr)
{
  return Address::from_bits(~addr.to_bits());
}

std::ostream& operator<<(std::ostream& os, Address const& addr)
{
  DisplayBuffer<max_text_size> buf;
  addr.format_to(buf.out());
  return os << buf.view();
}

} // namespace IP4
