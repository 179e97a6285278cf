#include "IP6.hpp"

#include "Addr-error.hpp"
#include "Scanner.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include <glog/logging.h>

#include <fmt/format.h>

namespace IP6 {

namespace {
// Read up to limit colon separated hex groups into groups[].  An IPv4
// address may stand in for the last two groups, and ends the run.
// Returns the number of groups filled and whether IPv4 was seen.
std::pair<std::size_t, bool>
read_groups(Scanner& s, uint16_t* groups, std::size_t limit)
{
  for (std::size_t i = 0; i < limit; ++i) {
    if (i + 1 < limit) {
      auto const v4 = s.read_separator(':', i, IP4::read);
      if (v4) {
        auto const& o = v4->octets();
        groups[i]     = uint16_t((o[0] << 8) | o[1]);
        groups[i + 1] = uint16_t((o[2] << 8) | o[3]);
        return {i + 2, true};
      }
    }

    auto const group = s.read_separator(':', i, [](Scanner& s) {
      return s.read_number<uint16_t>(16, 4, true);
    });
    if (!group)
      return {i, false};
    groups[i] = *group;
  }
  return {limit, false};
}
} // namespace

auto read(Scanner& s) -> std::optional<Address>
{
  return s.read_atomically([](Scanner& s) -> std::optional<Address> {
    Address::segments_type head{};
    auto const [head_size, head_ipv4] =
        read_groups(s, head.data(), head.size());

    if (head_size == head.size())
      return Address{head};

    // IPv4 must be the last thing, "1.2.3.4::" is nonsense.
    if (head_ipv4)
      return {};

    if (!s.read_given_char(':') || !s.read_given_char(':'))
      return {};

    // "::" stands for at least one zero group.
    Address::segments_type tail{};
    auto const limit     = head.size() - (head_size + 1);
    auto const tail_size = read_groups(s, tail.data(), limit).first;

    std::copy(tail.begin(), tail.begin() + tail_size,
              head.end() - tail_size);
    return Address{head};
  });
}

Address::Address(std::string_view addr)
{
  std::string msg;
  Addr::assign(parse(addr), Addr::kind::ipv6, addr, true /* throw */, msg,
               *this);
}

bool Address::validate(std::string_view addr, std::string& msg, Address& out)
{
  return Addr::assign(parse(addr), Addr::kind::ipv6, addr,
                      false /* don't throw */, msg, out);
}

std::optional<Address> Address::parse(std::string_view addr)
{
  Scanner s{addr};
  return s.parse_with(read, Addr::kind::ipv6);
}

auto is_address(std::string_view addr) -> bool
{
  return Address::parse(addr).has_value();
}

auto is_address_literal(std::string_view addr) -> bool
{
  if (addr.size() < lit_extra_sz || !addr.starts_with(lit_pfx) ||
      !addr.ends_with(lit_sfx))
    return false;
  return is_address(as_address(addr));
}

auto to_address_literal(Address const& addr) -> std::string
{
  return fmt::format("{}{}{}", lit_pfx, addr, lit_sfx);
}

bool Address::is_unspecified() const { return *this == unspecified(); }

bool Address::is_loopback() const { return *this == localhost(); }

// fc00::/7
bool Address::is_unique_local() const { return (octets_[0] & 0xfe) == 0xfc; }

// fe80::/10
bool Address::is_unicast_link_local() const
{
  return (octets_[0] == 0xfe) && ((octets_[1] & 0xc0) == 0x80);
}

// 2001:db8::/32
bool Address::is_documentation() const
{
  auto const segs = segments();
  return (segs[0] == 0x2001) && (segs[1] == 0xdb8);
}

// 2001:2::/48
bool Address::is_benchmarking() const
{
  auto const segs = segments();
  return (segs[0] == 0x2001) && (segs[1] == 0x2) && (segs[2] == 0);
}

bool Address::is_multicast() const { return octets_[0] == 0xff; }

bool Address::is_unicast() const { return !is_multicast(); }

bool Address::is_unicast_global() const
{
  return is_unicast() && !is_loopback() && !is_unicast_link_local() &&
         !is_unique_local() && !is_unspecified() && !is_documentation() &&
         !is_benchmarking();
}

// <https://www.iana.org/assignments/iana-ipv6-special-registry/>

bool Address::is_global() const
{
  if (is_unspecified() || is_loopback())
    return false;

  auto const segs = segments();

  if (to_ipv4_mapped())
    return false;

  // IPv4-IPv6 translation, 64:ff9b:1::/48
  if ((segs[0] == 0x64) && (segs[1] == 0xff9b) && (segs[2] == 1))
    return false;

  // Discard-only, 100::/64
  if ((segs[0] == 0x100) && (segs[1] == 0) && (segs[2] == 0) &&
      (segs[3] == 0))
    return false;

  // IETF protocol assignments, 2001::/23, less the global ones.
  if ((segs[0] == 0x2001) && (segs[1] < 0x200)) {
    auto const anycast =
        (segs[1] == 1) && (segs[2] == 0) && (segs[3] == 0) &&
        (segs[4] == 0) && (segs[5] == 0) && (segs[6] == 0) &&
        ((segs[7] == 1) || (segs[7] == 2));
    auto const amt     = segs[1] == 3;
    auto const as112   = (segs[1] == 4) && (segs[2] == 0x112);
    auto const orchid  = (segs[1] >= 0x20) && (segs[1] <= 0x2f);
    if (!(anycast || amt || as112 || orchid))
      return false;
  }

  return !is_documentation() && !is_unique_local() &&
         !is_unicast_link_local();
}

std::optional<Multicast_scope> Address::multicast_scope() const
{
  if (!is_multicast())
    return {};

  switch (octets_[1] & 0x0f) {
  case 1: return Multicast_scope::interface_local;
  case 2: return Multicast_scope::link_local;
  case 3: return Multicast_scope::realm_local;
  case 4: return Multicast_scope::admin_local;
  case 5: return Multicast_scope::site_local;
  case 8: return Multicast_scope::organization_local;
  case 14: return Multicast_scope::global;
  }
  return {};
}

std::optional<IP4::Address> Address::to_ipv4_mapped() const
{
  if (!std::all_of(octets_.begin(), octets_.begin() + 10,
                   [](uint8_t o) { return o == 0; }))
    return {};
  if ((octets_[10] != 0xff) || (octets_[11] != 0xff))
    return {};
  return IP4::Address{octets_[12], octets_[13], octets_[14], octets_[15]};
}

std::optional<IP4::Address> Address::to_ipv4() const
{
  if (!std::all_of(octets_.begin(), octets_.begin() + 10,
                   [](uint8_t o) { return o == 0; }))
    return {};
  auto const ff = (octets_[10] == 0xff) && (octets_[11] == 0xff);
  auto const zz = (octets_[10] == 0) && (octets_[11] == 0);
  if (!ff && !zz)
    return {};
  return IP4::Address{octets_[12], octets_[13], octets_[14], octets_[15]};
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

Address operator~(Address addr)
{
  auto bytes = addr.octets();
  for (auto& b : bytes)
    b = ~b;
  return Address{bytes};
}

std::ostream& operator<<(std::ostream& os, Address const& addr)
{
  DisplayBuffer<max_text_size> buf;
  addr.format_to(buf.out());
  return os << buf.view();
}

} // namespace IP6
