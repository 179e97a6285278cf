#include "L3.hpp"

#include "Addr-error.hpp"
#include "Scanner.hpp"

#include <iterator>

namespace L3 {

auto read(Scanner& s) -> std::optional<Address>
{
  if (auto const scion = SCION::read(s); scion)
    return Address{*scion};
  if (auto const ip = IP::read(s); ip)
    return Address{*ip};
  return {};
}

Address::Address(std::string_view addr)
{
  std::string msg;
  Addr::assign(parse(addr), Addr::kind::l3, addr, true /* throw */, msg,
               *this);
}

bool Address::validate(std::string_view addr, std::string& msg, Address& out)
{
  return Addr::assign(parse(addr), Addr::kind::l3, addr,
                      false /* don't throw */, msg, out);
}

std::optional<Address> Address::parse(std::string_view addr)
{
  Scanner s{addr};
  return s.parse_with(read, Addr::kind::l3);
}

std::string Address::to_string() const
{
  std::string ret;
  format_to(std::back_inserter(ret));
  return ret;
}

std::ostream& operator<<(std::ostream& os, Address const& addr)
{
  DisplayBuffer<max_text_size> buf;
  addr.format_to(buf.out());
  return os << buf.view();
}

} // namespace L3
