#include "SCION.hpp"

#include "Addr-error.hpp"
#include "Scanner.hpp"

#include <iterator>

#include <glog/logging.h>

namespace SCION {

Address::Address(IA::ia_t ia, IP::Address const& host)
  : ia_(ia)
  , host_(host)
{
}

Address::Address(IA::isd_t isd, IA::as_t as, IP::Address const& host)
  : host_(host)
{
  CHECK_LE(as, IA::max_as) << "AS number does not fit in 48 bits";
  ia_ = IA::make_ia(isd, as);
}

Address::Address(std::string_view addr)
{
  std::string msg;
  Addr::assign(parse(addr), Addr::kind::scion, addr, true /* throw */, msg,
               *this);
}

bool Address::validate(std::string_view addr, std::string& msg, Address& out)
{
  return Addr::assign(parse(addr), Addr::kind::scion, addr,
                      false /* don't throw */, msg, out);
}

std::optional<Address> Address::parse(std::string_view addr)
{
  Scanner s{addr};
  return s.parse_with(read, Addr::kind::scion);
}

void Address::set_isd(IA::isd_t isd) { ia_ = IA::make_ia(isd, as()); }

void Address::set_as(IA::as_t as)
{
  CHECK_LE(as, IA::max_as) << "AS number does not fit in 48 bits";
  ia_ = IA::make_ia(isd(), as);
}

std::string Address::to_string() const
{
  std::string ret;
  format_to(std::back_inserter(ret));
  return ret;
}

// ISD "-" AS "," host, where an IPv6 host may be bracketed.  Each bracket
// is optional on its own.
auto read(Scanner& s) -> std::optional<Address>
{
  return s.read_atomically([](Scanner& s) -> std::optional<Address> {
    auto const ia = IA::read_ia(s);
    if (!ia || !s.read_given_char(','))
      return {};

    s.read_given_char('[');
    auto host = IP::read(s);
    if (!host)
      return {};
    s.read_given_char(']');

    return Address{*ia, *host};
  });
}

auto is_address(std::string_view addr) -> bool
{
  return Address::parse(addr).has_value();
}

std::ostream& operator<<(std::ostream& os, Address const& addr)
{
  DisplayBuffer<max_text_size> buf;
  addr.format_to(buf.out());
  return os << buf.view();
}

} // namespace SCION
