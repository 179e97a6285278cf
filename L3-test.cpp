#include "L3.hpp"

#include "Addr-error.hpp"

#include <string>

#include <glog/logging.h>

#include <fmt/format.h>

int main(int argc, char const* argv[])
{
  using L3::Address;

  Address const scion{"19-ffaa:1:1067,127.0.0.1"};
  CHECK(scion.is_scion());
  CHECK(!scion.is_ip());
  CHECK_EQ(scion.scion()->isd(), 19);
  CHECK_EQ(scion.to_string(), "19-ffaa:1:1067,127.0.0.1");

  Address const ip4{"127.0.0.1"};
  CHECK(ip4.is_ip());
  CHECK_EQ(*ip4.ip(), IP::Address{"127.0.0.1"});

  Address const ip6{"::1"};
  CHECK(ip6.is_ip());
  CHECK_EQ(fmt::format("{}", ip6), "::1");
  CHECK_EQ(fmt::format("{:>5}", ip6), "  ::1");

  CHECK_NE(Address{"1-1,1.2.3.4"}, Address{"1.2.3.4"});
  CHECK_LT(Address{"1.2.3.4"}, Address{"1-1,1.2.3.4"});

  CHECK_EQ(Address{SCION::Address{"1-1,::1"}}, Address{"1-1,[::1]"});
  CHECK_EQ(Address{IP::Address{"::1"}}, ip6);

  auto threw = false;
  try {
    Address bad{"1.2.3.4:80"};
  }
  catch (Addr::parse_error const& e) {
    threw = true;
    CHECK(e.which() == Addr::kind::l3);
    CHECK_EQ(std::string(e.what()), "invalid L3 address syntax «1.2.3.4:80»");
  }
  CHECK(threw);

  std::string msg;
  Address     out;
  CHECK(!Address::validate("1-1,", msg, out));
  CHECK_EQ(msg, "invalid L3 address syntax «1-1,»");
  CHECK(Address::validate("1-1,10.0.0.1", msg, out));
  CHECK(out.is_scion());
}
