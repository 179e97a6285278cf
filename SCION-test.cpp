#include "SCION.hpp"

#include "Addr-error.hpp"

#include <string>

#include <glog/logging.h>

#include <fmt/format.h>

int main(int argc, char const* argv[])
{
  using SCION::Address;
  using SCION::is_address;

  Address const addr{"19-ffaa:1:1067,127.0.0.1"};
  CHECK_EQ(addr.isd(), 19);
  CHECK_EQ(addr.as(), 0xffaa'0001'1067u);
  CHECK_EQ(addr.ia(), 5629130167095399u);
  CHECK_EQ(addr.host(), IP::Address{IP4::Address::localhost()});
  CHECK_EQ(addr.to_string(), "19-ffaa:1:1067,127.0.0.1");
  CHECK_EQ(fmt::format("{}", addr), "19-ffaa:1:1067,127.0.0.1");
  CHECK_EQ(fmt::format("{:>26}", addr), "  19-ffaa:1:1067,127.0.0.1");

  // IPv6 hosts are bracketed on output, the brackets are optional on
  // input, each one on its own.
  Address const v6{"1-ff00:0:110,[::1]"};
  CHECK(v6.host().is_ipv6());
  CHECK_EQ(v6.to_string(), "1-ff00:0:110,[::1]");
  CHECK_EQ(Address{"1-ff00:0:110,::1"}, v6);
  CHECK_EQ(Address{"1-ff00:0:110,[::1"}, v6);
  CHECK_EQ(Address{"1-ff00:0:110,::1]"}, v6);
  CHECK_EQ(Address{"1-ff00:0:110,[10.0.0.1]"},
           Address{"1-ff00:0:110,10.0.0.1"});

  CHECK(is_address("0-0,0.0.0.0"));
  CHECK(is_address("65535-ffff:ffff:ffff,[ffff::ffff]"));
  CHECK(!is_address("1-ff00:0:110"));
  CHECK(!is_address("1-ff00:0:110,"));
  CHECK(!is_address("1-1:2,1.2.3.4"));
  CHECK(!is_address("1-ff00:0:110,1.2.3"));
  CHECK(!is_address("1-ff00:0:110;1.2.3.4"));
  CHECK(!is_address("1-ff00:0:110,1.2.3.4:80"));
  CHECK(!is_address("1-ff00:0:110,[[::1]"));
  CHECK(!is_address("ff00:0:110,1.2.3.4"));
  CHECK(!is_address("1.2.3.4"));

  // An AS in the BGP range prints in decimal.
  Address const bgp{"1-fc00,10.0.0.1"};
  CHECK_EQ(bgp.as(), 64512u);
  CHECK_EQ(bgp.to_string(), "1-64512,10.0.0.1");

  Address moved{addr};
  moved.set_isd(2);
  CHECK_EQ(moved.isd(), 2);
  CHECK_EQ(moved.as(), addr.as());
  moved.set_as(0xff00'0000'0110);
  CHECK_EQ(moved.isd(), 2);
  CHECK_EQ(moved.ia(), IA::make_ia(2, 0xff00'0000'0110));
  moved.set_host(IP::Address{"10.0.0.1"});
  CHECK_EQ(moved.to_string(), "2-ff00:0:110,10.0.0.1");
  moved.set_ia(addr.ia());
  CHECK_EQ(moved.to_string(), "19-ffaa:1:1067,10.0.0.1");

  CHECK_EQ((Address{19, 0xffaa'0001'1067, IP::Address{"127.0.0.1"}}), addr);
  CHECK_EQ((Address{addr.ia(), addr.host()}), addr);

  CHECK_LT(Address{"1-1,1.2.3.4"}, Address{"2-1,1.2.3.4"});
  CHECK_LT(Address{"1-1,1.2.3.4"}, Address{"1-2,1.2.3.4"});
  CHECK_LT(Address{"1-1,255.255.255.255"}, Address{"1-1,::"});

  auto threw = false;
  try {
    Address bad{"1-1:2,1.2.3.4"};
  }
  catch (Addr::parse_error const& e) {
    threw = true;
    CHECK(e.which() == Addr::kind::scion);
    CHECK_EQ(std::string(e.what()),
             "invalid SCION address syntax «1-1:2,1.2.3.4»");
  }
  CHECK(threw);

  std::string msg;
  Address     out;
  CHECK(!Address::validate("1-1", msg, out));
  CHECK_EQ(msg, "invalid SCION address syntax «1-1»");
  CHECK(Address::validate("1-1,::", msg, out));
  CHECK_EQ(out.to_string(), "1-1,[::]");
}
