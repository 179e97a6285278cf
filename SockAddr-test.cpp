#include "SockAddr.hpp"

#include "Addr-error.hpp"

#include <string>

#include <glog/logging.h>

#include <fmt/format.h>

int main(int argc, char const* argv[])
{
  using SockAddr::Address;
  using SockAddr::Scion;
  using SockAddr::V4;
  using SockAddr::V6;

  V4 const v4{"127.0.0.1:53"};
  CHECK_EQ(v4.ip(), IP4::Address::localhost());
  CHECK_EQ(v4.port(), 53);
  CHECK_EQ(v4.to_string(), "127.0.0.1:53");
  CHECK_EQ(V4{"1.2.3.4:0080"}.to_string(), "1.2.3.4:80");
  CHECK_EQ(V4{"1.2.3.4:65535"}.port(), 65535);
  CHECK(!V4::parse("1.2.3.4:65536"));
  CHECK(!V4::parse("1.2.3.4"));
  CHECK(!V4::parse("1.2.3.4:"));
  CHECK(!V4::parse("1.2.3.4:-1"));
  CHECK(!V4::parse("[1.2.3.4]:80"));

  V6 const v6{"[::1]:80"};
  CHECK_EQ(v6.ip(), IP6::Address::localhost());
  CHECK_EQ(v6.port(), 80);
  CHECK_EQ(v6.scope_id(), 0u);
  CHECK_EQ(v6.flowinfo(), 0u);
  CHECK_EQ(v6.to_string(), "[::1]:80");

  V6 const scoped{"[fe80::1%2]:8080"};
  CHECK_EQ(scoped.scope_id(), 2u);
  CHECK_EQ(scoped.to_string(), "[fe80::1%2]:8080");
  CHECK_EQ(V6{"[::1%0]:1"}.to_string(), "[::1]:1");
  CHECK_EQ(V6{"[::ffff:1.2.3.4]:1"}.to_string(), "[::ffff:1.2.3.4]:1");
  CHECK(!V6::parse("::1:80"));
  CHECK(!V6::parse("[::1]"));
  CHECK(!V6::parse("[::1]:"));
  CHECK(!V6::parse("[::1%]:80"));
  CHECK(!V6::parse("[::1]80"));
  CHECK(!V6::parse("[1.2.3.4]:80"));

  // Flow info has no text form.
  CHECK_EQ((V6{IP6::Address::localhost(), 80, 7, 0}.to_string()), "[::1]:80");

  Scion const scion{"19-ffaa:1:1067,127.0.0.1:53"};
  CHECK_EQ(scion.ia(), IA::make_ia(19, 0xffaa'0001'1067));
  CHECK_EQ(scion.host(), IP::Address{"127.0.0.1"});
  CHECK_EQ(scion.port(), 53);
  CHECK_EQ(scion.to_string(), "19-ffaa:1:1067,127.0.0.1:53");
  CHECK_EQ(Scion{"1-ff00:0:110,[::1]:8080"}.to_string(),
           "1-ff00:0:110,[::1]:8080");
  CHECK(!Scion::parse("19-ffaa:1:1067,127.0.0.1"));
  CHECK(!Scion::parse("127.0.0.1:53"));

  // The generic reader tries IPv4, then IPv6, then SCION.
  Address const a4{"127.0.0.1:53"};
  CHECK(a4.is_ipv4());
  CHECK_EQ(a4, Address{v4});
  Address const a6{"[::1]:80"};
  CHECK(a6.is_ipv6());
  CHECK_EQ(a6, Address{v6});
  Address const as{"19-ffaa:1:1067,127.0.0.1:53"};
  CHECK(as.is_scion());
  CHECK(!as.is_ipv4());
  CHECK(!as.is_ipv6());
  CHECK_EQ(as, Address{scion});
  CHECK_EQ(as.to_string(), "19-ffaa:1:1067,127.0.0.1:53");
  CHECK_EQ(as.host(), IP::Address{"127.0.0.1"});
  CHECK_EQ(as.port(), 53);

  CHECK_LT(a4, a6);
  CHECK_LT(a6, as);
  CHECK_LT(Address{"1.2.3.4:1"}, Address{"1.2.3.4:2"});

  CHECK_EQ(fmt::format("{:<25}|", Address{"1.2.3.4:5"}),
           "1.2.3.4:5                |");
  CHECK_EQ(fmt::format("{:>12}", Address{"[::1]:80"}), "    [::1]:80");

  auto ip = Address::new_ip(IP::Address{"1.2.3.4"}, 80);
  CHECK(ip.is_ipv4());
  CHECK_EQ(ip.to_string(), "1.2.3.4:80");
  CHECK(Address::new_ip(IP::Address{"::1"}, 80).is_ipv6());

  auto sc = Address::new_scion(IA::make_ia(1, 0xff00'0000'0110),
                               IP::Address{"::1"}, 443);
  CHECK(sc.is_scion());
  CHECK_EQ(sc.to_string(), "1-ff00:0:110,[::1]:443");

  ip.set_port(8080);
  CHECK_EQ(ip.port(), 8080);

  // Same family: the address changes in place.
  ip.set_ip(IP::Address{"5.6.7.8"});
  CHECK_EQ(ip.to_string(), "5.6.7.8:8080");

  // Other family: rebuilt, port kept.
  ip.set_ip(IP::Address{"::1"});
  CHECK(ip.is_ipv6());
  CHECK_EQ(ip.to_string(), "[::1]:8080");

  // SCION keeps its ISD-AS.
  sc.set_ip(IP::Address{"10.0.0.1"});
  CHECK(sc.is_scion());
  CHECK_EQ(sc.to_string(), "1-ff00:0:110,10.0.0.1:443");

  sc.set_host(L3::Address{"2-1,10.0.0.2"});
  CHECK_EQ(sc.to_string(), "2-1,10.0.0.2:443");

  sc.set_host(L3::Address{"10.0.0.3"});
  CHECK_EQ(sc.to_string(), "2-1,10.0.0.3:443");

  auto plain = Address{"1.2.3.4:5"};
  plain.set_host(L3::Address{"1-1,9.9.9.9"});
  CHECK(plain.is_ipv4());
  CHECK_EQ(plain.to_string(), "9.9.9.9:5");
  plain.set_host(L3::Address{"1-1,::9"});
  CHECK_EQ(plain.to_string(), "9.9.9.9:5");
  plain.set_host(L3::Address{"::9"});
  CHECK_EQ(plain.to_string(), "[::9]:5");

  auto threw = false;
  try {
    V6 bad{"[::1]"};
  }
  catch (Addr::parse_error const& e) {
    threw = true;
    CHECK(e.which() == Addr::kind::socket_v6);
    CHECK_EQ(std::string(e.what()),
             "invalid IPv6 socket address syntax «[::1]»");
  }
  CHECK(threw);

  std::string msg;
  Address     out;
  CHECK(!Address::validate("nope", msg, out));
  CHECK_EQ(msg, "invalid socket address syntax «nope»");

  V4 out4;
  CHECK(!V4::validate("[::1]:80", msg, out4));
  CHECK_EQ(msg, "invalid IPv4 socket address syntax «[::1]:80»");

  Scion outs;
  CHECK(!Scion::validate("1-1,1.2.3.4", msg, outs));
  CHECK_EQ(msg, "invalid SCION socket address syntax «1-1,1.2.3.4»");
}
