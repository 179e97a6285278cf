#include "IP6.hpp"

#include "Addr-error.hpp"

#include <string>

#include <glog/logging.h>

#include <fmt/format.h>

namespace {
std::string canonical(std::string_view text)
{
  return IP6::Address{text}.to_string();
}
} // namespace

int main(int argc, char const* argv[])
{
  using IP6::Address;
  using IP6::as_address;
  using IP6::is_address;
  using IP6::is_address_literal;
  using IP6::to_address_literal;

  CHECK(is_address("::1"));
  CHECK(is_address("::"));
  CHECK(is_address("1::"));
  CHECK(is_address("1::2:3"));
  CHECK(is_address("FFFF::1"));
  CHECK(is_address("1:2:3:4:5:6:7:8"));
  CHECK(is_address("1:2:3:4:5:6:7::"));
  CHECK(is_address("::2:3:4:5:6:7:8"));
  CHECK(is_address("1:2:3:4:5:6:1.2.3.4"));
  CHECK(is_address("::1.2.3.4"));
  CHECK(is_address("::ffff:0.0.0.0"));
  CHECK(is_address("::ffff:255.255.255.255"));
  CHECK(is_address("::ffff:0:0.0.0.0"));
  CHECK(is_address("::ffff:0:255.255.255.255"));
  CHECK(is_address("fd12:3456:789a:1::1"));
  CHECK(is_address("2001:0db8:85a3:0000:0000:8a2e:0370:7334"));

  CHECK(!is_address(""));
  CHECK(!is_address(":"));
  CHECK(!is_address(":::"));
  CHECK(!is_address("1:::2"));
  CHECK(!is_address("1::2::3"));
  CHECK(!is_address("12345::"));
  CHECK(!is_address("1:2:3:4:5:6:7"));
  CHECK(!is_address("1:2:3:4:5:6:7:8:9"));
  CHECK(!is_address("1:2:3:4:5:6:7:1.2.3.4"));
  CHECK(!is_address("g::1"));
  CHECK(!is_address("1.2.3.4::"));
  CHECK(!is_address("::1.2.3.4:5"));
  CHECK(!is_address("::ffff:1.2.3.256"));
  CHECK(!is_address("::ffff:01.2.3.4"));
  CHECK(!is_address("[::1]"));

  CHECK_EQ(Address{"::"}, Address::unspecified());
  CHECK_EQ(Address{"::1"}, Address::localhost());
  CHECK_EQ(Address{"1::"}, (Address{1, 0, 0, 0, 0, 0, 0, 0}));
  CHECK_EQ(Address{"1:2:3:4:5:6:1.2.3.4"},
           (Address{1, 2, 3, 4, 5, 6, 0x102, 0x304}));

  // Display, RFC 5952.
  CHECK_EQ((Address{0, 0, 0, 0, 0, 0xffff, 0xc00a, 0x2ff}.to_string()),
           "::ffff:192.10.2.255");
  CHECK_EQ((Address{1, 0, 1, 1, 1, 1, 1, 1}.to_string()), "1:0:1:1:1:1:1:1");
  CHECK_EQ(Address::localhost().to_string(), "::1");
  CHECK_EQ(Address::unspecified().to_string(), "::");
  CHECK_EQ(canonical("1::"), "1::");
  CHECK_EQ(canonical("FFFF::1"), "ffff::1");
  CHECK_EQ(canonical("2001:0db8:85a3:0000:0000:8a2e:0370:7334"),
           "2001:db8:85a3::8a2e:370:7334");
  CHECK_EQ(canonical("102:304:0:0:90a:b0c:0:0"), "102:304::90a:b0c:0:0");
  CHECK_EQ(canonical("1:0:0:2:0:0:0:3"), "1:0:0:2::3");
  CHECK_EQ(canonical("::1.2.3.4"), "::102:304");
  CHECK_EQ(canonical("::ffff:0.0.0.0"), "::ffff:0.0.0.0");

  for (auto const text : {"2001:db8::1", "fe80::1:2:3:4", "1:2:3:4:5:6:7:8",
                          "::ffff:10.1.2.3", "ff02::1:ff00:0"}) {
    CHECK_EQ(canonical(text), text);
  }

  CHECK_EQ(fmt::format("[{:>8}]", Address::localhost()), "[     ::1]");
  CHECK_EQ(fmt::format("{}", Address{"2001:db8::1"}), "2001:db8::1");

  auto const addr{Address{"2001:0db8:85a3:0000:0000:8a2e:0370:7334"}};
  auto const addr_lit{"[2001:db8:85a3::8a2e:370:7334]"};

  CHECK(is_address_literal(addr_lit));
  CHECK(is_address_literal(IP6::loopback_literal));
  CHECK(!is_address_literal("::1"));
  CHECK(!is_address_literal("[::1"));
  CHECK(!is_address_literal("[]"));
  CHECK_EQ(to_address_literal(addr), addr_lit);
  CHECK_EQ(as_address(addr_lit), addr.to_string());

  auto threw = false;
  try {
    Address bad{"1::2::3"};
  }
  catch (Addr::parse_error const& e) {
    threw = true;
    CHECK(e.which() == Addr::kind::ipv6);
    CHECK_EQ(std::string(e.what()), "invalid IPv6 address syntax «1::2::3»");
  }
  CHECK(threw);

  std::string msg;
  Address     out;
  CHECK(!Address::validate("::g", msg, out));
  CHECK_EQ(msg, "invalid IPv6 address syntax «::g»");

  CHECK_LT(Address{"::1"}, Address{"::2"});
  CHECK_LT(Address{"::ffff"}, Address{"1::"});

  CHECK(Address{"fd12:3456:789a:1::1"}.is_unique_local());
  CHECK(!Address{"fe80::1"}.is_unique_local());
  CHECK(Address{"fe80::1"}.is_unicast_link_local());
  CHECK(Address{"febf::1"}.is_unicast_link_local());
  CHECK(!Address{"fec0::1"}.is_unicast_link_local());
  CHECK(Address{"2001:db8::1"}.is_documentation());
  CHECK(Address{"2001:2::1"}.is_benchmarking());
  CHECK(!Address{"2001:2:1::1"}.is_benchmarking());
  CHECK(Address{"ff02::1"}.is_multicast());
  CHECK(!Address{"ff02::1"}.is_unicast());
  CHECK(Address{"2606:4700::1111"}.is_unicast_global());
  CHECK(!Address{"fe80::1"}.is_unicast_global());

  CHECK(Address{"ff02::1"}.multicast_scope() ==
        IP6::Multicast_scope::link_local);
  CHECK(Address{"ff0e::1"}.multicast_scope() == IP6::Multicast_scope::global);
  CHECK(Address{"ff05::2"}.multicast_scope() ==
        IP6::Multicast_scope::site_local);
  CHECK(!Address{"ff00::1"}.multicast_scope());
  CHECK(!Address{"2001:db8::1"}.multicast_scope());

  CHECK(Address{"2606:4700::1111"}.is_global());
  CHECK(Address{"2001:1::1"}.is_global());
  CHECK(Address{"2001:3::1"}.is_global());
  CHECK(Address{"2001:20::1"}.is_global());
  CHECK(!Address{"2001:10::1"}.is_global());
  CHECK(!Address::localhost().is_global());
  CHECK(!Address::unspecified().is_global());
  CHECK(!Address{"::ffff:1.2.3.4"}.is_global());
  CHECK(!Address{"64:ff9b:1::1"}.is_global());
  CHECK(!Address{"100::1"}.is_global());
  CHECK(!Address{"2001:db8::1"}.is_global());
  CHECK(!Address{"fc00::1"}.is_global());
  CHECK(!Address{"fe80::1"}.is_global());

  CHECK(Address{"::ffff:1.2.3.4"}.to_ipv4_mapped() ==
        IP4::Address(1, 2, 3, 4));
  CHECK(!Address{"::1.2.3.4"}.to_ipv4_mapped());
  CHECK(Address{"::1.2.3.4"}.to_ipv4() == IP4::Address(1, 2, 3, 4));
  CHECK(Address::localhost().to_ipv4() == IP4::Address(0, 0, 0, 1));
  CHECK(!Address{"1::1.2.3.4"}.to_ipv4());

  CHECK_EQ(~Address::unspecified(),
           Address{"ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff"});
  CHECK_EQ((Address{"2001:db8::1"} & Address{"ffff:ffff::"}),
           Address{"2001:db8::"});
  CHECK_EQ((Address{"2001:db8::"} | Address{"::1"}), Address{"2001:db8::1"});
}
