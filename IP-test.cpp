#include "IP.hpp"

#include "Addr-error.hpp"

#include <string>
#include <unordered_set>

#include <glog/logging.h>

#include <fmt/format.h>

int main(int argc, char const* argv[])
{
  using IP::Address;
  using IP::is_address;

  CHECK(is_address("1.2.3.4"));
  CHECK(is_address("::1"));
  CHECK(is_address("::ffff:1.2.3.4"));
  CHECK(!is_address("1.2.3.4:80"));
  CHECK(!is_address("[::1]"));
  CHECK(!is_address("1.2.3"));
  CHECK(!is_address(""));

  Address const v4{"10.1.2.3"};
  CHECK(v4.is_ipv4());
  CHECK(!v4.is_ipv6());
  CHECK(v4.ipv4());
  CHECK(!v4.ipv6());
  CHECK_EQ(*v4.ipv4(), (IP4::Address{10, 1, 2, 3}));

  Address const v6{"fe80::1"};
  CHECK(v6.is_ipv6());
  CHECK_EQ(*v6.ipv6(), (IP6::Address{0xfe80, 0, 0, 0, 0, 0, 0, 1}));

  CHECK_EQ(v4.to_string(), "10.1.2.3");
  CHECK_EQ(fmt::format("{}", v6), "fe80::1");
  CHECK_EQ(fmt::format("{:_>10}", v6), "___fe80::1");

  // Every IPv4 address sorts before every IPv6 address.
  CHECK_LT(Address{IP4::Address::broadcast()},
           Address{IP6::Address::unspecified()});
  CHECK_LT(Address{"1.2.3.4"}, Address{"1.2.3.5"});
  CHECK_NE(Address{"::ffff:1.2.3.4"}, Address{"1.2.3.4"});

  CHECK_EQ(Address{"::ffff:1.2.3.4"}.to_canonical(), Address{"1.2.3.4"});
  CHECK_EQ(Address{"::1.2.3.4"}.to_canonical(), Address{"::1.2.3.4"});
  CHECK_EQ(Address{"1.2.3.4"}.to_canonical(), Address{"1.2.3.4"});

  CHECK(Address{"127.0.0.1"}.is_loopback());
  CHECK(Address{"::1"}.is_loopback());
  CHECK(Address{"0.0.0.0"}.is_unspecified());
  CHECK(Address{"::"}.is_unspecified());
  CHECK(Address{"224.0.0.251"}.is_multicast());
  CHECK(Address{"ff02::fb"}.is_multicast());
  CHECK(Address{"192.0.2.1"}.is_documentation());
  CHECK(Address{"2001:db8::"}.is_documentation());
  CHECK(Address{"198.18.0.1"}.is_benchmarking());
  CHECK(Address{"2001:2::1"}.is_benchmarking());
  CHECK(Address{"8.8.8.8"}.is_global());
  CHECK(!Address{"10.0.0.1"}.is_global());

  std::unordered_set<Address> set{Address{"1.2.3.4"}, Address{"::1"},
                                  Address{"0:0::1"}};
  CHECK_EQ(set.size(), 2u);

  auto threw = false;
  try {
    Address bad{"1.2.3"};
  }
  catch (Addr::parse_error const& e) {
    threw = true;
    CHECK(e.which() == Addr::kind::ip);
    CHECK_EQ(std::string(e.what()), "invalid IP address syntax «1.2.3»");
  }
  CHECK(threw);

  std::string msg;
  Address     out;
  CHECK(!Address::validate("localhost", msg, out));
  CHECK_EQ(msg, "invalid IP address syntax «localhost»");
  CHECK(Address::validate("::", msg, out));
  CHECK(out.is_ipv6());
}
