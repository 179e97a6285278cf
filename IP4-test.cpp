#include "IP4.hpp"

#include "Addr-error.hpp"
#include "IP6.hpp"

#include <string>
#include <unordered_set>

#include <glog/logging.h>

#include <fmt/format.h>

int main(int argc, char const* argv[])
{
  using IP4::Address;
  using IP4::is_address;

  CHECK(is_address("0.0.0.0"));
  CHECK(is_address("69.0.0.0"));
  CHECK(is_address("160.0.0.0"));
  CHECK(is_address("250.0.0.0"));
  CHECK(is_address("255.0.0.1"));
  CHECK(is_address("9.9.9.9"));
  CHECK(is_address("99.99.99.99"));
  CHECK(is_address("127.0.0.1"));
  CHECK(is_address("255.255.255.255"));

  CHECK(!is_address("127.0.0.1."));
  CHECK(!is_address(".127.0.0.1"));
  CHECK(!is_address("1..2.3"));
  CHECK(!is_address("1.2.3"));
  CHECK(!is_address("1.2.3.4.5"));
  CHECK(!is_address(" 1.2.3.4"));
  CHECK(!is_address("1.2.3.4 "));
  CHECK(!is_address("1.2.3.-4"));
  CHECK(!is_address("foo.bar"));
  CHECK(!is_address(""));

  // No leading zeros, "010" might be taken as octal:
  CHECK(!is_address("01.0.0.1"));
  CHECK(!is_address("001.001.001.001"));
  CHECK(!is_address("0.0.0.00"));
  CHECK(!is_address("0001.0.0.0"));

  CHECK(!is_address("256.0.0.0"));
  CHECK(!is_address("260.0.0.0"));
  CHECK(!is_address("300.0.0.0"));
  CHECK(!is_address("1000.0.0.0"));
  CHECK(!is_address("1.256.0.0"));
  CHECK(!is_address("1.1.300.0"));
  CHECK(!is_address("1.1.1.1000"));

  // Longer than any address can be.
  CHECK(!is_address("255.255.255.2555"));

  Address const addr{"108.83.36.113"};
  CHECK_EQ(addr, (Address{108, 83, 36, 113}));
  CHECK_EQ(addr.to_bits(), 0x6c532471u);
  CHECK_EQ(Address::from_bits(0x7f000001), Address::localhost());
  CHECK_EQ(addr.to_string(), "108.83.36.113");
  CHECK_EQ(fmt::format("{}", addr), "108.83.36.113");

  Address const short_addr{1, 2, 3, 4};
  CHECK_EQ(fmt::format("{:>15}", short_addr), "        1.2.3.4");
  CHECK_EQ(fmt::format("{:<9}|", short_addr), "1.2.3.4  |");
  CHECK_EQ(fmt::format("{:*^11}", short_addr), "**1.2.3.4**");
  CHECK_EQ(fmt::format("{:.3}", short_addr), "1.2");

  auto threw = false;
  try {
    Address bad{"1.2.3.256"};
  }
  catch (Addr::parse_error const& e) {
    threw = true;
    CHECK(e.which() == Addr::kind::ipv4);
    CHECK_EQ(std::string(e.what()), "invalid IPv4 address syntax «1.2.3.256»");
  }
  CHECK(threw);

  std::string msg;
  Address     out;
  CHECK(!Address::validate("1.2.3", msg, out));
  CHECK_EQ(msg, "invalid IPv4 address syntax «1.2.3»");
  CHECK(Address::validate("10.0.0.1", msg, out));
  CHECK_EQ(out, (Address{10, 0, 0, 1}));

  CHECK_LT((Address{1, 2, 3, 4}), (Address{1, 2, 3, 5}));
  CHECK_LT((Address{1, 2, 3, 255}), (Address{1, 2, 4, 0}));
  CHECK_NE(Address::unspecified(), Address::broadcast());

  std::unordered_set<Address> set{Address{1, 2, 3, 4}, Address{"1.2.3.4"}};
  CHECK_EQ(set.size(), 1u);

  CHECK(Address::unspecified().is_unspecified());
  CHECK((Address{127, 1, 2, 3}.is_loopback()));
  CHECK((Address{169, 254, 10, 65}.is_link_local()));
  CHECK((Address{224, 0, 0, 1}.is_multicast()));
  CHECK((!Address{240, 0, 0, 1}.is_multicast()));
  CHECK(Address::broadcast().is_broadcast());
  CHECK((Address{192, 0, 2, 1}.is_documentation()));
  CHECK((Address{198, 51, 100, 65}.is_documentation()));
  CHECK((Address{203, 0, 113, 6}.is_documentation()));
  CHECK((Address{100, 64, 0, 1}.is_shared()));
  CHECK((!Address{100, 128, 0, 1}.is_shared()));
  CHECK((Address{198, 19, 255, 255}.is_benchmarking()));
  CHECK((!Address{198, 20, 0, 0}.is_benchmarking()));
  CHECK((Address{250, 10, 20, 30}.is_reserved()));
  CHECK(!Address::broadcast().is_reserved());

  CHECK((!Address{1, 2, 3, 4}.is_private()));
  CHECK((!Address{127, 0, 0, 1}.is_private()));
  CHECK((Address{10, 0, 0, 1}.is_private()));
  CHECK((!Address{172, 15, 0, 1}.is_private()));
  CHECK((Address{172, 16, 0, 1}.is_private()));
  CHECK((Address{172, 31, 255, 255}.is_private()));
  CHECK((!Address{172, 32, 0, 1}.is_private()));
  CHECK((Address{192, 168, 0, 1}.is_private()));

  CHECK((Address{8, 8, 8, 8}.is_global()));
  CHECK((Address{1, 1, 1, 1}.is_global()));
  CHECK((Address{192, 0, 0, 9}.is_global()));
  CHECK((!Address{192, 0, 0, 8}.is_global()));
  CHECK((!Address{0, 1, 2, 3}.is_global()));
  CHECK((!Address{10, 0, 0, 1}.is_global()));
  CHECK((!Address{127, 0, 0, 1}.is_global()));
  CHECK((!Address{100, 64, 0, 1}.is_global()));
  CHECK((!Address{198, 18, 0, 1}.is_global()));
  CHECK((!Address{240, 0, 0, 1}.is_global()));
  CHECK(!Address::broadcast().is_global());
  CHECK((!Address{192, 0, 2, 1}.is_global()));

  CHECK_EQ((Address{192, 0, 2, 255}.to_ipv6_mapped()),
           (IP6::Address{0, 0, 0, 0, 0, 0xffff, 0xc000, 0x2ff}));
  CHECK_EQ((Address{192, 0, 2, 255}.to_ipv6_compatible()),
           (IP6::Address{0, 0, 0, 0, 0, 0, 0xc000, 0x2ff}));

  CHECK_EQ((Address{192, 168, 1, 77} & Address{255, 255, 255, 0}),
           (Address{192, 168, 1, 0}));
  CHECK_EQ((Address{192, 168, 1, 0} | Address{0, 0, 0, 77}),
           (Address{192, 168, 1, 77}));
  CHECK_EQ((~Address{255, 255, 255, 0}), (Address{0, 0, 0, 255}));
}
