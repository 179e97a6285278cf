#include "IA.hpp"

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  using IA::as_from_dotted_hex;
  using IA::as_to_dotted_hex;
  using IA::as_to_string;
  using IA::make_ia;

  static_assert(IA::isd_from_ia(make_ia(19, 0xffaa'0001'1067)) == 19);
  static_assert(IA::as_from_ia(make_ia(19, 0xffaa'0001'1067)) ==
                0xffaa'0001'1067);

  CHECK_EQ(make_ia(19, 281105609592935), 5629130167095399u);
  CHECK_EQ(IA::isd_from_ia(5629130167095399u), 19);
  CHECK_EQ(IA::as_from_ia(5629130167095399u), 281105609592935u);
  CHECK_EQ(IA::isd_from_ia(make_ia(65535, IA::max_as)), 65535);
  CHECK_EQ(IA::as_from_ia(make_ia(65535, IA::max_as)), IA::max_as);

  CHECK(as_from_dotted_hex("ffaa:1:1067") == 281105609592935u);
  CHECK(as_from_dotted_hex("FFAA:0001:1067") == 281105609592935u);
  CHECK(as_from_dotted_hex("1") == 1u);
  CHECK(as_from_dotted_hex("0:0:1") == 1u);
  CHECK(as_from_dotted_hex("::1") == 1u);
  CHECK(as_from_dotted_hex("1:2") == 0x1'0002u);
  CHECK(as_from_dotted_hex("ffff:ffff:ffff") == IA::max_as);
  CHECK(!as_from_dotted_hex(""));
  CHECK(!as_from_dotted_hex(":"));
  CHECK(!as_from_dotted_hex("12345"));
  CHECK(!as_from_dotted_hex("1:2:3:4"));
  CHECK(!as_from_dotted_hex("g"));

  CHECK_EQ(as_to_dotted_hex(0xffaa'0001'1067), "ffaa:1:1067");
  CHECK_EQ(as_to_dotted_hex(0xff00'0000'0110), "ff00:0:110");
  CHECK_EQ(as_to_dotted_hex(0xffff'ffff'ffff), "ffff:ffff:ffff");

  // Chunks are counted from the left of the unpadded hex text, so short
  // numbers come out misaligned, and an all-zero last chunk leaves a
  // trailing colon.
  CHECK_EQ(as_to_dotted_hex(0x1'0000'0001), "1000:0:1");
  CHECK_EQ(as_to_dotted_hex(0xffaa'0001'0000), "ffaa:1:0:");

  CHECK_EQ(as_to_string(0), "0");
  CHECK_EQ(as_to_string(64512), "64512");
  CHECK_EQ(as_to_string(IA::max_bgp_as), "4294967295");
  CHECK_EQ(as_to_string(0xffaa'0001'1067), "ffaa:1:1067");

  CHECK_EQ(IA::to_string(make_ia(19, 0xffaa'0001'1067)), "19-ffaa:1:1067");
  CHECK_EQ(IA::to_string(make_ia(1, 64512)), "1-64512");

  CHECK(IA::parse("19-ffaa:1:1067") == make_ia(19, 0xffaa'0001'1067));
  CHECK(IA::parse("1-ff00:0:110") == make_ia(1, 0xff00'0000'0110));
  CHECK(IA::parse("0-0") == make_ia(0, 0));
  CHECK(IA::parse("65535-ffff:ffff:ffff") == make_ia(65535, IA::max_as));
  CHECK(IA::parse("000019-1") == make_ia(19, 1));

  // One group is short for 0:0:group.
  CHECK(IA::parse("1-ff00") == make_ia(1, 0xff00));
  CHECK(IA::parse("1-fc00") == make_ia(1, 64512));

  CHECK(!IA::parse("1-1:2"));      // two groups
  CHECK(!IA::parse("1-1:2:3:4"));  // four
  CHECK(!IA::parse("1-12345"));    // five digit group
  CHECK(!IA::parse("1-"));
  CHECK(!IA::parse("-1"));
  CHECK(!IA::parse("1"));
  CHECK(!IA::parse("65536-1"));    // ISD too big
  CHECK(!IA::parse("0000001-1"));  // seven digit ISD
  CHECK(!IA::parse("1-1:2:"));
  CHECK(!IA::parse("1-:1"));
  CHECK(!IA::parse(" 1-1"));

  // Decimal output of a BGP range AS doesn't read back as the same number.
  CHECK(!IA::parse("1-64512"));
  CHECK(IA::parse("1-4096") == make_ia(1, 0x4096));
}
