#include "Scanner.hpp"

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  auto const u8 = [](Scanner& s) {
    return s.read_number<uint8_t>(10, 3, false);
  };

  {
    Scanner    s{"123abc"};
    auto const n = s.read_number<uint8_t>(10, 3, false);
    CHECK(n);
    CHECK_EQ(*n, 123);
    CHECK_EQ(s.remaining(), "abc");
  }

  // Failed reads leave the cursor alone.
  {
    Scanner s{"256"};
    CHECK(!s.read_number<uint8_t>(10, 3, false));
    CHECK_EQ(s.remaining(), "256");
  }
  {
    Scanner s{"0000"};
    CHECK(!s.read_number<uint8_t>(10, 3, true));
    CHECK_EQ(s.remaining(), "0000");
  }
  {
    Scanner s{"x1"};
    CHECK(!s.read_number<uint32_t>(10, std::nullopt, true));
    CHECK_EQ(s.remaining(), "x1");
  }

  // Leading zeros.
  {
    Scanner s{"012"};
    CHECK(!s.read_number<uint8_t>(10, 3, false));
    auto const n = s.read_number<uint8_t>(10, 3, true);
    CHECK(n);
    CHECK_EQ(*n, 12);
    CHECK(s.empty());
  }
  {
    Scanner    s{"0."};
    auto const n = s.read_number<uint8_t>(10, 3, false);
    CHECK(n);
    CHECK_EQ(*n, 0);
    CHECK_EQ(s.remaining(), ".");
  }

  // Hex, either case.
  {
    Scanner    s{"fFfF:"};
    auto const n = s.read_number<uint16_t>(16, 4, true);
    CHECK(n);
    CHECK_EQ(*n, 0xffff);
    CHECK_EQ(s.remaining(), ":");
  }
  {
    Scanner s{"10000"};
    CHECK(!s.read_number<uint16_t>(16, std::nullopt, true));
    auto const n = s.read_number<uint32_t>(16, std::nullopt, true);
    CHECK(n);
    CHECK_EQ(*n, 0x10000u);
  }
  {
    // Hex digits are not decimal digits.
    Scanner    s{"12ab"};
    auto const n = s.read_number<uint16_t>(10, std::nullopt, true);
    CHECK(n);
    CHECK_EQ(*n, 12);
    CHECK_EQ(s.remaining(), "ab");
  }
  {
    Scanner    s{"4294967295"};
    auto const n = s.read_number<uint32_t>(10, std::nullopt, true);
    CHECK(n);
    CHECK_EQ(*n, 4294967295u);
  }
  {
    Scanner s{"4294967296"};
    CHECK(!s.read_number<uint32_t>(10, std::nullopt, true));
  }

  {
    Scanner s{"ab"};
    CHECK(s.peek_char() == 'a');
    CHECK(!s.read_given_char('b'));
    CHECK_EQ(s.remaining(), "ab");
    CHECK(s.read_given_char('a'));
    CHECK(s.read_char() == 'b');
    CHECK(!s.peek_char());
    CHECK(!s.read_char());
    CHECK(s.empty());
  }

  // The separator comes before every item but the first.
  {
    Scanner s{"1:2"};
    CHECK(s.read_separator(':', 0, u8) == uint8_t(1));
    CHECK(s.read_separator(':', 1, u8) == uint8_t(2));
    CHECK(s.empty());
  }
  {
    Scanner s{":x"};
    CHECK(!s.read_separator(':', 1, u8));
    CHECK_EQ(s.remaining(), ":x");
    CHECK(!s.read_separator(':', 0, u8));
    CHECK_EQ(s.remaining(), ":x");
  }

  {
    Scanner    s{"abc"};
    auto const r = s.read_atomically([](Scanner& s) -> std::optional<char> {
      s.read_char();
      s.read_char();
      return std::nullopt;
    });
    CHECK(!r);
    CHECK_EQ(s.remaining(), "abc");
  }

  // parse_with wants everything consumed.
  {
    Scanner s{"12 "};
    CHECK(!s.parse_with(u8, Addr::kind::ipv4));
  }
  {
    Scanner    s{"12"};
    auto const n = s.parse_with(u8, Addr::kind::ipv4);
    CHECK(n);
    CHECK_EQ(*n, 12);
  }
  {
    Scanner s{""};
    CHECK(!s.parse_with(u8, Addr::kind::ipv4));
  }
}
