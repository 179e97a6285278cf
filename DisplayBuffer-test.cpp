#include "DisplayBuffer.hpp"

#include "IA.hpp"
#include "IP.hpp"
#include "IP4.hpp"
#include "IP6.hpp"
#include "SCION.hpp"
#include "SockAddr.hpp"

#include <string>

#include <glog/logging.h>

#include <fmt/format.h>

// The longest text of each type has to fit its staging buffer exactly.

template <std::size_t N, typename T>
void check_fits(T const& addr, std::size_t expected)
{
  DisplayBuffer<N> buf;
  addr.format_to(buf.out());
  CHECK_EQ(buf.view().size(), expected) << buf.view();
  CHECK_EQ(buf.view(), addr.to_string());
  CHECK_EQ(fmt::format("{}", addr), addr.to_string());
}

int main(int argc, char const* argv[])
{
  {
    DisplayBuffer<8> buf;
    CHECK_EQ(buf.view(), "");
    fmt::format_to(buf.out(), "{}:{}", "ab", 12);
    CHECK_EQ(buf.view(), "ab:12");
    CHECK_EQ(DisplayBuffer<8>::capacity(), 8u);
  }

  auto const v4 = IP4::Address::broadcast();
  check_fits<IP4::max_text_size>(v4, IP4::max_text_size);

  IP6::Address const v6{"ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff"};
  check_fits<IP6::max_text_size>(v6, IP6::max_text_size);
  check_fits<IP::max_text_size>(IP::Address{v6}, IP::max_text_size);

  CHECK_EQ(IA::as_to_string(IA::max_as).size(), IA::max_as_text_size);
  CHECK_EQ(IA::to_string(IA::make_ia(65535, IA::max_as)).size(),
           IA::max_text_size);

  SCION::Address const scion{65535, IA::max_as, v6};
  check_fits<SCION::max_text_size>(scion, SCION::max_text_size);

  SockAddr::V4 const sock4{v4, 65535};
  check_fits<SockAddr::v4_max_text_size>(sock4, SockAddr::v4_max_text_size);

  SockAddr::V6 const sock6{v6, 65535, 0, 4294967295u};
  check_fits<SockAddr::v6_max_text_size>(sock6, SockAddr::v6_max_text_size);

  SockAddr::Scion const sock_scion{scion, 65535};
  check_fits<SockAddr::scion_max_text_size>(sock_scion,
                                            SockAddr::scion_max_text_size);
  check_fits<SockAddr::max_text_size>(SockAddr::Address{sock_scion},
                                      SockAddr::max_text_size);
}
