#include "sa.hpp"

#include <cstring>

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  auto const lo = sa::to_in_addr(IP4::Address::localhost());
  CHECK_EQ(lo.s_addr, htonl(INADDR_LOOPBACK));
  CHECK_EQ(sa::from_in_addr(lo), IP4::Address::localhost());

  in_addr any{};
  any.s_addr = htonl(INADDR_ANY);
  CHECK_EQ(sa::from_in_addr(any), IP4::Address::unspecified());

  auto const lo6 = sa::to_in6_addr(IP6::Address::localhost());
  CHECK_EQ(0, std::memcmp(&lo6, &in6addr_loopback, sizeof lo6));
  CHECK_EQ(sa::from_in6_addr(in6addr_loopback), IP6::Address::localhost());

  for (auto const text : {"2001:db8::1", "::ffff:1.2.3.4", "::1.2.3.4",
                          "fe80::1:2:3:4", "1:2:3:4:5:6:7:8"}) {
    IP6::Address const addr{text};
    auto const         native = sa::to_in6_addr(addr);
    CHECK_EQ(0, std::memcmp(native.s6_addr, addr.octets().data(), 16));
    CHECK_EQ(sa::from_in6_addr(native), addr);
  }

  SockAddr::V4 const v4{"10.1.2.3:8080"};
  auto const         sa4 = sa::to_sockaddrs(v4);
  CHECK_EQ(sa4.addr_in.sin_family, AF_INET);
  CHECK_EQ(ntohs(sa4.addr_in.sin_port), 8080);
  auto const back4 = sa::from_sockaddr(&sa4.addr);
  CHECK(back4);
  CHECK_EQ(*back4, SockAddr::Address{v4});

  SockAddr::V6 const v6{IP6::Address{"fe80::1"}, 443, 5, 3};
  auto const         sa6 = sa::to_sockaddrs(v6);
  CHECK_EQ(sa6.addr_in6.sin6_family, AF_INET6);
  CHECK_EQ(ntohs(sa6.addr_in6.sin6_port), 443);
  CHECK_EQ(sa6.addr_in6.sin6_scope_id, 3u);
  auto const back6 = sa::from_sockaddr(&sa6.addr);
  CHECK(back6);
  CHECK(back6->is_ipv6());
  CHECK_EQ(back6->v6()->scope_id(), 3u);
  CHECK_EQ(back6->v6()->flowinfo(), 5u);
  CHECK_EQ(*back6, SockAddr::Address{v6});

  sa::sockaddrs unix_sa{};
  unix_sa.addr.sa_family = AF_UNIX;
  CHECK(!sa::from_sockaddr(&unix_sa.addr));
}
