#include "sa.hpp"

#include <glog/logging.h>

namespace sa {

// Everything goes through the text form, inet_pton() and inet_ntop() are
// the reference for what the socket layer accepts.

auto to_in_addr(IP4::Address const& addr) -> in_addr
{
  auto const str = addr.to_string();
  in_addr    ret{};
  CHECK_EQ(1, inet_pton(AF_INET, str.c_str(), &ret)) << str;
  return ret;
}

auto from_in_addr(in_addr const& addr) -> IP4::Address
{
  char str[INET_ADDRSTRLEN];
  PCHECK(inet_ntop(AF_INET, &addr, str, sizeof str));
  auto const ret = IP4::Address::parse(str);
  CHECK(ret) << "inet_ntop gave us «" << str << "»";
  return *ret;
}

auto to_in6_addr(IP6::Address const& addr) -> in6_addr
{
  static_assert(sizeof(in6_addr) == 16, "in6_addr is the wrong size");

  auto const str = addr.to_string();
  in6_addr   ret{};
  CHECK_EQ(1, inet_pton(AF_INET6, str.c_str(), &ret)) << str;
  return ret;
}

auto from_in6_addr(in6_addr const& addr) -> IP6::Address
{
  char str[INET6_ADDRSTRLEN];
  PCHECK(inet_ntop(AF_INET6, &addr, str, sizeof str));
  auto const ret = IP6::Address::parse(str);
  CHECK(ret) << "inet_ntop gave us «" << str << "»";
  return *ret;
}

auto to_sockaddrs(SockAddr::V4 const& addr) -> sockaddrs
{
  sockaddrs ret{};
  ret.addr_in.sin_family = AF_INET;
  ret.addr_in.sin_port   = htons(addr.port());
  ret.addr_in.sin_addr   = to_in_addr(addr.ip());
  return ret;
}

auto to_sockaddrs(SockAddr::V6 const& addr) -> sockaddrs
{
  sockaddrs ret{};
  ret.addr_in6.sin6_family   = AF_INET6;
  ret.addr_in6.sin6_port     = htons(addr.port());
  ret.addr_in6.sin6_flowinfo = addr.flowinfo();
  ret.addr_in6.sin6_addr     = to_in6_addr(addr.ip());
  ret.addr_in6.sin6_scope_id = addr.scope_id();
  return ret;
}

auto from_sockaddr(sockaddr const* addr) -> std::optional<SockAddr::Address>
{
  switch (addr->sa_family) {
  case AF_INET: {
    auto const in = reinterpret_cast<sockaddr_in const*>(addr);
    return SockAddr::V4{from_in_addr(in->sin_addr), ntohs(in->sin_port)};
  }
  case AF_INET6: {
    auto const in6 = reinterpret_cast<sockaddr_in6 const*>(addr);
    return SockAddr::V6{from_in6_addr(in6->sin6_addr), ntohs(in6->sin6_port),
                        in6->sin6_flowinfo, in6->sin6_scope_id};
  }
  }
  LOG(WARNING) << "unsupported address family " << addr->sa_family;
  return {};
}

} // namespace sa
