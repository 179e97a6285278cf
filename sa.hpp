#ifndef SA_DOT_HPP_INCLUDED
#define SA_DOT_HPP_INCLUDED

#include "IP4.hpp"
#include "IP6.hpp"
#include "SockAddr.hpp"

#include <optional>

#include <arpa/inet.h>
#include <netinet/in.h>

// Conversions to and from the socket API structures.

namespace sa {
union sockaddrs {
  struct sockaddr         addr;
  struct sockaddr_in      addr_in;
  struct sockaddr_in6     addr_in6;
  struct sockaddr_storage addr_storage;
};

auto to_in_addr(IP4::Address const& addr) -> in_addr;
auto from_in_addr(in_addr const& addr) -> IP4::Address;

auto to_in6_addr(IP6::Address const& addr) -> in6_addr;
auto from_in6_addr(in6_addr const& addr) -> IP6::Address;

auto to_sockaddrs(SockAddr::V4 const& addr) -> sockaddrs;
auto to_sockaddrs(SockAddr::V6 const& addr) -> sockaddrs;

// AF_INET and AF_INET6 only.
auto from_sockaddr(sockaddr const* addr) -> std::optional<SockAddr::Address>;
} // namespace sa

#endif // SA_DOT_HPP_INCLUDED
