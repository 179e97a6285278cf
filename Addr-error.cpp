#include "Addr-error.hpp"

#include <glog/logging.h>

#include <fmt/format.h>

namespace Addr {

auto description(kind k) -> std::string_view
{
  switch (k) {
  case kind::l3: return "invalid L3 address syntax";
  case kind::scion: return "invalid SCION address syntax";
  case kind::ip: return "invalid IP address syntax";
  case kind::ipv4: return "invalid IPv4 address syntax";
  case kind::ipv6: return "invalid IPv6 address syntax";
  case kind::socket: return "invalid socket address syntax";
  case kind::socket_scion: return "invalid SCION socket address syntax";
  case kind::socket_v4: return "invalid IPv4 socket address syntax";
  case kind::socket_v6: return "invalid IPv6 socket address syntax";
  }
  LOG(FATAL) << "unknown address kind " << static_cast<int>(k);
  return "";
}

auto message(kind k, std::string_view input) -> std::string
{
  return fmt::format("{} «{}»", description(k), input);
}

parse_error::parse_error(kind k, std::string_view input)
  : std::invalid_argument(message(k, input))
  , kind_(k)
{
}

} // namespace Addr
