// Parse addresses and print them in canonical form.
//
//   addr --kind=scion 19-ffaa:1:1067,127.0.0.1
//   echo '[::1]:53' | addr --width=20 --align=right

#include "IA.hpp"
#include "IP.hpp"
#include "IP4.hpp"
#include "IP6.hpp"
#include "L3.hpp"
#include "SCION.hpp"
#include "SockAddr.hpp"

#include <iostream>
#include <string>
#include <string_view>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <fmt/format.h>

DEFINE_string(kind,
              "socket",
              "grammar to parse with: ip, ipv4, ipv6, scion, l3, socket, "
              "socket_v4, socket_v6, socket_scion, or ia");
DEFINE_uint64(width, 0, "pad the canonical text to this many columns");
DEFINE_string(align, "left", "alignment within --width: left, right, center");

namespace {
char align_char()
{
  if (FLAGS_align == "left")
    return '<';
  if (FLAGS_align == "right")
    return '>';
  if (FLAGS_align == "center")
    return '^';
  LOG(FATAL) << "unknown --align=" << FLAGS_align;
  return '<';
}

template <typename T>
void print(T const& value)
{
  if (FLAGS_width == 0) {
    std::cout << fmt::format("{}", value) << '\n';
    return;
  }
  auto const pattern = fmt::format("{{:{}{}}}", align_char(), FLAGS_width);
  std::cout << fmt::format(fmt::runtime(pattern), value) << '\n';
}

template <typename T>
bool show(std::string_view input)
{
  T          addr;
  std::string msg;
  if (!T::validate(input, msg, addr)) {
    std::cerr << msg << '\n';
    return false;
  }
  print(addr);
  return true;
}

bool show_ia(std::string_view input)
{
  auto const ia = IA::parse(input);
  if (!ia) {
    std::cerr << "invalid ISD-AS syntax «" << input << "»\n";
    return false;
  }
  print(IA::to_string(*ia));
  return true;
}

bool do_addr(std::string_view input)
{
  if (FLAGS_kind == "ip")
    return show<IP::Address>(input);
  if (FLAGS_kind == "ipv4")
    return show<IP4::Address>(input);
  if (FLAGS_kind == "ipv6")
    return show<IP6::Address>(input);
  if (FLAGS_kind == "scion")
    return show<SCION::Address>(input);
  if (FLAGS_kind == "l3")
    return show<L3::Address>(input);
  if (FLAGS_kind == "socket")
    return show<SockAddr::Address>(input);
  if (FLAGS_kind == "socket_v4")
    return show<SockAddr::V4>(input);
  if (FLAGS_kind == "socket_v6")
    return show<SockAddr::V6>(input);
  if (FLAGS_kind == "socket_scion")
    return show<SockAddr::Scion>(input);
  if (FLAGS_kind == "ia")
    return show_ia(input);
  LOG(FATAL) << "unknown --kind=" << FLAGS_kind;
  return false;
}
} // namespace

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  auto ok = true;

  if (argc > 1) {
    for (auto i = 1; i < argc; ++i)
      ok = do_addr(argv[i]) && ok;
  }
  else {
    std::string line;
    while (std::getline(std::cin, line))
      ok = do_addr(line) && ok;
  }

  return ok ? 0 : 1;
}
