#include "IA.hpp"

#include "Addr-error.hpp"
#include "Scanner.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <vector>

#include <glog/logging.h>

#include <fmt/format.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

namespace IA {

auto as_from_dotted_hex(std::string_view text) -> std::optional<as_t>
{
  std::vector<std::string> tokens;
  boost::algorithm::split(tokens, text, boost::algorithm::is_any_of(":"),
                          boost::algorithm::token_compress_on);
  std::erase_if(tokens, [](auto const& tok) { return tok.empty(); });

  if (tokens.empty() || tokens.size() > 3) {
    VLOG(1) << "AS «" << text << "» needs one to three groups";
    return {};
  }

  std::string hex;
  for (auto const& tok : tokens) {
    if (tok.size() > 4 ||
        !std::all_of(tok.begin(), tok.end(), [](unsigned char c) {
          return std::isxdigit(c);
        })) {
      VLOG(1) << "bad AS group «" << tok << "» in «" << text << "»";
      return {};
    }
    hex += fmt::format("{:0>4}", tok);
  }

  as_t as{};
  auto const [ptr, ec] =
      std::from_chars(hex.data(), hex.data() + hex.size(), as, 16);
  CHECK(ec == std::errc{} && ptr == hex.data() + hex.size())
      << "hex digits «" << hex << "» did not convert";
  return as;
}

auto as_to_dotted_hex(as_t as) -> std::string
{
  auto const hex = fmt::format("{:x}", as);

  std::string ret;
  auto        begin = true;
  auto        zeros = 0;
  for (std::size_t pos = 0; pos < hex.size(); ++pos) {
    auto const c = hex[pos];
    if (pos != 0 && pos % 4 == 0 && !begin) {
      ret += ':';
      zeros = 0;
      begin = true;
    }
    if (!begin) {
      ret += c;
      continue;
    }
    // Leading zeros of a chunk are dropped, a chunk of nothing but zeros
    // is written "0:".
    if (c == '0') {
      if (++zeros == 4) {
        ret += "0:";
        zeros = 0;
      }
      continue;
    }
    ret += c;
    zeros = 0;
    begin = false;
  }
  return ret;
}

auto as_to_string(as_t as) -> std::string
{
  if (as <= max_bgp_as)
    return fmt::format("{}", as);
  return as_to_dotted_hex(as);
}

auto to_string(ia_t ia) -> std::string
{
  return fmt::format("{}-{}", isd_from_ia(ia), as_to_string(as_from_ia(ia)));
}

auto read_isd(Scanner& s) -> std::optional<isd_t>
{
  return s.read_number<isd_t>(10, 6, true);
}

// One group is the short form of 0:0:group; three groups is the full
// form.  Two groups could be either, so that's an error.
auto read_as(Scanner& s) -> std::optional<as_t>
{
  return s.read_atomically([](Scanner& s) -> std::optional<as_t> {
    std::array<uint16_t, 3> groups{};
    std::size_t             n = 0;
    for (; n < groups.size(); ++n) {
      auto const group = s.read_separator(':', n, [](Scanner& s) {
        return s.read_number<uint16_t>(16, 4, true);
      });
      if (!group)
        break;
      groups[n] = *group;
    }

    switch (n) {
    case 1:
      return as_from_dotted_hex(
          fmt::format("{:04x}:{:04x}:{:04x}", 0, 0, groups[0]));
    case 3:
      return as_from_dotted_hex(fmt::format("{:04x}:{:04x}:{:04x}", groups[0],
                                            groups[1], groups[2]));
    }
    return {};
  });
}

auto read_ia(Scanner& s) -> std::optional<ia_t>
{
  return s.read_atomically([](Scanner& s) -> std::optional<ia_t> {
    auto const isd = read_isd(s);
    if (!isd || !s.read_given_char('-'))
      return {};
    auto const as = read_as(s);
    if (!as)
      return {};
    return make_ia(*isd, *as);
  });
}

auto parse(std::string_view text) -> std::optional<ia_t>
{
  Scanner s{text};
  return s.parse_with(read_ia, Addr::kind::scion);
}

} // namespace IA
