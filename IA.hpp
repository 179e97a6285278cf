#ifndef IA_DOT_HPP
#define IA_DOT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

class Scanner;

// SCION ISD-AS numbers.  The pair is packed into 64 bits: ISD in the top
// 16, AS in the low 48.

namespace IA {

using isd_t = uint16_t;
using as_t  = uint64_t;
using ia_t  = uint64_t;

auto constexpr max_as{as_t{0xffff'ffff'ffff}};

// Largest AS number a BGP speaker can have, these print in decimal.
auto constexpr max_bgp_as{as_t{0xffff'ffff}};

// "65535-ffff:ffff:ffff"
auto constexpr max_as_text_size{std::size_t(14)};
auto constexpr max_text_size{std::size_t(5 + 1 + max_as_text_size)};

constexpr ia_t make_ia(isd_t isd, as_t as) { return (ia_t(isd) << 48) | as; }

constexpr as_t  as_from_ia(ia_t ia) { return (ia << 16) >> 16; }
constexpr isd_t isd_from_ia(ia_t ia) { return isd_t(ia >> 48); }

// "ffaa:1:1067" to 0xffaa'0001'1067
auto as_from_dotted_hex(std::string_view text) -> std::optional<as_t>;

// Chunks the unpadded hex text of as into groups of four, counting from
// the left, drops leading zeros of each chunk and prints an all-zero chunk
// as "0:".
auto as_to_dotted_hex(as_t as) -> std::string;

// Decimal for BGP range numbers, as_to_dotted_hex() above that.
auto as_to_string(as_t as) -> std::string;

// "19-ffaa:1:1067"
auto to_string(ia_t ia) -> std::string;

auto read_isd(Scanner& s) -> std::optional<isd_t>;
auto read_as(Scanner& s) -> std::optional<as_t>;
auto read_ia(Scanner& s) -> std::optional<ia_t>;

auto parse(std::string_view text) -> std::optional<ia_t>;

} // namespace IA

#endif // IA_DOT_HPP
