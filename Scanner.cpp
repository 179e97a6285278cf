#include "Scanner.hpp"

#include <glog/logging.h>

Scanner::Scanner(std::string_view input)
  : input_(input)
  , in_{input.data(), input.size(), "addr"}
{
}

std::string_view Scanner::remaining() const
{
  return std::string_view(in_.current(), in_.size());
}

std::optional<char> Scanner::peek_char() const
{
  if (in_.empty())
    return std::nullopt;
  return in_.peek_char();
}

std::optional<char> Scanner::read_char()
{
  auto const c = peek_char();
  if (c)
    in_.bump(1);
  return c;
}

bool Scanner::read_given_char(char target)
{
  return read_atomically([target](Scanner& s) -> std::optional<char> {
           auto const c = s.read_char();
           if (c == target)
             return c;
           return std::nullopt;
         })
      .has_value();
}

void Scanner::log_failure_(Addr::kind k) const
{
  VLOG(1) << Addr::message(k, input_) << " stopped at offset "
          << (input_.size() - in_.size());
}

std::optional<unsigned> Scanner::digit_value_(char c, unsigned radix)
{
  unsigned d;
  if ('0' <= c && c <= '9')
    d = c - '0';
  else if ('a' <= c && c <= 'f')
    d = c - 'a' + 10;
  else if ('A' <= c && c <= 'F')
    d = c - 'A' + 10;
  else
    return std::nullopt;

  if (d >= radix)
    return std::nullopt;
  return d;
}
