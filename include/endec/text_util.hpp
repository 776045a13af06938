/**
 * @file text_util.hpp
 * @brief Whitespace trimming and joining shared by the assembler and resolver.
 */
#ifndef ENDEC_TEXT_UTIL_HPP
#define ENDEC_TEXT_UTIL_HPP

#include <string>
#include <string_view>
#include <vector>

namespace endec {

inline bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

/// View of @p s without leading/trailing ASCII whitespace.
inline std::string_view trim(std::string_view s) {
  size_t b = 0, e = s.size();
  while (b < e && is_space(s[b])) ++b;
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

/// Join @p parts with @p sep; empty parts are skipped so no double separators appear.
inline std::string join_nonempty(const std::vector<std::string>& parts, std::string_view sep = " ") {
  std::string out;
  for (const auto& p : parts) {
    if (p.empty()) continue;
    if (!out.empty()) out += sep;
    out += p;
  }
  return out;
}

} // namespace endec

#endif // ENDEC_TEXT_UTIL_HPP
