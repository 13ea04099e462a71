#include "table/table_text.hpp"

#include <cctype>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace bpcal {
namespace table {

namespace {
inline auto is_space(char c) -> bool { return std::isspace(static_cast<unsigned char>(c)); }
}  // namespace

auto split_whitespace(std::string_view s) -> std::vector<std::string_view> {
  std::vector<std::string_view> tokens;
  std::size_t pos = 0;
  while (pos < s.size()) {
    while (pos < s.size() && is_space(s[pos])) ++pos;
    const auto begin = pos;
    while (pos < s.size() && !is_space(s[pos])) ++pos;
    if (pos > begin) tokens.emplace_back(s.substr(begin, pos - begin));
  }
  return tokens;
}

auto leading_token(std::string_view s) -> std::string_view {
  std::size_t begin = 0;
  while (begin < s.size() && is_space(s[begin])) ++begin;
  auto end = begin;
  while (end < s.size() && !is_space(s[end])) ++end;
  return s.substr(begin, end - begin);
}

auto split_data_line(const std::string& line) -> std::optional<DataLineFields> {
  static const std::regex prefixPattern(R"(^\s*(\S+)\s+(\S+)\s+(\d+)$)");

  const auto delim = line.find('|');
  if (delim == std::string::npos) return std::nullopt;

  const auto prefix = line.substr(0, delim);
  std::smatch match;
  if (!std::regex_match(prefix, match, prefixPattern)) return std::nullopt;

  return DataLineFields{match[1].str(), match[2].str(), match[3].str(), line.substr(delim + 1)};
}

}  // namespace table
}  // namespace bpcal
