#pragma once

#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace markscan::app::detail {

/// One `key = value` line; line is 1-based.
struct KeyValue {
  std::string key;
  std::string value;
  int line{0};
};

void trim(std::string& s);

/// Skips blank lines, '#' comments (whole-line or trailing) and lines
/// without '='.
std::vector<KeyValue> parse_key_values(std::istream& in);

std::optional<double> parse_double(std::string_view text);
std::optional<long> parse_long(std::string_view text);
std::optional<bool> parse_bool(std::string_view text);

/// Comma-separated list, each item trimmed.
std::vector<std::string> split_list(std::string_view text);

/// Comma-separated numbers; nullopt unless exactly count items parse.
std::optional<std::vector<double>> parse_doubles(std::string_view text, std::size_t count);

/// 17 significant digits; reads back to the same double.
std::string format_double(double v);

}  // namespace markscan::app::detail
