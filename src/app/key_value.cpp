#include "key_value.hpp"
#include <charconv>
#include <cstdio>
#include <system_error>
#include <utility>

namespace markscan::app::detail {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

namespace {

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

std::string_view trimmed_view(std::string_view text) {
  const auto start = text.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(start, end - start + 1);
}

}  // namespace

std::vector<KeyValue> parse_key_values(std::istream& in) {
  std::vector<KeyValue> out;
  std::string line;
  std::string key;
  std::string value;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (const auto hash = line.find('#'); hash != std::string::npos) {
      line.erase(hash);
    }
    trim(line);
    if (line.empty()) continue;
    if (!parse_line(line, key, value)) continue;
    out.push_back(KeyValue{key, value, line_no});
  }
  return out;
}

std::optional<double> parse_double(std::string_view text) {
  text = trimmed_view(text);
  if (!text.empty() && text.front() == '+') text.remove_prefix(1);
  double v = 0.0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
  if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
    return std::nullopt;
  }
  return v;
}

std::optional<long> parse_long(std::string_view text) {
  text = trimmed_view(text);
  long v = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
  if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
    return std::nullopt;
  }
  return v;
}

std::optional<bool> parse_bool(std::string_view text) {
  text = trimmed_view(text);
  if (text == "true" || text == "1" || text == "yes" || text == "on") return true;
  if (text == "false" || text == "0" || text == "no" || text == "off") return false;
  return std::nullopt;
}

std::vector<std::string> split_list(std::string_view text) {
  std::vector<std::string> items;
  if (trimmed_view(text).empty()) return items;
  std::size_t start = 0;
  while (true) {
    const auto comma = text.find(',', start);
    std::string item(text.substr(start, comma == std::string_view::npos ? std::string_view::npos
                                                                        : comma - start));
    trim(item);
    items.push_back(std::move(item));
    if (comma == std::string_view::npos) break;
    start = comma + 1;
  }
  return items;
}

std::optional<std::vector<double>> parse_doubles(std::string_view text, std::size_t count) {
  const auto items = split_list(text);
  if (items.size() != count) return std::nullopt;
  std::vector<double> out;
  out.reserve(count);
  for (const auto& item : items) {
    const auto v = parse_double(item);
    if (!v) return std::nullopt;
    out.push_back(*v);
  }
  return out;
}

std::string format_double(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.17g", v);
  return buf;
}

}  // namespace markscan::app::detail
