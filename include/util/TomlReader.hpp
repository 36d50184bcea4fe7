#pragma once

#include <cctype>
#include <charconv>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace proctally::util {

// Reader for the flat TOML subset used by config.toml: [section] headers,
// key = value lines, "quoted" strings, and # comments (whole-line or
// trailing). Arrays, inline tables and multi-line strings are not supported;
// such lines are skipped and counted in skipped_lines().
class TomlReader {
public:
  bool load(const std::string& path) {
    entries_.clear();
    skipped_ = 0;
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string section;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(strip_comment(line));
      if (sv.empty()) continue;
      if (sv.front() == '[') {
        if (sv.back() != ']' || sv.size() < 3) { ++skipped_; continue; }
        section = std::string(trim(sv.substr(1, sv.size() - 2)));
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) { ++skipped_; continue; }
      auto key = trim(sv.substr(0, eq));
      auto val = trim(sv.substr(eq + 1));
      if (key.empty() || val.empty() || val.front() == '[' || val.front() == '{') { ++skipped_; continue; }
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"') val = val.substr(1, val.size() - 2);
      put(section, std::string(key), std::string(val));
    }
    return true;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return find(section, key) != nullptr;
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    const auto* v = find(section, key);
    return v ? *v : def;
  }

  [[nodiscard]] std::optional<double> get_double(std::string_view section, std::string_view key) const {
    const auto* v = find(section, key);
    if (!v || v->empty()) return std::nullopt;
    double out = 0.0;
    auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), out);
    if (ec != std::errc{} || ptr != v->data() + v->size()) return std::nullopt;
    return out;
  }

  [[nodiscard]] std::optional<bool> get_bool(std::string_view section, std::string_view key) const {
    const auto* v = find(section, key);
    if (!v) return std::nullopt;
    std::string low; low.reserve(v->size());
    for (char c : *v) low.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (low == "true" || low == "1" || low == "yes" || low == "on") return true;
    if (low == "false" || low == "0" || low == "no" || low == "off") return false;
    return std::nullopt;
  }

  [[nodiscard]] size_t skipped_lines() const { return skipped_; }

private:
  struct Entry { std::string section; std::string key; std::string value; };
  std::vector<Entry> entries_;
  size_t skipped_{0};

  void put(const std::string& section, std::string key, std::string value) {
    for (auto& e : entries_) {
      if (e.section == section && e.key == key) { e.value = std::move(value); return; }
    }
    entries_.push_back(Entry{section, std::move(key), std::move(value)});
  }

  [[nodiscard]] const std::string* find(std::string_view section, std::string_view key) const {
    for (const auto& e : entries_)
      if (e.section == section && e.key == key) return &e.value;
    return nullptr;
  }

  // Cut at the first '#' that is not inside a quoted string
  static std::string_view strip_comment(std::string_view sv) {
    bool quoted = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') quoted = !quoted;
      else if (sv[i] == '#' && !quoted) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace proctally::util
