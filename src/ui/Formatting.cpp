#include "ui/Formatting.hpp"
#include <cctype>
#include <cstdlib>
#include <vector>

namespace proctally::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    int len = u8_len((unsigned char)s[i]);
    i += len;
    cols += 1;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size() && seen < cols) {
    int len = u8_len((unsigned char)s[i]);
    if (i + (size_t)len > s.size()) len = 1;
    out.append(s, i, len);
    i += len;
    seen += 1;
  }
  return out;
}

std::string take_last_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  // Character start offsets, then keep the last `cols` of them
  std::vector<size_t> starts;
  for (size_t i = 0; i < s.size();) {
    starts.push_back(i);
    int len = u8_len((unsigned char)s[i]);
    if (i + (size_t)len > s.size()) len = 1;
    i += len;
  }
  if ((int)starts.size() <= cols) return s;
  return s.substr(starts[starts.size() - cols]);
}

bool use_unicode() {
  const char* lc = std::getenv("LC_ALL");
  if (!lc || !*lc) lc = std::getenv("LANG");
  if (!lc || !*lc) return false;
  std::string s = lc;
  for (auto& c : s) c = std::tolower((unsigned char)c);
  return s.find("utf") != std::string::npos;
}

std::string trunc_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(w - cols, ' ');
  if (w <= 1) return take_cols(s, w);
  return take_cols(s, w - 1) + (use_unicode()? "\xE2\x80\xA6" : ".");
}

std::string trunc_pad_left(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols <= w) return s + std::string(w - cols, ' ');
  if (w <= 1) return take_last_cols(s, w);
  return (use_unicode()? "\xE2\x80\xA6" : ".") + take_last_cols(s, w - 1);
}

std::string rpad_trunc(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return std::string(w - cols, ' ') + s;
  return take_cols(s, w);
}

} // namespace proctally::ui
