#pragma once

#include <string>

namespace proctally::ui {

// UTF-8 text width utilities
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);
std::string take_last_cols(const std::string& s, int cols);

// Text formatting and alignment
bool use_unicode();
std::string trunc_pad(const std::string& s, int w);      // left aligned, cut on the right
std::string trunc_pad_left(const std::string& s, int w); // left aligned, keeps the tail
std::string rpad_trunc(const std::string& s, int w);     // right aligned

} // namespace proctally::ui
