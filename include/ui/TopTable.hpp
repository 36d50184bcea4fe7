#pragma once
#include "store/Aggregator.hpp"
#include <string>
#include <vector>

namespace proctally::ui {

// Fixed-width table for the `top` command: header, rule, one line per row.
// Executable grouping labels rows by exe path (tail kept when cut),
// session grouping by pid@create_time.
std::string render_top_table(const std::vector<proctally::store::AggregateRow>& rows,
                             proctally::store::GroupBy group);

// Label used in the first column
std::string row_label(const proctally::store::AggregateRow& r, proctally::store::GroupBy group);

} // namespace proctally::ui
