#pragma once
#include "store/Aggregator.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace proctally::app {

// Quote a CSV field when it holds a comma, quote or line break
std::string csv_field(const std::string& s);

// Header row for the given grouping (no trailing newline)
std::string csv_header(proctally::store::GroupBy group);

// Write header plus one line per row to path, creating parent directories.
// Throws std::runtime_error when the file cannot be written. Returns the
// number of data rows.
size_t write_csv(const std::string& path,
                 const std::vector<proctally::store::AggregateRow>& rows,
                 proctally::store::GroupBy group,
                 const proctally::util::TimeWindow& window);

} // namespace proctally::app
