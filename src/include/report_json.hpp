#pragma once

#include "link_types.hpp"
#include <string>

namespace duckdb {

// Serialize a linkcheck Report (documents, per-link results, counts) as JSON
std::string ReportToJson(const linkcheck::Report &report);

} // namespace duckdb
