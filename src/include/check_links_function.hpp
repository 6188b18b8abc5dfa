#pragma once

#include "duckdb.hpp"

namespace duckdb {

class ExtensionLoader;

// Registers check_links() and check_links_report()
void RegisterCheckLinksFunction(ExtensionLoader &loader);

} // namespace duckdb
