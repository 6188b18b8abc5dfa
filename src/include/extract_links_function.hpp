#pragma once

#include "duckdb.hpp"

namespace duckdb {

class ExtensionLoader;

void RegisterExtractLinksFunction(ExtensionLoader &loader);

} // namespace duckdb
