// This file contains table functions to inspect XRootD namespaces and the extension config.

#pragma once

#include "duckdb/function/table_function.hpp"

namespace duckdb {

// Get table function to list a remote directory, one row per entry with its stat info.
TableFunction GetListDirQueryFunc();

// Get table function to query current xrootdfs extension config.
TableFunction GetXRootDConfigQueryFunc();

} // namespace duckdb
