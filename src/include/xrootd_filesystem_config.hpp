#pragma once

#include <cstdint>

#include "duckdb/common/string.hpp"
#include "duckdb/common/typedefs.hpp"

namespace duckdb {

//===--------------------------------------------------------------------===//
// Config constant
//===--------------------------------------------------------------------===//

// URL schemes served by the XRootD filesystem.
extern const char *const XROOTD_SCHEME_PREFIX;
extern const char *const XROOTD_SECURE_SCHEME_PREFIX;

// Single remote reads of this many bytes or more are rejected.
extern const int64_t MAX_READ_CHUNK_SIZE;

// Upper bound for a single remote write request, larger writes are split.
extern const idx_t MAX_WRITE_CHUNK_SIZE;

// Upper bound for the number of copy jobs running at the same time for a parallel directory copy.
extern const uint64_t MAX_PARALLEL_COPY_JOBS;

//===--------------------------------------------------------------------===//
// Default configuration
//===--------------------------------------------------------------------===//

// Chunk size used by line reads and chunked iteration over file handles.
extern const idx_t DEFAULT_READ_BUFFER_SIZE;

// By default, directory copies submit all file copies as one parallel batch.
extern const bool DEFAULT_PARALLEL_COPY;

// Seconds to wait for a response to a single request.
extern const uint64_t DEFAULT_REQUEST_TIMEOUT_SEC;

// Seconds between two checks for timed out requests.
extern const uint64_t DEFAULT_TIMEOUT_RESOLUTION_SEC;

// Seconds in which a single connection attempt has to succeed.
extern const uint64_t DEFAULT_CONNECTION_WINDOW_SEC;

// Number of connection windows tried before a connection is declared dead.
extern const uint64_t DEFAULT_CONNECTION_RETRY;

// Extra query arguments attached to every URL opened through the virtual filesystem, empty by default.
extern const char *const DEFAULT_QUERY_STRING;

//===--------------------------------------------------------------------===//
// Util function for filesystem configurations.
//===--------------------------------------------------------------------===//

// Get the number of copy jobs to run at the same time for [job_count] queued jobs.
uint64_t GetParallelCopyJobCount(uint64_t job_count);

} // namespace duckdb
