#include "xrootd_filesystem_config.hpp"

#include "duckdb/common/helper.hpp"

namespace duckdb {

const char *const XROOTD_SCHEME_PREFIX = "root://";
const char *const XROOTD_SECURE_SCHEME_PREFIX = "roots://";

const int64_t MAX_READ_CHUNK_SIZE = 2147483648LL;
const idx_t MAX_WRITE_CHUNK_SIZE = 1024 * 1024 * 1024;
const uint64_t MAX_PARALLEL_COPY_JOBS = 16;

const idx_t DEFAULT_READ_BUFFER_SIZE = 64 * 1024;
const bool DEFAULT_PARALLEL_COPY = true;
const uint64_t DEFAULT_REQUEST_TIMEOUT_SEC = 1800;
const uint64_t DEFAULT_TIMEOUT_RESOLUTION_SEC = 15;
const uint64_t DEFAULT_CONNECTION_WINDOW_SEC = 120;
const uint64_t DEFAULT_CONNECTION_RETRY = 5;
const char *const DEFAULT_QUERY_STRING = "";

uint64_t GetParallelCopyJobCount(uint64_t job_count) {
	if (job_count == 0) {
		return 1;
	}
	return MinValue<uint64_t>(job_count, MAX_PARALLEL_COPY_JOBS);
}

} // namespace duckdb
