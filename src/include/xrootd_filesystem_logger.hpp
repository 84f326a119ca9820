#pragma once

#include "duckdb/common/file_system.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/logging/log_type.hpp"
#include "duckdb/logging/file_system_logger.hpp"

namespace duckdb {

// A wrapper around [DUCKDB_LOG_DEBUG], which takes optional pointer for duckdb instance.
#define XROOTDFS_LOG_DEBUG_OPTIONAL(INSTANCE_PTR, ...)                                                                 \
	{                                                                                                                  \
		if (INSTANCE_PTR) {                                                                                            \
			DUCKDB_LOG_DEBUG(*INSTANCE_PTR, __VA_ARGS__);                                                              \
		}                                                                                                              \
	}

// File handle operations, logged through the logger attached to the handle (if any).
#define DUCKDB_LOG_XROOTD_OPEN(HANDLE)     DUCKDB_LOG_FILE_SYSTEM(HANDLE, "XROOTD FILE OPEN");
#define DUCKDB_LOG_XROOTD_READ(HANDLE)     DUCKDB_LOG_FILE_SYSTEM(HANDLE, "XROOTD FILE READ");
#define DUCKDB_LOG_XROOTD_WRITE(HANDLE)    DUCKDB_LOG_FILE_SYSTEM(HANDLE, "XROOTD FILE WRITE");
#define DUCKDB_LOG_XROOTD_TRUNCATE(HANDLE) DUCKDB_LOG_FILE_SYSTEM(HANDLE, "XROOTD FILE TRUNCATE");
#define DUCKDB_LOG_XROOTD_SYNC(HANDLE)     DUCKDB_LOG_FILE_SYSTEM(HANDLE, "XROOTD FILE SYNC");
#define DUCKDB_LOG_XROOTD_CLOSE(HANDLE)    DUCKDB_LOG_FILE_SYSTEM(HANDLE, "XROOTD FILE CLOSE");

} // namespace duckdb
