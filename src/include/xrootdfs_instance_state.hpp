// Per-instance state for xrootdfs extension.
// State is stored in DuckDB's ObjectCache for automatic cleanup when DatabaseInstance is destroyed.

#pragma once

#include "duckdb/common/shared_ptr.hpp"
#include "duckdb/common/string.hpp"
#include "duckdb/common/typedefs.hpp"
#include "duckdb/storage/object_cache.hpp"
#include "url_utils.hpp"
#include "xrootd_client.hpp"
#include "xrootd_filesystem_config.hpp"

namespace duckdb {

// Forward declarations
class ClientContext;
class DatabaseInstance;

//===--------------------------------------------------------------------===//
// Per-instance configuration
//===--------------------------------------------------------------------===//
struct XRootDInstanceConfig {
	// File handle config
	idx_t read_buffer_size = DEFAULT_READ_BUFFER_SIZE;

	// Directory copy config
	bool parallel_copy = DEFAULT_PARALLEL_COPY;

	// Client connection config, in seconds except for the retry count
	uint64_t request_timeout = DEFAULT_REQUEST_TIMEOUT_SEC;
	uint64_t timeout_resolution = DEFAULT_TIMEOUT_RESOLUTION_SEC;
	uint64_t connection_window = DEFAULT_CONNECTION_WINDOW_SEC;
	uint64_t connection_retry = DEFAULT_CONNECTION_RETRY;

	// Extra query arguments for every URL opened through the virtual filesystem, i.e. "xrd.wantprot=krb5".
	string query = DEFAULT_QUERY_STRING;

	XRootDClientConfig GetClientConfig() const;
	QueryArgs GetQueryArgs() const;
};

//===--------------------------------------------------------------------===//
// Main per-instance state container
// Inherits from ObjectCacheEntry for automatic cleanup when DatabaseInstance is destroyed
//===--------------------------------------------------------------------===//
struct XRootDInstanceState : public ObjectCacheEntry {
	static constexpr const char *OBJECT_TYPE = "XRootDInstanceState";
	static constexpr const char *CACHE_KEY = "xrootdfs_instance_state";

	// Extension config for the current duckdb instance.
	XRootDInstanceConfig config;
	// Creates remote clients for all XRootD filesystems of the instance; the XrdCl backed factory is installed on
	// extension load, tests install a fake one.
	shared_ptr<XRootDClientFactory> client_factory;

	XRootDInstanceState() = default;
	explicit XRootDInstanceState(shared_ptr<XRootDClientFactory> client_factory_p)
	    : client_factory(std::move(client_factory_p)) {
	}

	// ObjectCacheEntry interface
	string GetObjectType() override {
		return OBJECT_TYPE;
	}

	static string ObjectType() {
		return OBJECT_TYPE;
	}

	optional_idx GetEstimatedCacheMemory() const override {
		return optional_idx {};
	}
};

//===--------------------------------------------------------------------===//
// Helper functions to access instance state
//===--------------------------------------------------------------------===//

// Store instance state in DatabaseInstance
void SetInstanceState(DatabaseInstance &instance, shared_ptr<XRootDInstanceState> state);

// Get instance state as shared_ptr from DatabaseInstance (returns nullptr if not set)
shared_ptr<XRootDInstanceState> GetInstanceStateShared(DatabaseInstance &instance);

// Get instance state, throwing if not found
XRootDInstanceState &GetInstanceStateOrThrow(DatabaseInstance &instance);

// Get instance state from ClientContext, throwing if not found
XRootDInstanceState &GetInstanceStateOrThrow(ClientContext &context);

// Get instance state as shared_ptr, throw exception if already unreferenced.
shared_ptr<XRootDInstanceState> GetInstanceConfig(const weak_ptr<XRootDInstanceState> &instance_state);

} // namespace duckdb
