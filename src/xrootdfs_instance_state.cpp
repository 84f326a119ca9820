#include "xrootdfs_instance_state.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/main/database.hpp"

namespace duckdb {

//===--------------------------------------------------------------------===//
// XRootDInstanceConfig implementation
//===--------------------------------------------------------------------===//

XRootDClientConfig XRootDInstanceConfig::GetClientConfig() const {
	XRootDClientConfig client_config;
	client_config.request_timeout = request_timeout;
	client_config.timeout_resolution = timeout_resolution;
	client_config.connection_window = connection_window;
	client_config.connection_retry = connection_retry;
	return client_config;
}

QueryArgs XRootDInstanceConfig::GetQueryArgs() const {
	return URLUtils::ParseQueryString(query);
}

//===--------------------------------------------------------------------===//
// Instance state helper functions
//===--------------------------------------------------------------------===//

void SetInstanceState(DatabaseInstance &instance, shared_ptr<XRootDInstanceState> state) {
	instance.GetObjectCache().Put(XRootDInstanceState::CACHE_KEY, std::move(state));
}

shared_ptr<XRootDInstanceState> GetInstanceStateShared(DatabaseInstance &instance) {
	return instance.GetObjectCache().Get<XRootDInstanceState>(XRootDInstanceState::CACHE_KEY);
}

XRootDInstanceState &GetInstanceStateOrThrow(DatabaseInstance &instance) {
	auto state = GetInstanceStateShared(instance);
	if (state == nullptr) {
		throw InternalException("xrootdfs instance state not found - extension not properly loaded");
	}
	return *state;
}

XRootDInstanceState &GetInstanceStateOrThrow(ClientContext &context) {
	return GetInstanceStateOrThrow(*context.db);
}

shared_ptr<XRootDInstanceState> GetInstanceConfig(const weak_ptr<XRootDInstanceState> &instance_state) {
	auto state = instance_state.lock();
	if (state == nullptr) {
		throw InternalException("xrootdfs instance state is no longer valid");
	}
	return state;
}

} // namespace duckdb
