#define DUCKDB_EXTENSION_MAIN

#include "xrootdfs_extension.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/opener_file_system.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/vector_operations/binary_executor.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/main/config.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include "url_utils.hpp"
#include "xrdcl_client.hpp"
#include "xrootd_exception.hpp"
#include "xrootd_filesystem.hpp"
#include "xrootd_filesystem_config.hpp"
#include "xrootd_filesystem_logger.hpp"
#include "xrootd_query_function.hpp"
#include "xrootdfs_instance_state.hpp"

namespace duckdb {

namespace {

// Get database instance from expression state.
// Returned instance ownership lies in the given [`state`].
DatabaseInstance &GetDatabaseInstance(ExpressionState &state) {
	auto *executor = state.root.executor;
	auto &client_context = executor->GetContext();
	return *client_context.db.get();
}

// Check whether the server of the given URL answers a ping.
void PingServer(DataChunk &args, ExpressionState &state, Vector &result) {
	D_ASSERT(args.ColumnCount() == 1);
	auto &instance = GetDatabaseInstance(state);
	auto xrootd_fs = CreateXRootDFileSystem(instance);

	UnaryExecutor::Execute<string_t, bool>(args.data[0], result, args.size(), [&](string_t url) {
		auto facade = xrootd_fs->CreateFacade(url.GetString());
		try {
			facade->Ping();
		} catch (XRootDRemoteConnectionException &ex) {
			DUCKDB_LOG_DEBUG(instance, StringUtil::Format("Ping XRootD server failed: %s", ex.what()));
			return false;
		}
		return true;
	});
}

// Get checksum of the given file URL, formatted as "<algorithm>:<value>".
void GetChecksum(DataChunk &args, ExpressionState &state, Vector &result) {
	D_ASSERT(args.ColumnCount() == 1);
	auto xrootd_fs = CreateXRootDFileSystem(GetDatabaseInstance(state));

	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t url) {
		const auto url_str = url.GetString();
		auto facade = xrootd_fs->CreateFacade(url_str);
		const auto checksum = facade->Checksum(URLUtils::ParseURL(url_str).path);
		return StringVector::AddString(result, StringUtil::Format("%s:%s", checksum.first, checksum.second));
	});
}

// Copy a directory tree within one server, an existing destination is replaced.
void CopyDirectory(DataChunk &args, ExpressionState &state, Vector &result) {
	D_ASSERT(args.ColumnCount() == 2);
	auto &instance = GetDatabaseInstance(state);
	auto xrootd_fs = CreateXRootDFileSystem(instance);
	const bool parallel = GetInstanceStateOrThrow(instance).config.parallel_copy;

	BinaryExecutor::Execute<string_t, string_t, bool>(
	    args.data[0], args.data[1], result, args.size(), [&](string_t src_url, string_t dst_url) {
		    const auto src_url_str = src_url.GetString();
		    const auto dst_url_str = dst_url.GetString();
		    auto facade = xrootd_fs->CreateFacade(src_url_str);
		    const auto parsed_src = URLUtils::ParseURL(src_url_str);
		    const auto parsed_dst = URLUtils::ParseURL(dst_url_str);
		    if (parsed_src.root_url != parsed_dst.root_url) {
			    throw InvalidInputException("Cannot copy XRootD directory %s to %s, which lives on another server",
			                                src_url_str, dst_url_str);
		    }
		    facade->CopyDir(parsed_src.path, parsed_dst.path, /*overwrite=*/true, parallel);
		    return true;
	    });
}

void UpdateReadBufferSize(ClientContext &context, SetScope scope, Value &parameter) {
	auto &inst_state = GetInstanceStateOrThrow(context);
	const auto read_buffer_size = parameter.GetValue<uint64_t>();
	if (read_buffer_size == 0) {
		throw InvalidInputException("xrootdfs_read_buffer_size must be greater than 0");
	}
	inst_state.config.read_buffer_size = read_buffer_size;
}

void UpdateParallelCopy(ClientContext &context, SetScope scope, Value &parameter) {
	auto &inst_state = GetInstanceStateOrThrow(context);
	inst_state.config.parallel_copy = parameter.GetValue<bool>();
}

void UpdateRequestTimeout(ClientContext &context, SetScope scope, Value &parameter) {
	auto &inst_state = GetInstanceStateOrThrow(context);
	inst_state.config.request_timeout = parameter.GetValue<uint64_t>();
}

void UpdateTimeoutResolution(ClientContext &context, SetScope scope, Value &parameter) {
	auto &inst_state = GetInstanceStateOrThrow(context);
	const auto timeout_resolution = parameter.GetValue<uint64_t>();
	if (timeout_resolution == 0) {
		throw InvalidInputException("xrootdfs_timeout_resolution must be greater than 0");
	}
	inst_state.config.timeout_resolution = timeout_resolution;
}

void UpdateConnectionWindow(ClientContext &context, SetScope scope, Value &parameter) {
	auto &inst_state = GetInstanceStateOrThrow(context);
	inst_state.config.connection_window = parameter.GetValue<uint64_t>();
}

void UpdateConnectionRetry(ClientContext &context, SetScope scope, Value &parameter) {
	auto &inst_state = GetInstanceStateOrThrow(context);
	inst_state.config.connection_retry = parameter.GetValue<uint64_t>();
}

void UpdateQuery(ClientContext &context, SetScope scope, Value &parameter) {
	auto &inst_state = GetInstanceStateOrThrow(context);
	auto query = parameter.ToString();
	// Keep the canonical encoding, so keys with blank values are dropped right away.
	inst_state.config.query = URLUtils::EncodeQueryString(URLUtils::ParseQueryString(query));
}

void LoadInternal(ExtensionLoader &loader) {
	auto &instance = loader.GetDatabaseInstance();

	// Create per-instance state for this extension, remote clients are backed by XrdCl.
	auto state = make_shared_ptr<XRootDInstanceState>(make_shared_ptr<XrdClClientFactory>());
	SetInstanceState(instance, state);

	// Register filesystem instance to instance.
	auto &opener_filesystem = instance.GetFileSystem().Cast<OpenerFileSystem>();
	auto &vfs = opener_filesystem.GetFileSystem();
	vfs.RegisterSubSystem(make_uniq<XRootDFileSystem>(state, &instance));
	DUCKDB_LOG_DEBUG(instance, "Register XRootD filesystem for root:// and roots:// URLs.");

	// Register extension configuration.
	auto &config = DBConfig::GetConfig(instance);

	// File handle configurations.
	config.AddExtensionOption("xrootdfs_read_buffer_size",
	                          "Chunk size in bytes for line reads and chunked iteration over XRootD files.",
	                          LogicalType {LogicalTypeId::UBIGINT}, Value::UBIGINT(DEFAULT_READ_BUFFER_SIZE),
	                          UpdateReadBufferSize);

	// Directory copy configurations.
	config.AddExtensionOption("xrootdfs_parallel_copy",
	                          "Whether xrootd_copy_dir submits all file copies as one parallel batch.",
	                          LogicalTypeId::BOOLEAN, DEFAULT_PARALLEL_COPY, UpdateParallelCopy);

	// Client connection configurations.
	config.AddExtensionOption("xrootdfs_request_timeout", "Seconds to wait for a response to an XRootD request.",
	                          LogicalType {LogicalTypeId::UBIGINT}, Value::UBIGINT(DEFAULT_REQUEST_TIMEOUT_SEC),
	                          UpdateRequestTimeout);
	config.AddExtensionOption("xrootdfs_timeout_resolution", "Seconds between two checks for timed out requests.",
	                          LogicalType {LogicalTypeId::UBIGINT}, Value::UBIGINT(DEFAULT_TIMEOUT_RESOLUTION_SEC),
	                          UpdateTimeoutResolution);
	config.AddExtensionOption("xrootdfs_connection_window",
	                          "Seconds in which a single connection attempt to an XRootD server has to succeed.",
	                          LogicalType {LogicalTypeId::UBIGINT}, Value::UBIGINT(DEFAULT_CONNECTION_WINDOW_SEC),
	                          UpdateConnectionWindow);
	config.AddExtensionOption("xrootdfs_connection_retry",
	                          "Number of connection windows tried before an XRootD connection is declared dead.",
	                          LogicalType {LogicalTypeId::UBIGINT}, Value::UBIGINT(DEFAULT_CONNECTION_RETRY),
	                          UpdateConnectionRetry);

	// Query arguments attached to every URL, i.e. 'xrd.wantprot=krb5'; arguments in the URL itself win.
	config.AddExtensionOption("xrootdfs_query",
	                          "Extra query arguments (k1=v1&k2=v2) attached to every XRootD URL opened by DuckDB.",
	                          LogicalType {LogicalTypeId::VARCHAR}, string {DEFAULT_QUERY_STRING}, UpdateQuery);

	// Register server diagnostics.
	ScalarFunction ping_function("xrootd_ping", /*arguments=*/ {LogicalType {LogicalTypeId::VARCHAR}},
	                             /*return_type=*/LogicalType {LogicalTypeId::BOOLEAN}, PingServer);
	ping_function.stability = FunctionStability::VOLATILE;
	loader.RegisterFunction(ping_function);

	ScalarFunction checksum_function("xrootd_checksum", /*arguments=*/ {LogicalType {LogicalTypeId::VARCHAR}},
	                                 /*return_type=*/LogicalType {LogicalTypeId::VARCHAR}, GetChecksum);
	loader.RegisterFunction(checksum_function);

	// Register server side directory copy.
	//
	// Example usage:
	// D. SELECT xrootd_copy_dir('root://localhost//tmp/src', 'root://localhost//tmp/dst');
	ScalarFunction copy_dir_function(
	    "xrootd_copy_dir",
	    /*arguments=*/ {LogicalType {LogicalTypeId::VARCHAR}, LogicalType {LogicalTypeId::VARCHAR}},
	    /*return_type=*/LogicalType {LogicalTypeId::BOOLEAN}, CopyDirectory);
	copy_dir_function.stability = FunctionStability::VOLATILE;
	loader.RegisterFunction(copy_dir_function);

	// Register directory listing and config display.
	loader.RegisterFunction(GetListDirQueryFunc());
	loader.RegisterFunction(GetXRootDConfigQueryFunc());

	// Fill in extension load information.
	string description =
	    StringUtil::Format("Adds a filesystem for XRootD (root:// and roots://) URLs to DuckDB, backed by XrdCl.");
	loader.SetDescription(description);
}

} // namespace

void XRootDFsExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}
string XRootDFsExtension::Name() {
	return "xrootdfs";
}

string XRootDFsExtension::Version() const {
#ifdef EXT_VERSION_XROOTDFS
	return EXT_VERSION_XROOTDFS;
#else
	return "";
#endif
}

} // namespace duckdb

extern "C" {
DUCKDB_CPP_EXTENSION_ENTRY(xrootdfs, loader) {
	duckdb::XRootDFsExtension().Load(loader);
}
}

#ifndef DUCKDB_EXTENSION_MAIN
#error DUCKDB_EXTENSION_MAIN not defined
#endif
