#include "xrootd_query_function.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/helper.hpp"
#include "duckdb/common/numeric_utils.hpp"
#include "duckdb/common/string.hpp"
#include "duckdb/common/types/timestamp.hpp"
#include "duckdb/common/vector.hpp"
#include "duckdb/main/client_context.hpp"
#include "url_utils.hpp"
#include "xrootd_filesystem.hpp"
#include "xrootdfs_instance_state.hpp"

namespace duckdb {

namespace {

//===--------------------------------------------------------------------===//
// List directory query function
//===--------------------------------------------------------------------===//

struct ListDirBindData : public TableFunctionData {
	string url;
};

struct ListDirData : public GlobalTableFunctionState {
	vector<XRootDDirEntry> entries;
	// Index of the next entry to emit.
	idx_t offset = 0;
};

unique_ptr<FunctionData> ListDirQueryFuncBind(ClientContext &context, TableFunctionBindInput &input,
                                              vector<LogicalType> &return_types, vector<string> &names) {
	D_ASSERT(return_types.empty());
	D_ASSERT(names.empty());
	D_ASSERT(input.inputs.size() == 1);

	auto bind_data = make_uniq<ListDirBindData>();
	bind_data->url = input.inputs[0].ToString();
	if (!URLUtils::IsValidXRootDUrl(bind_data->url)) {
		throw InvalidInputException("xrootd_list_dir expects a root:// or roots:// URL, got '%s'", bind_data->url);
	}

	return_types.reserve(4);
	names.reserve(4);

	return_types.emplace_back(LogicalType {LogicalTypeId::VARCHAR});
	names.emplace_back("name");

	return_types.emplace_back(LogicalType {LogicalTypeId::BOOLEAN});
	names.emplace_back("is_dir");

	return_types.emplace_back(LogicalType {LogicalTypeId::UBIGINT});
	names.emplace_back("size");

	return_types.emplace_back(LogicalType {LogicalTypeId::TIMESTAMP});
	names.emplace_back("modified");

	return std::move(bind_data);
}

unique_ptr<GlobalTableFunctionState> ListDirQueryFuncInit(ClientContext &context, TableFunctionInitInput &input) {
	const auto &bind_data = input.bind_data->Cast<ListDirBindData>();
	auto xrootd_fs = CreateXRootDFileSystem(*context.db);
	auto facade = xrootd_fs->CreateFacade(bind_data.url);

	auto result = make_uniq<ListDirData>();
	result->entries = facade->ListDirInfo(URLUtils::ParseURL(bind_data.url).path);
	return std::move(result);
}

void ListDirQueryTableFunc(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &data = data_p.global_state->Cast<ListDirData>();
	if (data.offset >= data.entries.size()) {
		return;
	}

	idx_t count = 0;
	while (data.offset < data.entries.size() && count < STANDARD_VECTOR_SIZE) {
		const auto &cur_entry = data.entries[data.offset++];
		const auto &stat_info = cur_entry.stat_info;
		idx_t col = 0;
		output.SetValue(col++, count, cur_entry.name);
		output.SetValue(col++, count, Value::BOOLEAN(stat_info.TestFlags(XRootDStatFlags::IS_DIR)));
		output.SetValue(col++, count, Value::UBIGINT(stat_info.size));
		output.SetValue(
		    col++, count,
		    Value::TIMESTAMP(Timestamp::FromEpochSeconds(NumericCast<int64_t>(stat_info.modification_time))));
		++count;
	}
	output.SetCardinality(count);
}

//===--------------------------------------------------------------------===//
// Extension config query function
//===--------------------------------------------------------------------===//

struct XRootDConfigData : public GlobalTableFunctionState {
	// Config should be emitted only once.
	bool emitted = false;
};

unique_ptr<FunctionData> XRootDConfigQueryFuncBind(ClientContext &context, TableFunctionBindInput &input,
                                                   vector<LogicalType> &return_types, vector<string> &names) {
	D_ASSERT(return_types.empty());
	D_ASSERT(names.empty());

	return_types.reserve(7);
	names.reserve(7);

	return_types.emplace_back(LogicalType {LogicalTypeId::UBIGINT});
	names.emplace_back("read_buffer_size");

	return_types.emplace_back(LogicalType {LogicalTypeId::BOOLEAN});
	names.emplace_back("parallel_copy");

	return_types.emplace_back(LogicalType {LogicalTypeId::UBIGINT});
	names.emplace_back("request_timeout");

	return_types.emplace_back(LogicalType {LogicalTypeId::UBIGINT});
	names.emplace_back("timeout_resolution");

	return_types.emplace_back(LogicalType {LogicalTypeId::UBIGINT});
	names.emplace_back("connection_window");

	return_types.emplace_back(LogicalType {LogicalTypeId::UBIGINT});
	names.emplace_back("connection_retry");

	return_types.emplace_back(LogicalType {LogicalTypeId::VARCHAR});
	names.emplace_back("query");

	return nullptr;
}

unique_ptr<GlobalTableFunctionState> XRootDConfigQueryFuncInit(ClientContext &context, TableFunctionInitInput &input) {
	auto result = make_uniq<XRootDConfigData>();
	return std::move(result);
}

void XRootDConfigQueryTableFunc(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &data = data_p.global_state->Cast<XRootDConfigData>();

	// Config has already been emitted.
	if (data.emitted) {
		return;
	}
	data.emitted = true;

	const auto &config = GetInstanceStateOrThrow(context).config;
	idx_t col = 0;
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(config.read_buffer_size));
	output.SetValue(col++, /*index=*/0, Value::BOOLEAN(config.parallel_copy));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(config.request_timeout));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(config.timeout_resolution));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(config.connection_window));
	output.SetValue(col++, /*index=*/0, Value::UBIGINT(config.connection_retry));
	output.SetValue(col++, /*index=*/0, config.query);
	output.SetCardinality(/*count=*/1);
}

} // namespace

TableFunction GetListDirQueryFunc() {
	TableFunction list_dir_query_func {/*name=*/"xrootd_list_dir",
	                                   /*arguments=*/ {LogicalType {LogicalTypeId::VARCHAR}},
	                                   /*function=*/ListDirQueryTableFunc,
	                                   /*bind=*/ListDirQueryFuncBind,
	                                   /*init_global=*/ListDirQueryFuncInit};
	return list_dir_query_func;
}

TableFunction GetXRootDConfigQueryFunc() {
	TableFunction xrootd_config_query_func {/*name=*/"xrootd_config",
	                                        /*arguments=*/ {},
	                                        /*function=*/XRootDConfigQueryTableFunc,
	                                        /*bind=*/XRootDConfigQueryFuncBind,
	                                        /*init_global=*/XRootDConfigQueryFuncInit};
	return xrootd_config_query_func;
}

} // namespace duckdb
