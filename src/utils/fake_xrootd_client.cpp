#include "fake_xrootd_client.hpp"

#include <cstring>

#include "duckdb/common/exception.hpp"
#include "duckdb/common/helper.hpp"
#include "duckdb/common/string_util.hpp"
#include "path_utils.hpp"
#include "thread_pool.hpp"
#include "url_utils.hpp"
#include "xrootd_filesystem_config.hpp"

namespace duckdb {

namespace {

// Errno reported by real servers, which the client boundary doesn't name.
constexpr uint32_t IS_DIRECTORY_ERRNO = 3016;
constexpr uint32_t CONNECTION_ERRNO = 0;

// Start of the logical clock, 2023-11-14.
constexpr uint64_t INITIAL_TIME = 1700000000;

constexpr const char *CHECKSUM_ALGORITHM = "adler32";

string NormalizeServerPath(const string &path) {
	return PathUtils::Normalize("/" + PathUtils::Relative(path));
}

XRootDStatus NotFound(const string &path) {
	return XRootDStatus::Error(XRootDErrno::NOT_FOUND,
	                           StringUtil::Format("Unable to access %s; no such file or directory", path));
}

XRootDStatus NotADirectory(const string &path) {
	return XRootDStatus::Error(XRootDErrno::NOT_EMPTY, StringUtil::Format("Unable to access %s; not a directory", path));
}

XRootDStatus IsADirectory(const string &path) {
	return XRootDStatus::Error(IS_DIRECTORY_ERRNO, StringUtil::Format("Unable to access %s; is a directory", path));
}

XRootDStatus AlreadyExists(const string &path) {
	return XRootDStatus::Error(XRootDErrno::ITEM_EXISTS_V5, StringUtil::Format("Unable to create %s; file exists", path));
}

uint32_t Adler32(const string &content) {
	constexpr uint32_t MOD_ADLER = 65521;
	uint32_t low = 1;
	uint32_t high = 0;
	for (const char cur : content) {
		low = (low + static_cast<unsigned char>(cur)) % MOD_ADLER;
		high = (high + low) % MOD_ADLER;
	}
	return (high << 16) | low;
}

// Server responses come in fixed size buffers, which carry garbage after the NUL terminator.
string PadResponse(string response) {
	response += '\0';
	response += "\x7f\x01";
	return response;
}

} // namespace

//===--------------------------------------------------------------------===//
// FakeXRootDServer
//===--------------------------------------------------------------------===//

FakeXRootDServer::FakeXRootDServer() : current_time(INITIAL_TIME) {
	Node root;
	root.is_dir = true;
	root.created_time = root.modified_time = root.accessed_time = current_time;
	nodes.emplace("/", std::move(root));
}

uint64_t FakeXRootDServer::Tick() {
	return ++current_time;
}

FakeXRootDServer::Node &FakeXRootDServer::CreateNodeWithParents(const string &path, bool is_dir) {
	const auto parent = PathUtils::DirName(path);
	if (!parent.empty() && nodes.find(parent) == nodes.end()) {
		CreateNodeWithParents(parent, /*is_dir=*/true);
	}
	auto &node = nodes[path];
	node.is_dir = is_dir;
	node.content.clear();
	node.created_time = node.modified_time = node.accessed_time = Tick();
	return node;
}

XRootDStatus FakeXRootDServer::CheckParent(const string &path) const {
	const auto parent = PathUtils::DirName(path);
	auto iter = nodes.find(parent);
	if (iter == nodes.end()) {
		return NotFound(path);
	}
	if (!iter->second.is_dir) {
		return NotADirectory(path);
	}
	return XRootDStatus::Ok();
}

bool FakeXRootDServer::HasChildren(const string &path) const {
	const string prefix = path == "/" ? path : path + "/";
	auto iter = nodes.upper_bound(prefix);
	return iter != nodes.end() && StringUtil::StartsWith(iter->first, prefix);
}

XRootDStatInfo FakeXRootDServer::GetStatInfo(const Node &node) const {
	XRootDStatInfo info;
	info.flags = XRootDStatFlags::IS_READABLE | XRootDStatFlags::IS_WRITABLE;
	if (node.is_dir) {
		info.flags |= XRootDStatFlags::IS_DIR | XRootDStatFlags::X_BIT_SET;
		info.size = 4096;
	} else {
		info.size = node.content.length();
	}
	info.modification_time = node.modified_time;
	return info;
}

void FakeXRootDServer::AddDirectory(const string &path) {
	std::lock_guard<std::mutex> lck(mutex);
	const auto normalized_path = NormalizeServerPath(path);
	if (nodes.find(normalized_path) == nodes.end()) {
		CreateNodeWithParents(normalized_path, /*is_dir=*/true);
	}
}

void FakeXRootDServer::AddFile(const string &path, string content) {
	std::lock_guard<std::mutex> lck(mutex);
	auto &node = CreateNodeWithParents(NormalizeServerPath(path), /*is_dir=*/false);
	node.content = std::move(content);
}

bool FakeXRootDServer::HasPath(const string &path) const {
	std::lock_guard<std::mutex> lck(mutex);
	return nodes.find(NormalizeServerPath(path)) != nodes.end();
}

bool FakeXRootDServer::IsDirectory(const string &path) const {
	std::lock_guard<std::mutex> lck(mutex);
	auto iter = nodes.find(NormalizeServerPath(path));
	return iter != nodes.end() && iter->second.is_dir;
}

string FakeXRootDServer::GetFileContent(const string &path) const {
	std::lock_guard<std::mutex> lck(mutex);
	auto iter = nodes.find(NormalizeServerPath(path));
	if (iter == nodes.end() || iter->second.is_dir) {
		throw InvalidInputException("No file at %s on fake XRootD server", path);
	}
	return iter->second.content;
}

void FakeXRootDServer::InjectFailure(FakeXRootDOperation operation, XRootDStatus status) {
	std::lock_guard<std::mutex> lck(mutex);
	injected_failures[static_cast<uint8_t>(operation)].emplace(std::move(status));
}

void FakeXRootDServer::SetChecksumSupported(bool supported) {
	std::lock_guard<std::mutex> lck(mutex);
	checksum_supported = supported;
}

void FakeXRootDServer::SetReachable(bool reachable_p) {
	std::lock_guard<std::mutex> lck(mutex);
	reachable = reachable_p;
}

void FakeXRootDServer::SetAttributeOverrides(string attributes) {
	std::lock_guard<std::mutex> lck(mutex);
	attribute_overrides = std::move(attributes);
}

idx_t FakeXRootDServer::GetOperationCount(FakeXRootDOperation operation) const {
	std::lock_guard<std::mutex> lck(mutex);
	auto iter = operation_counts.find(static_cast<uint8_t>(operation));
	return iter == operation_counts.end() ? 0 : iter->second;
}

void FakeXRootDServer::ResetOperationCount() {
	std::lock_guard<std::mutex> lck(mutex);
	operation_counts.clear();
}

XRootDStatus FakeXRootDServer::BeginOperation(FakeXRootDOperation operation) {
	const auto key = static_cast<uint8_t>(operation);
	++operation_counts[key];
	if (!reachable) {
		return XRootDStatus::Error(CONNECTION_ERRNO, "[FATAL] Connection error");
	}
	auto iter = injected_failures.find(key);
	if (iter == injected_failures.end() || iter->second.empty()) {
		return XRootDStatus::Ok();
	}
	auto status = std::move(iter->second.front());
	iter->second.pop();
	return status;
}

XRootDStatus FakeXRootDServer::Touch(FakeXRootDOperation operation) {
	std::lock_guard<std::mutex> lck(mutex);
	return BeginOperation(operation);
}

XRootDStatus FakeXRootDServer::OpenFile(const string &path, XRootDOpenFlags flags) {
	std::lock_guard<std::mutex> lck(mutex);
	auto status = BeginOperation(FakeXRootDOperation::OPEN);
	if (!status.IsOk()) {
		return status;
	}

	const auto normalized_path = NormalizeServerPath(path);
	auto iter = nodes.find(normalized_path);
	if (iter != nodes.end() && iter->second.is_dir) {
		return IsADirectory(normalized_path);
	}
	switch (flags) {
	case XRootDOpenFlags::READ:
	case XRootDOpenFlags::UPDATE:
		if (iter == nodes.end()) {
			return NotFound(normalized_path);
		}
		iter->second.accessed_time = Tick();
		return XRootDStatus::Ok();
	case XRootDOpenFlags::DELETE: {
		status = CheckParent(normalized_path);
		if (!status.IsOk()) {
			return status;
		}
		auto &node = nodes[normalized_path];
		node.is_dir = false;
		node.content.clear();
		node.modified_time = node.accessed_time = Tick();
		if (node.created_time == 0) {
			node.created_time = node.modified_time;
		}
		return XRootDStatus::Ok();
	}
	default:
		return XRootDStatus::Error(XRootDErrno::INVALID_REQUEST,
		                           StringUtil::Format("Invalid open flags for %s", normalized_path));
	}
}

XRootDStatus FakeXRootDServer::ReadFile(const string &path, uint64_t offset, uint32_t size, string &out) {
	std::lock_guard<std::mutex> lck(mutex);
	auto status = BeginOperation(FakeXRootDOperation::READ);
	if (!status.IsOk()) {
		return status;
	}
	auto iter = nodes.find(path);
	if (iter == nodes.end()) {
		return NotFound(path);
	}
	const auto &content = iter->second.content;
	out.clear();
	if (offset < content.length()) {
		out = content.substr(offset, size);
	}
	return XRootDStatus::Ok();
}

XRootDStatus FakeXRootDServer::WriteFile(const string &path, uint64_t offset, const char *data, uint32_t size) {
	std::lock_guard<std::mutex> lck(mutex);
	auto status = BeginOperation(FakeXRootDOperation::WRITE);
	if (!status.IsOk()) {
		return status;
	}
	auto iter = nodes.find(path);
	if (iter == nodes.end()) {
		return NotFound(path);
	}
	auto &content = iter->second.content;
	if (content.length() < offset + size) {
		content.resize(offset + size, '\0');
	}
	if (size > 0) {
		std::memcpy(&content[offset], data, size);
	}
	iter->second.modified_time = Tick();
	return XRootDStatus::Ok();
}

XRootDStatus FakeXRootDServer::TruncateFile(const string &path, uint64_t size) {
	std::lock_guard<std::mutex> lck(mutex);
	auto status = BeginOperation(FakeXRootDOperation::TRUNCATE);
	if (!status.IsOk()) {
		return status;
	}
	auto iter = nodes.find(path);
	if (iter == nodes.end()) {
		return NotFound(path);
	}
	iter->second.content.resize(size, '\0');
	iter->second.modified_time = Tick();
	return XRootDStatus::Ok();
}

XRootDStatus FakeXRootDServer::StatFile(const string &path, XRootDStatInfo &info) {
	std::lock_guard<std::mutex> lck(mutex);
	auto status = BeginOperation(FakeXRootDOperation::FILE_STAT);
	if (!status.IsOk()) {
		return status;
	}
	auto iter = nodes.find(path);
	if (iter == nodes.end()) {
		return NotFound(path);
	}
	info = GetStatInfo(iter->second);
	return XRootDStatus::Ok();
}

XRootDStatus FakeXRootDServer::Stat(const string &path, XRootDStatInfo &info) {
	std::lock_guard<std::mutex> lck(mutex);
	auto status = BeginOperation(FakeXRootDOperation::STAT);
	if (!status.IsOk()) {
		return status;
	}
	const auto normalized_path = NormalizeServerPath(path);
	auto iter = nodes.find(normalized_path);
	if (iter == nodes.end()) {
		return NotFound(normalized_path);
	}
	info = GetStatInfo(iter->second);
	return XRootDStatus::Ok();
}

XRootDStatus FakeXRootDServer::DirList(const string &path, bool with_stat, vector<XRootDDirEntry> &entries) {
	std::lock_guard<std::mutex> lck(mutex);
	auto status = BeginOperation(FakeXRootDOperation::DIRLIST);
	if (!status.IsOk()) {
		return status;
	}
	const auto normalized_path = NormalizeServerPath(path);
	auto iter = nodes.find(normalized_path);
	if (iter == nodes.end()) {
		return NotFound(normalized_path);
	}
	if (!iter->second.is_dir) {
		return NotADirectory(normalized_path);
	}

	entries.clear();
	const string prefix = normalized_path == "/" ? normalized_path : normalized_path + "/";
	// Siblings like "/a-b" sort between "/a" and "/a/x", so start right at the children.
	for (iter = nodes.upper_bound(prefix); iter != nodes.end() && StringUtil::StartsWith(iter->first, prefix); ++iter) {
		const auto name = iter->first.substr(prefix.length());
		// Only direct children.
		if (name.find('/') != string::npos) {
			continue;
		}
		XRootDDirEntry entry;
		entry.name = name;
		if (with_stat) {
			entry.has_stat_info = true;
			entry.stat_info = GetStatInfo(iter->second);
		}
		entries.emplace_back(std::move(entry));
	}
	return XRootDStatus::Ok();
}

XRootDStatus FakeXRootDServer::MkDir(const string &path, bool make_path) {
	std::lock_guard<std::mutex> lck(mutex);
	auto status = BeginOperation(FakeXRootDOperation::MKDIR);
	if (!status.IsOk()) {
		return status;
	}
	const auto normalized_path = NormalizeServerPath(path);
	auto iter = nodes.find(normalized_path);
	if (iter != nodes.end()) {
		return AlreadyExists(normalized_path);
	}
	if (!make_path) {
		status = CheckParent(normalized_path);
		if (!status.IsOk()) {
			return status;
		}
	}
	// A file somewhere along the way blocks the whole path.
	for (auto parent = PathUtils::DirName(normalized_path); !parent.empty() && parent != "/";
	     parent = PathUtils::DirName(parent)) {
		auto parent_iter = nodes.find(parent);
		if (parent_iter != nodes.end() && !parent_iter->second.is_dir) {
			return NotADirectory(normalized_path);
		}
	}
	CreateNodeWithParents(normalized_path, /*is_dir=*/true);
	return XRootDStatus::Ok();
}

XRootDStatus FakeXRootDServer::Rm(const string &path) {
	std::lock_guard<std::mutex> lck(mutex);
	auto status = BeginOperation(FakeXRootDOperation::RM);
	if (!status.IsOk()) {
		return status;
	}
	const auto normalized_path = NormalizeServerPath(path);
	auto iter = nodes.find(normalized_path);
	if (iter == nodes.end()) {
		return NotFound(normalized_path);
	}
	if (iter->second.is_dir) {
		return IsADirectory(normalized_path);
	}
	nodes.erase(iter);
	return XRootDStatus::Ok();
}

XRootDStatus FakeXRootDServer::RmDir(const string &path) {
	std::lock_guard<std::mutex> lck(mutex);
	auto status = BeginOperation(FakeXRootDOperation::RMDIR);
	if (!status.IsOk()) {
		return status;
	}
	const auto normalized_path = NormalizeServerPath(path);
	auto iter = nodes.find(normalized_path);
	if (iter == nodes.end()) {
		return NotFound(normalized_path);
	}
	if (!iter->second.is_dir) {
		return NotADirectory(normalized_path);
	}
	if (normalized_path == "/") {
		return XRootDStatus::Error(XRootDErrno::INVALID_REQUEST, "Unable to remove the root directory");
	}
	if (HasChildren(normalized_path)) {
		return XRootDStatus::Error(XRootDErrno::NOT_EMPTY,
		                           StringUtil::Format("Unable to remove directory %s; directory not empty",
		                                              normalized_path));
	}
	nodes.erase(iter);
	return XRootDStatus::Ok();
}

XRootDStatus FakeXRootDServer::Mv(const string &source, const string &target) {
	std::lock_guard<std::mutex> lck(mutex);
	auto status = BeginOperation(FakeXRootDOperation::MV);
	if (!status.IsOk()) {
		return status;
	}
	const auto source_path = NormalizeServerPath(source);
	const auto target_path = NormalizeServerPath(target);
	if (nodes.find(source_path) == nodes.end()) {
		return NotFound(source_path);
	}
	if (nodes.find(target_path) != nodes.end()) {
		return AlreadyExists(target_path);
	}
	status = CheckParent(target_path);
	if (!status.IsOk()) {
		return status;
	}
	if (PathUtils::HasPathPrefix(target_path, source_path)) {
		return XRootDStatus::Error(XRootDErrno::INVALID_REQUEST,
		                           StringUtil::Format("Unable to move %s into itself", source_path));
	}

	// Move the node together with everything below it.
	vector<std::pair<string, Node>> moved_nodes;
	auto source_iter = nodes.find(source_path);
	moved_nodes.emplace_back(target_path, std::move(source_iter->second));
	nodes.erase(source_iter);
	const string source_prefix = source_path + "/";
	for (auto iter = nodes.lower_bound(source_prefix);
	     iter != nodes.end() && StringUtil::StartsWith(iter->first, source_prefix);) {
		moved_nodes.emplace_back(target_path + iter->first.substr(source_path.length()), std::move(iter->second));
		iter = nodes.erase(iter);
	}
	for (auto &cur_node : moved_nodes) {
		nodes[cur_node.first] = std::move(cur_node.second);
	}
	return XRootDStatus::Ok();
}

XRootDStatus FakeXRootDServer::Query(XRootDQueryCode code, const string &arg, string &response) {
	std::lock_guard<std::mutex> lck(mutex);
	auto status = BeginOperation(FakeXRootDOperation::QUERY);
	if (!status.IsOk()) {
		return status;
	}
	const auto normalized_path = NormalizeServerPath(arg);
	auto iter = nodes.find(normalized_path);
	if (iter == nodes.end()) {
		return NotFound(normalized_path);
	}
	const auto &node = iter->second;

	switch (code) {
	case XRootDQueryCode::CHECKSUM:
		if (!checksum_supported) {
			return XRootDStatus::Error(XRootDErrno::UNSUPPORTED, "Checksums are not supported");
		}
		if (node.is_dir) {
			return IsADirectory(normalized_path);
		}
		response = PadResponse(StringUtil::Format("%s %08x", CHECKSUM_ALGORITHM, Adler32(node.content)));
		return XRootDStatus::Ok();
	case XRootDQueryCode::XATTR: {
		const auto info = GetStatInfo(node);
		const string overrides = attribute_overrides.empty() ? "" : attribute_overrides + "&";
		response = PadResponse(overrides + StringUtil::Format(
		    "oss.cgroup=default&oss.type=%s&oss.used=%llu&oss.mt=%llu&oss.ct=%llu&oss.at=%llu&oss.u=*&oss.g=*&oss.fs=w",
		    node.is_dir ? "d" : "f", info.size, node.modified_time, node.created_time, node.accessed_time));
		return XRootDStatus::Ok();
	}
	default:
		return XRootDStatus::Error(XRootDErrno::UNSUPPORTED, "Unsupported query code");
	}
}

XRootDStatus FakeXRootDServer::Copy(const string &source, const string &target, bool force) {
	std::lock_guard<std::mutex> lck(mutex);
	auto status = BeginOperation(FakeXRootDOperation::COPY);
	if (!status.IsOk()) {
		return status;
	}
	const auto source_path = NormalizeServerPath(source);
	const auto target_path = NormalizeServerPath(target);
	auto source_iter = nodes.find(source_path);
	if (source_iter == nodes.end()) {
		return NotFound(source_path);
	}
	if (source_iter->second.is_dir) {
		return IsADirectory(source_path);
	}
	auto target_iter = nodes.find(target_path);
	if (target_iter != nodes.end()) {
		if (target_iter->second.is_dir) {
			return IsADirectory(target_path);
		}
		if (!force) {
			return AlreadyExists(target_path);
		}
	}
	status = CheckParent(target_path);
	if (!status.IsOk()) {
		return status;
	}

	auto content = source_iter->second.content;
	auto &target_node = nodes[target_path];
	target_node.is_dir = false;
	target_node.content = std::move(content);
	target_node.created_time = target_node.modified_time = target_node.accessed_time = Tick();
	return XRootDStatus::Ok();
}

//===--------------------------------------------------------------------===//
// FakeXRootDFile
//===--------------------------------------------------------------------===//

XRootDStatus FakeXRootDFile::CheckOpen() const {
	if (!is_open) {
		return XRootDStatus::Error(XRootDErrno::INVALID_REQUEST, "File is not opened");
	}
	return XRootDStatus::Ok();
}

XRootDStatus FakeXRootDFile::Open(const string &url, XRootDOpenFlags flags) {
	if (is_open) {
		return XRootDStatus::Error(XRootDErrno::INVALID_REQUEST, "File is already opened");
	}
	if (!URLUtils::IsValidXRootDUrl(url)) {
		return XRootDStatus::Error(XRootDErrno::INVALID_REQUEST, StringUtil::Format("Invalid URL %s", url));
	}
	const auto file_path = NormalizeServerPath(URLUtils::ParseURL(url).path);
	const auto status = server->OpenFile(file_path, flags);
	if (!status.IsOk()) {
		return status;
	}
	path = file_path;
	open_flags = flags;
	is_open = true;
	return XRootDStatus::Ok();
}

XRootDStatus FakeXRootDFile::Read(uint64_t offset, uint32_t size, string &out) {
	const auto status = CheckOpen();
	if (!status.IsOk()) {
		return status;
	}
	return server->ReadFile(path, offset, size, out);
}

XRootDStatus FakeXRootDFile::Write(uint64_t offset, const char *data, uint32_t size) {
	const auto status = CheckOpen();
	if (!status.IsOk()) {
		return status;
	}
	if (open_flags == XRootDOpenFlags::READ) {
		return XRootDStatus::Error(XRootDErrno::INVALID_REQUEST,
		                           StringUtil::Format("File %s is opened for reading only", path));
	}
	return server->WriteFile(path, offset, data, size);
}

XRootDStatus FakeXRootDFile::Stat(XRootDStatInfo &info) {
	const auto status = CheckOpen();
	if (!status.IsOk()) {
		return status;
	}
	return server->StatFile(path, info);
}

XRootDStatus FakeXRootDFile::Truncate(uint64_t size) {
	const auto status = CheckOpen();
	if (!status.IsOk()) {
		return status;
	}
	return server->TruncateFile(path, size);
}

XRootDStatus FakeXRootDFile::Sync() {
	const auto status = CheckOpen();
	if (!status.IsOk()) {
		return status;
	}
	return server->Touch(FakeXRootDOperation::SYNC);
}

XRootDStatus FakeXRootDFile::Close() {
	const auto status = CheckOpen();
	if (!status.IsOk()) {
		return status;
	}
	// The file counts as closed even if the server reports a failure.
	is_open = false;
	return server->Touch(FakeXRootDOperation::CLOSE);
}

//===--------------------------------------------------------------------===//
// FakeXRootDFileSystem
//===--------------------------------------------------------------------===//

XRootDStatus FakeXRootDFileSystem::Stat(const string &path, XRootDStatInfo &info) {
	return server->Stat(path, info);
}

XRootDStatus FakeXRootDFileSystem::DirList(const string &path, bool with_stat, vector<XRootDDirEntry> &entries) {
	return server->DirList(path, with_stat, entries);
}

XRootDStatus FakeXRootDFileSystem::MkDir(const string &path, bool make_path) {
	return server->MkDir(path, make_path);
}

XRootDStatus FakeXRootDFileSystem::Rm(const string &path) {
	return server->Rm(path);
}

XRootDStatus FakeXRootDFileSystem::RmDir(const string &path) {
	return server->RmDir(path);
}

XRootDStatus FakeXRootDFileSystem::Mv(const string &source, const string &target) {
	return server->Mv(source, target);
}

XRootDStatus FakeXRootDFileSystem::Query(XRootDQueryCode code, const string &arg, string &response) {
	return server->Query(code, arg, response);
}

XRootDStatus FakeXRootDFileSystem::Ping() {
	return server->Touch(FakeXRootDOperation::PING);
}

//===--------------------------------------------------------------------===//
// FakeXRootDCopyProcess
//===--------------------------------------------------------------------===//

XRootDStatus FakeXRootDCopyProcess::AddJob(const string &source, const string &target, bool force) {
	if (!URLUtils::IsValidXRootDUrl(source) || !URLUtils::IsValidXRootDUrl(target)) {
		return XRootDStatus::Error(XRootDErrno::INVALID_REQUEST,
		                           StringUtil::Format("Invalid copy job from %s to %s", source, target));
	}
	CopyJob job;
	job.source_path = URLUtils::ParseURL(source).path;
	job.target_path = URLUtils::ParseURL(target).path;
	job.force = force;
	jobs.emplace_back(std::move(job));
	prepared = false;
	return XRootDStatus::Ok();
}

XRootDStatus FakeXRootDCopyProcess::Prepare() {
	prepared = true;
	return XRootDStatus::Ok();
}

XRootDStatus FakeXRootDCopyProcess::Run() {
	if (!prepared) {
		return XRootDStatus::Error(XRootDErrno::INVALID_REQUEST, "Copy process is not prepared");
	}

	vector<XRootDStatus> job_status(jobs.size());
	{
		ThreadPool thread_pool(GetParallelCopyJobCount(jobs.size()), "xrootd-copy");
		for (idx_t idx = 0; idx < jobs.size(); ++idx) {
			thread_pool.Push([this, idx, &job_status]() {
				const auto &cur_job = jobs[idx];
				job_status[idx] = server->Copy(cur_job.source_path, cur_job.target_path, cur_job.force);
			});
		}
		thread_pool.Wait();
	}

	for (auto &cur_status : job_status) {
		if (!cur_status.IsOk()) {
			return cur_status;
		}
	}
	return XRootDStatus::Ok();
}

//===--------------------------------------------------------------------===//
// FakeXRootDClientFactory
//===--------------------------------------------------------------------===//

void FakeXRootDClientFactory::RecordConfig(const XRootDClientConfig &config) {
	std::lock_guard<std::mutex> lck(mutex);
	last_config = config;
}

unique_ptr<XRootDRemoteFile> FakeXRootDClientFactory::CreateFile(const XRootDClientConfig &config) {
	RecordConfig(config);
	return make_uniq<FakeXRootDFile>(server);
}

unique_ptr<XRootDRemoteFileSystem> FakeXRootDClientFactory::CreateFileSystem(const string &root_url,
                                                                             const XRootDClientConfig &config) {
	RecordConfig(config);
	{
		std::lock_guard<std::mutex> lck(mutex);
		root_urls.emplace_back(root_url);
	}
	return make_uniq<FakeXRootDFileSystem>(server);
}

unique_ptr<XRootDCopyProcess> FakeXRootDClientFactory::CreateCopyProcess(const XRootDClientConfig &config) {
	RecordConfig(config);
	{
		std::lock_guard<std::mutex> lck(mutex);
		++copy_process_count;
	}
	return make_uniq<FakeXRootDCopyProcess>(server);
}

vector<string> FakeXRootDClientFactory::GetRootUrls() const {
	std::lock_guard<std::mutex> lck(mutex);
	return root_urls;
}

XRootDClientConfig FakeXRootDClientFactory::GetLastClientConfig() const {
	std::lock_guard<std::mutex> lck(mutex);
	return last_config;
}

idx_t FakeXRootDClientFactory::GetCopyProcessCount() const {
	std::lock_guard<std::mutex> lck(mutex);
	return copy_process_count;
}

} // namespace duckdb
