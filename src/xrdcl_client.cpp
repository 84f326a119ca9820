#include "xrdcl_client.hpp"

#include "XrdCl/XrdClBuffer.hh"
#include "XrdCl/XrdClDefaultEnv.hh"
#include "XrdCl/XrdClEnv.hh"
#include "XrdCl/XrdClURL.hh"
#include "duckdb/common/helper.hpp"
#include "duckdb/common/numeric_utils.hpp"
#include "xrootd_filesystem_config.hpp"

namespace duckdb {

namespace {

// Permission bits for newly created files and directories, rw-r--r-- and rwxr-xr-x.
const XrdCl::Access::Mode NEW_FILE_ACCESS =
    XrdCl::Access::UR | XrdCl::Access::UW | XrdCl::Access::GR | XrdCl::Access::OR;
const XrdCl::Access::Mode NEW_DIR_ACCESS = XrdCl::Access::UR | XrdCl::Access::UW | XrdCl::Access::UX |
                                           XrdCl::Access::GR | XrdCl::Access::GX | XrdCl::Access::OR |
                                           XrdCl::Access::OX;

XRootDStatInfo ToXRootDStatInfo(const XrdCl::StatInfo &stat_info) {
	XRootDStatInfo info;
	info.size = stat_info.GetSize();
	info.flags = stat_info.GetFlags();
	info.modification_time = stat_info.GetModTime();
	return info;
}

} // namespace

XRootDStatus ToXRootDStatus(const XrdCl::XRootDStatus &status) {
	if (status.IsOK()) {
		return XRootDStatus::Ok();
	}
	return XRootDStatus::Error(status.errNo, status.ToString());
}

//===--------------------------------------------------------------------===//
// XrdClRemoteFile
//===--------------------------------------------------------------------===//

XRootDStatus XrdClRemoteFile::Open(const string &url, XRootDOpenFlags flags) {
	const auto open_flags = static_cast<XrdCl::OpenFlags::Flags>(static_cast<uint16_t>(flags));
	const auto access = flags == XRootDOpenFlags::DELETE ? NEW_FILE_ACCESS : XrdCl::Access::None;
	return ToXRootDStatus(file.Open(url, open_flags, access));
}

XRootDStatus XrdClRemoteFile::Read(uint64_t offset, uint32_t size, string &out) {
	out.resize(size);
	uint32_t bytes_read = 0;
	const auto status = file.Read(offset, size, &out[0], bytes_read);
	out.resize(status.IsOK() ? bytes_read : 0);
	return ToXRootDStatus(status);
}

XRootDStatus XrdClRemoteFile::Write(uint64_t offset, const char *data, uint32_t size) {
	return ToXRootDStatus(file.Write(offset, size, data));
}

XRootDStatus XrdClRemoteFile::Stat(XRootDStatInfo &info) {
	XrdCl::StatInfo *response = nullptr;
	const auto status = file.Stat(/*force=*/true, response);
	unique_ptr<XrdCl::StatInfo> stat_info(response);
	if (status.IsOK() && stat_info != nullptr) {
		info = ToXRootDStatInfo(*stat_info);
	}
	return ToXRootDStatus(status);
}

XRootDStatus XrdClRemoteFile::Truncate(uint64_t size) {
	return ToXRootDStatus(file.Truncate(size));
}

XRootDStatus XrdClRemoteFile::Sync() {
	return ToXRootDStatus(file.Sync());
}

XRootDStatus XrdClRemoteFile::Close() {
	return ToXRootDStatus(file.Close());
}

bool XrdClRemoteFile::IsOpen() const {
	return file.IsOpen();
}

//===--------------------------------------------------------------------===//
// XrdClRemoteFileSystem
//===--------------------------------------------------------------------===//

XrdClRemoteFileSystem::XrdClRemoteFileSystem(const string &root_url) : filesystem(XrdCl::URL(root_url)) {
}

XRootDStatus XrdClRemoteFileSystem::Stat(const string &path, XRootDStatInfo &info) {
	XrdCl::StatInfo *response = nullptr;
	const auto status = filesystem.Stat(path, response);
	unique_ptr<XrdCl::StatInfo> stat_info(response);
	if (status.IsOK() && stat_info != nullptr) {
		info = ToXRootDStatInfo(*stat_info);
	}
	return ToXRootDStatus(status);
}

XRootDStatus XrdClRemoteFileSystem::DirList(const string &path, bool with_stat, vector<XRootDDirEntry> &entries) {
	const auto flags = with_stat ? XrdCl::DirListFlags::Stat : XrdCl::DirListFlags::None;
	XrdCl::DirectoryList *response = nullptr;
	const auto status = filesystem.DirList(path, flags, response);
	unique_ptr<XrdCl::DirectoryList> dir_list(response);
	if (!status.IsOK() || dir_list == nullptr) {
		return ToXRootDStatus(status);
	}

	entries.clear();
	entries.reserve(dir_list->GetSize());
	for (auto iter = dir_list->Begin(); iter != dir_list->End(); ++iter) {
		XRootDDirEntry entry;
		entry.name = (*iter)->GetName();
		const auto *stat_info = (*iter)->GetStatInfo();
		if (stat_info != nullptr) {
			entry.has_stat_info = true;
			entry.stat_info = ToXRootDStatInfo(*stat_info);
		}
		entries.emplace_back(std::move(entry));
	}
	return XRootDStatus::Ok();
}

XRootDStatus XrdClRemoteFileSystem::MkDir(const string &path, bool make_path) {
	const auto flags = make_path ? XrdCl::MkDirFlags::MakePath : XrdCl::MkDirFlags::None;
	return ToXRootDStatus(filesystem.MkDir(path, flags, NEW_DIR_ACCESS));
}

XRootDStatus XrdClRemoteFileSystem::Rm(const string &path) {
	return ToXRootDStatus(filesystem.Rm(path));
}

XRootDStatus XrdClRemoteFileSystem::RmDir(const string &path) {
	return ToXRootDStatus(filesystem.RmDir(path));
}

XRootDStatus XrdClRemoteFileSystem::Mv(const string &source, const string &target) {
	return ToXRootDStatus(filesystem.Mv(source, target));
}

XRootDStatus XrdClRemoteFileSystem::Query(XRootDQueryCode code, const string &arg, string &response) {
	XrdCl::Buffer query_arg;
	query_arg.FromString(arg);
	XrdCl::Buffer *raw_response = nullptr;
	const auto status =
	    filesystem.Query(static_cast<XrdCl::QueryCode::Code>(static_cast<uint16_t>(code)), query_arg, raw_response);
	unique_ptr<XrdCl::Buffer> query_response(raw_response);
	if (status.IsOK() && query_response != nullptr) {
		response.assign(query_response->GetBuffer(), query_response->GetSize());
	}
	return ToXRootDStatus(status);
}

XRootDStatus XrdClRemoteFileSystem::Ping() {
	return ToXRootDStatus(filesystem.Ping());
}

//===--------------------------------------------------------------------===//
// XrdClCopyProcess
//===--------------------------------------------------------------------===//

XRootDStatus XrdClCopyProcess::AddJob(const string &source, const string &target, bool force) {
	XrdCl::PropertyList properties;
	properties.Set("source", source);
	properties.Set("target", target);
	properties.Set("force", force);
	job_results.emplace_back(make_uniq<XrdCl::PropertyList>());
	const auto status = ToXRootDStatus(process.AddJob(properties, job_results.back().get()));
	if (status.IsOk()) {
		++job_count;
	}
	return status;
}

XRootDStatus XrdClCopyProcess::Prepare() {
	XrdCl::PropertyList config;
	config.Set("jobType", "configuration");
	config.Set("parallel", NumericCast<uint32_t>(GetParallelCopyJobCount(job_count)));
	const auto config_status = process.AddJob(config, nullptr);
	if (!config_status.IsOK()) {
		return ToXRootDStatus(config_status);
	}
	return ToXRootDStatus(process.Prepare());
}

XRootDStatus XrdClCopyProcess::Run() {
	const auto status = process.Run(/*handler=*/nullptr);
	if (!status.IsOK()) {
		return ToXRootDStatus(status);
	}
	// Run only reports setup failures, each job reports its own outcome.
	for (auto &cur_result : job_results) {
		XrdCl::XRootDStatus job_status;
		if (cur_result->Get("status", job_status) && !job_status.IsOK()) {
			return ToXRootDStatus(job_status);
		}
	}
	return XRootDStatus::Ok();
}

//===--------------------------------------------------------------------===//
// XrdClClientFactory
//===--------------------------------------------------------------------===//

void XrdClClientFactory::ApplyClientConfig(const XRootDClientConfig &config) {
	std::lock_guard<std::mutex> lck(mutex);
	auto *env = XrdCl::DefaultEnv::GetEnv();
	env->PutInt("RequestTimeout", NumericCast<int>(config.request_timeout));
	env->PutInt("TimeoutResolution", NumericCast<int>(config.timeout_resolution));
	env->PutInt("ConnectionWindow", NumericCast<int>(config.connection_window));
	env->PutInt("ConnectionRetry", NumericCast<int>(config.connection_retry));
}

unique_ptr<XRootDRemoteFile> XrdClClientFactory::CreateFile(const XRootDClientConfig &config) {
	ApplyClientConfig(config);
	return make_uniq<XrdClRemoteFile>();
}

unique_ptr<XRootDRemoteFileSystem> XrdClClientFactory::CreateFileSystem(const string &root_url,
                                                                         const XRootDClientConfig &config) {
	ApplyClientConfig(config);
	return make_uniq<XrdClRemoteFileSystem>(root_url);
}

unique_ptr<XRootDCopyProcess> XrdClClientFactory::CreateCopyProcess(const XRootDClientConfig &config) {
	ApplyClientConfig(config);
	return make_uniq<XrdClCopyProcess>();
}

} // namespace duckdb
