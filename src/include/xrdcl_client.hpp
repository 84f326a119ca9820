// Remote client boundary implemented on top of the XRootD client library (XrdCl).
//
// Each class is a one-call-per-method adapter: XrdCl statuses are converted into [XRootDStatus] values and returned,
// never thrown. Connection settings are process wide in XrdCl, they're written into the default environment whenever
// a client is created.

#pragma once

#include <mutex>

#include "XrdCl/XrdClCopyProcess.hh"
#include "XrdCl/XrdClFile.hh"
#include "XrdCl/XrdClFileSystem.hh"
#include "XrdCl/XrdClPropertyList.hh"
#include "duckdb/common/string.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include "duckdb/common/vector.hpp"
#include "xrootd_client.hpp"

namespace duckdb {

// Convert an XrdCl status, the server errno is kept for error responses.
XRootDStatus ToXRootDStatus(const XrdCl::XRootDStatus &status);

class XrdClRemoteFile : public XRootDRemoteFile {
public:
	XrdClRemoteFile() = default;

	XRootDStatus Open(const string &url, XRootDOpenFlags flags) override;
	XRootDStatus Read(uint64_t offset, uint32_t size, string &out) override;
	XRootDStatus Write(uint64_t offset, const char *data, uint32_t size) override;
	XRootDStatus Stat(XRootDStatInfo &info) override;
	XRootDStatus Truncate(uint64_t size) override;
	XRootDStatus Sync() override;
	XRootDStatus Close() override;
	bool IsOpen() const override;

private:
	XrdCl::File file;
};

class XrdClRemoteFileSystem : public XRootDRemoteFileSystem {
public:
	// [root_url] is "scheme://host[:port]", optionally followed by "/?query".
	explicit XrdClRemoteFileSystem(const string &root_url);

	XRootDStatus Stat(const string &path, XRootDStatInfo &info) override;
	XRootDStatus DirList(const string &path, bool with_stat, vector<XRootDDirEntry> &entries) override;
	XRootDStatus MkDir(const string &path, bool make_path) override;
	XRootDStatus Rm(const string &path) override;
	XRootDStatus RmDir(const string &path) override;
	XRootDStatus Mv(const string &source, const string &target) override;
	XRootDStatus Query(XRootDQueryCode code, const string &arg, string &response) override;
	XRootDStatus Ping() override;

private:
	XrdCl::FileSystem filesystem;
};

// Copy jobs run [GetParallelCopyJobCount] at a time, applied right before preparation.
class XrdClCopyProcess : public XRootDCopyProcess {
public:
	XrdClCopyProcess() = default;

	XRootDStatus AddJob(const string &source, const string &target, bool force) override;
	XRootDStatus Prepare() override;
	XRootDStatus Run() override;

private:
	XrdCl::CopyProcess process;
	idx_t job_count = 0;
	// Per-job results filled in by XrdCl, addresses have to stay stable until [Run] returns.
	vector<unique_ptr<XrdCl::PropertyList>> job_results;
};

class XrdClClientFactory : public XRootDClientFactory {
public:
	unique_ptr<XRootDRemoteFile> CreateFile(const XRootDClientConfig &config) override;
	unique_ptr<XRootDRemoteFileSystem> CreateFileSystem(const string &root_url,
	                                                    const XRootDClientConfig &config) override;
	unique_ptr<XRootDCopyProcess> CreateCopyProcess(const XRootDClientConfig &config) override;

private:
	// Write connection settings into the XrdCl default environment.
	void ApplyClientConfig(const XRootDClientConfig &config);

	std::mutex mutex;
};

} // namespace duckdb
