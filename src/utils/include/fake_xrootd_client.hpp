// An in-memory XRootD server and the remote clients talking to it, for testing purpose.
//
// The fake server keeps a namespace of directories and files, and answers remote calls with the errno values a real
// XRootD server reports. Failures could be injected per operation, and every call is counted, so tests could assert
// how many round trips an operation takes.
//
// WARNING: fake clients are used for testing purpose and shouldn't be used in production.

#pragma once

#include <cstdint>
#include <mutex>

#include "duckdb/common/map.hpp"
#include "duckdb/common/queue.hpp"
#include "duckdb/common/shared_ptr.hpp"
#include "duckdb/common/string.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include "duckdb/common/unordered_map.hpp"
#include "duckdb/common/vector.hpp"
#include "xrootd_client.hpp"

namespace duckdb {

enum class FakeXRootDOperation : uint8_t {
	OPEN,
	READ,
	WRITE,
	FILE_STAT,
	TRUNCATE,
	SYNC,
	CLOSE,
	STAT,
	DIRLIST,
	MKDIR,
	RM,
	RMDIR,
	MV,
	QUERY,
	PING,
	COPY,
};

class FakeXRootDServer {
public:
	FakeXRootDServer();

	//===--------------------------------------------------------------------===//
	// Namespace setup and inspection, paths are server absolute ("//a/b" or "/a/b")
	//===--------------------------------------------------------------------===//

	// Create directory at [path] together with missing parents.
	void AddDirectory(const string &path);
	// Create or replace file at [path], missing parents are created.
	void AddFile(const string &path, string content);
	bool HasPath(const string &path) const;
	bool IsDirectory(const string &path) const;
	// Content of the file at [path], throws if it's not a file.
	string GetFileContent(const string &path) const;

	//===--------------------------------------------------------------------===//
	// Behavior knobs
	//===--------------------------------------------------------------------===//

	// Let the next call of [operation] fail with [status]; injections for one operation are consumed in order.
	void InjectFailure(FakeXRootDOperation operation, XRootDStatus status);
	// Checksum queries fail with "unsupported" when disabled, like a default local server.
	void SetChecksumSupported(bool supported);
	// When unreachable, every call fails with a connection error.
	void SetReachable(bool reachable);
	// Attributes answered ahead of the generated ones on extended attribute queries, i.e. "oss.mt=123".
	void SetAttributeOverrides(string attributes);
	// Number of calls of [operation] so far, including failed ones.
	idx_t GetOperationCount(FakeXRootDOperation operation) const;
	void ResetOperationCount();

	//===--------------------------------------------------------------------===//
	// Remote calls
	//===--------------------------------------------------------------------===//

	XRootDStatus OpenFile(const string &path, XRootDOpenFlags flags);
	XRootDStatus ReadFile(const string &path, uint64_t offset, uint32_t size, string &out);
	XRootDStatus WriteFile(const string &path, uint64_t offset, const char *data, uint32_t size);
	XRootDStatus TruncateFile(const string &path, uint64_t size);
	XRootDStatus StatFile(const string &path, XRootDStatInfo &info);
	// Calls without any effect on the namespace, only counted and subject to injection.
	XRootDStatus Touch(FakeXRootDOperation operation);

	XRootDStatus Stat(const string &path, XRootDStatInfo &info);
	XRootDStatus DirList(const string &path, bool with_stat, vector<XRootDDirEntry> &entries);
	XRootDStatus MkDir(const string &path, bool make_path);
	XRootDStatus Rm(const string &path);
	XRootDStatus RmDir(const string &path);
	XRootDStatus Mv(const string &source, const string &target);
	XRootDStatus Query(XRootDQueryCode code, const string &arg, string &response);
	XRootDStatus Copy(const string &source, const string &target, bool force);

private:
	struct Node {
		bool is_dir = false;
		string content;
		uint64_t created_time = 0;
		uint64_t modified_time = 0;
		uint64_t accessed_time = 0;
	};

	// Count the call, then return the injected failure or the connection error if any.
	XRootDStatus BeginOperation(FakeXRootDOperation operation);
	// Create a node at [path] with missing parents; the caller holds [mutex].
	Node &CreateNodeWithParents(const string &path, bool is_dir);
	// Check that the parent of [path] is an existing directory; the caller holds [mutex].
	XRootDStatus CheckParent(const string &path) const;
	bool HasChildren(const string &path) const;
	XRootDStatInfo GetStatInfo(const Node &node) const;
	uint64_t Tick();

	mutable std::mutex mutex;
	// Keyed by normalized path with a single leading slash.
	map<string, Node> nodes;
	unordered_map<uint8_t, queue<XRootDStatus>> injected_failures;
	unordered_map<uint8_t, idx_t> operation_counts;
	bool checksum_supported = true;
	bool reachable = true;
	string attribute_overrides;
	// Logical clock in seconds since epoch, moves on each mutation.
	uint64_t current_time;
};

class FakeXRootDFile : public XRootDRemoteFile {
public:
	explicit FakeXRootDFile(shared_ptr<FakeXRootDServer> server_p) : server(std::move(server_p)) {
	}

	XRootDStatus Open(const string &url, XRootDOpenFlags flags) override;
	XRootDStatus Read(uint64_t offset, uint32_t size, string &out) override;
	XRootDStatus Write(uint64_t offset, const char *data, uint32_t size) override;
	XRootDStatus Stat(XRootDStatInfo &info) override;
	XRootDStatus Truncate(uint64_t size) override;
	XRootDStatus Sync() override;
	XRootDStatus Close() override;
	bool IsOpen() const override {
		return is_open;
	}

private:
	XRootDStatus CheckOpen() const;

	shared_ptr<FakeXRootDServer> server;
	string path;
	XRootDOpenFlags open_flags = XRootDOpenFlags::NONE;
	bool is_open = false;
};

class FakeXRootDFileSystem : public XRootDRemoteFileSystem {
public:
	explicit FakeXRootDFileSystem(shared_ptr<FakeXRootDServer> server_p) : server(std::move(server_p)) {
	}

	XRootDStatus Stat(const string &path, XRootDStatInfo &info) override;
	XRootDStatus DirList(const string &path, bool with_stat, vector<XRootDDirEntry> &entries) override;
	XRootDStatus MkDir(const string &path, bool make_path) override;
	XRootDStatus Rm(const string &path) override;
	XRootDStatus RmDir(const string &path) override;
	XRootDStatus Mv(const string &source, const string &target) override;
	XRootDStatus Query(XRootDQueryCode code, const string &arg, string &response) override;
	XRootDStatus Ping() override;

private:
	shared_ptr<FakeXRootDServer> server;
};

// Runs queued copy jobs on a thread pool, sized like the XrdCl "parallel" property.
class FakeXRootDCopyProcess : public XRootDCopyProcess {
public:
	explicit FakeXRootDCopyProcess(shared_ptr<FakeXRootDServer> server_p) : server(std::move(server_p)) {
	}

	XRootDStatus AddJob(const string &source, const string &target, bool force) override;
	XRootDStatus Prepare() override;
	XRootDStatus Run() override;

	idx_t GetJobCount() const {
		return jobs.size();
	}

private:
	struct CopyJob {
		string source_path;
		string target_path;
		bool force = false;
	};

	shared_ptr<FakeXRootDServer> server;
	vector<CopyJob> jobs;
	bool prepared = false;
};

class FakeXRootDClientFactory : public XRootDClientFactory {
public:
	explicit FakeXRootDClientFactory(shared_ptr<FakeXRootDServer> server_p) : server(std::move(server_p)) {
	}

	unique_ptr<XRootDRemoteFile> CreateFile(const XRootDClientConfig &config) override;
	unique_ptr<XRootDRemoteFileSystem> CreateFileSystem(const string &root_url,
	                                                    const XRootDClientConfig &config) override;
	unique_ptr<XRootDCopyProcess> CreateCopyProcess(const XRootDClientConfig &config) override;

	// Root URLs of all filesystem clients created so far.
	vector<string> GetRootUrls() const;
	// Client config handed over on the last client creation.
	XRootDClientConfig GetLastClientConfig() const;
	// Number of copy processes created so far.
	idx_t GetCopyProcessCount() const;

private:
	void RecordConfig(const XRootDClientConfig &config);

	shared_ptr<FakeXRootDServer> server;
	mutable std::mutex mutex;
	vector<string> root_urls;
	XRootDClientConfig last_config;
	idx_t copy_process_count = 0;
};

} // namespace duckdb
