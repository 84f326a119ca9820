// Remote client boundary for XRootD access.
//
// Every remote primitive reports its outcome through [XRootDStatus] rather than exceptions; statuses are turned into
// exceptions at exactly one place, see "xrootd_status.hpp".

#pragma once

#include <cstdint>

#include "duckdb/common/shared_ptr.hpp"
#include "duckdb/common/string.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include "duckdb/common/vector.hpp"

namespace duckdb {

// Well-known XRootD errno values.
struct XRootDErrno {
	// POSIX EEXIST, returned by some servers for existing destinations.
	static constexpr uint32_t POSIX_EXISTS = 17;
	// Legacy (v4) "item already exists".
	static constexpr uint32_t ITEM_EXISTS = 3006;
	// v5 "item already exists".
	static constexpr uint32_t ITEM_EXISTS_V5 = 3018;
	// Directory not empty, or a path component is not a directory.
	static constexpr uint32_t NOT_EMPTY = 3005;
	static constexpr uint32_t NOT_FOUND = 3011;
	static constexpr uint32_t UNSUPPORTED = 3013;
	static constexpr uint32_t IO_ERROR = 3007;
	static constexpr uint32_t INVALID_REQUEST = 3010;
};

// Outcome of a single remote call.
struct XRootDStatus {
	bool ok = true;
	// Server or client error number, 0 on success.
	uint32_t err_no = 0;
	string message;

	static XRootDStatus Ok() {
		return XRootDStatus {};
	}
	static XRootDStatus Error(uint32_t err_no, string message) {
		XRootDStatus status;
		status.ok = false;
		status.err_no = err_no;
		status.message = std::move(message);
		return status;
	}
	bool IsOk() const {
		return ok;
	}
	string ToString() const;
};

// Bits of [XRootDStatInfo::flags], values match XrdCl::StatInfo::Flags.
struct XRootDStatFlags {
	static constexpr uint32_t X_BIT_SET = 1;
	static constexpr uint32_t IS_DIR = 2;
	static constexpr uint32_t OTHER = 4;
	static constexpr uint32_t OFFLINE = 8;
	static constexpr uint32_t IS_READABLE = 16;
	static constexpr uint32_t IS_WRITABLE = 32;
};

struct XRootDStatInfo {
	uint64_t size = 0;
	uint32_t flags = 0;
	// Seconds since epoch.
	uint64_t modification_time = 0;

	bool TestFlags(uint32_t mask) const {
		return (flags & mask) != 0;
	}
};

struct XRootDDirEntry {
	string name;
	// Only meaningful when the listing was requested with stat info.
	bool has_stat_info = false;
	XRootDStatInfo stat_info;
};

// Open flags, values match XrdCl::OpenFlags.
enum class XRootDOpenFlags : uint16_t {
	NONE = 0,
	// Delete existing file and create a new one.
	DELETE = 0x0002,
	READ = 0x0010,
	// Open for reading and writing, without truncation.
	UPDATE = 0x0020,
};

// Query codes, values match XrdCl::QueryCode.
enum class XRootDQueryCode : uint16_t {
	CHECKSUM = 3,
	XATTR = 4,
};

// Connection level settings handed to client factories.
struct XRootDClientConfig {
	// Seconds to wait for a response to a request.
	uint64_t request_timeout = 0;
	// Seconds between timeout checks.
	uint64_t timeout_resolution = 0;
	// Seconds in which a single connection attempt is made.
	uint64_t connection_window = 0;
	// Number of connection windows before declaring permanent failure.
	uint64_t connection_retry = 0;
};

// A single remote file, addressed by explicit byte offsets.
class XRootDRemoteFile {
public:
	virtual ~XRootDRemoteFile() = default;

	virtual XRootDStatus Open(const string &url, XRootDOpenFlags flags) = 0;
	// Read at most [size] bytes at [offset] into [out]; short reads signal end of file.
	virtual XRootDStatus Read(uint64_t offset, uint32_t size, string &out) = 0;
	virtual XRootDStatus Write(uint64_t offset, const char *data, uint32_t size) = 0;
	virtual XRootDStatus Stat(XRootDStatInfo &info) = 0;
	virtual XRootDStatus Truncate(uint64_t size) = 0;
	virtual XRootDStatus Sync() = 0;
	virtual XRootDStatus Close() = 0;
	virtual bool IsOpen() const = 0;
};

// Namespace operations against one server, paths are server absolute (i.e. "//tmp/file").
class XRootDRemoteFileSystem {
public:
	virtual ~XRootDRemoteFileSystem() = default;

	virtual XRootDStatus Stat(const string &path, XRootDStatInfo &info) = 0;
	virtual XRootDStatus DirList(const string &path, bool with_stat, vector<XRootDDirEntry> &entries) = 0;
	virtual XRootDStatus MkDir(const string &path, bool make_path) = 0;
	virtual XRootDStatus Rm(const string &path) = 0;
	virtual XRootDStatus RmDir(const string &path) = 0;
	virtual XRootDStatus Mv(const string &source, const string &target) = 0;
	// Raw response bytes, which might carry trailing NUL padding.
	virtual XRootDStatus Query(XRootDQueryCode code, const string &arg, string &response) = 0;
	virtual XRootDStatus Ping() = 0;
};

// Batch of third-party copy jobs, executed together on [Run].
class XRootDCopyProcess {
public:
	virtual ~XRootDCopyProcess() = default;

	// [source] and [target] are full URLs.
	virtual XRootDStatus AddJob(const string &source, const string &target, bool force) = 0;
	virtual XRootDStatus Prepare() = 0;
	// Blocks until all jobs finish; reports the first failed job.
	virtual XRootDStatus Run() = 0;
};

class XRootDClientFactory {
public:
	virtual ~XRootDClientFactory() = default;

	virtual unique_ptr<XRootDRemoteFile> CreateFile(const XRootDClientConfig &config) = 0;
	// [root_url] is "scheme://host[:port]", optionally followed by "/?query".
	virtual unique_ptr<XRootDRemoteFileSystem> CreateFileSystem(const string &root_url,
	                                                            const XRootDClientConfig &config) = 0;
	virtual unique_ptr<XRootDCopyProcess> CreateCopyProcess(const XRootDClientConfig &config) = 0;
};

} // namespace duckdb
