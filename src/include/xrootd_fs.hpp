// Filesystem facade over one XRootD namespace.
//
// A facade is bound to a root URL ("root://host:port") and a base path ("//eos/user/"); every path passed in is
// resolved against the base path. Namespace operations are delegated to a remote filesystem client, files are opened
// as [XRootDFileHandle].
//
// Facades hold no mutable state, and could be shared among threads as long as the remote client is thread-safe.

#pragma once

#include <functional>
#include <utility>

#include "duckdb/common/optional_idx.hpp"
#include "duckdb/common/string.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include "duckdb/common/vector.hpp"
#include "url_utils.hpp"
#include "xrootd_client.hpp"
#include "xrootd_file_handle.hpp"

namespace duckdb {

// Forward declaration.
class XRootDFileSystem;

// Filter and shape options for directory listing.
struct XRootDListOptions {
	// Shell-style pattern matched against entry names, empty for no filtering.
	string wildcard;
	// Return entries joined with the listed path.
	bool full = false;
	// Return entries joined with the resolved (server absolute) listed path; ignored if [full] is set.
	bool absolute = false;
	// At most one of [dirs_only] and [files_only] could be set.
	bool dirs_only = false;
	bool files_only = false;
};

// Optional info namespaces to fill in on [XRootDFS::GetInfo]; the basic namespace is always filled.
struct XRootDInfoNamespaces {
	bool details = false;
	bool access = false;
	bool xrootd = false;
};

enum class XRootDResourceType : uint8_t {
	UNKNOWN,
	DIRECTORY,
	FILE,
};

struct XRootDInfo {
	// Basic namespace.
	string name;
	bool is_dir = false;

	// Raw stat result, always available.
	uint64_t size = 0;
	uint32_t flags = 0;

	// Details namespace, times are seconds since epoch and only set when reported by the server.
	bool has_details = false;
	XRootDResourceType type = XRootDResourceType::UNKNOWN;
	optional_idx created;
	optional_idx modified;
	optional_idx accessed;

	// Access namespace, empty when not reported by the server.
	bool has_access = false;
	string uid;
	string gid;

	// XRootD namespace.
	bool has_xrootd = false;
	bool offline = false;
	bool writable = false;
	bool readable = false;
	bool executable = false;
};

class XRootDFS {
public:
	// [url] is "root://host[:port]//base/path[?query]"; arguments in [query] are merged into the URL query, a key
	// present in both is rejected.
	XRootDFS(XRootDFileSystem &fs, const string &url, const QueryArgs &query = {});

	// Open file at [path], query arguments are forwarded to the file URL.
	unique_ptr<XRootDFileHandle> Open(const string &path, XRootDFileOptions options = {}) const;

	// Resolve [path] against the base path, the result is server absolute (i.e. "//eos/user/file").
	// Absolute paths which already lie under the base path are kept, other absolute paths are taken relative to it.
	string ResolvePath(const string &path) const;

	bool Exists(const string &path) const;
	bool IsDir(const string &path) const;
	bool IsFile(const string &path) const;

	// List entry names under [path], shaped and filtered by [options].
	vector<string> ListDir(const string &path = "./", const XRootDListOptions &options = {}) const;
	// Same as [ListDir], but invoke [callback] on each entry instead of collecting.
	void IListDir(const string &path, const XRootDListOptions &options,
	              const std::function<void(const string &)> &callback) const;
	// List entries under [path] together with their stat info.
	vector<XRootDDirEntry> ListDirInfo(const string &path = "./") const;

	// Make directory at [path]; with [recursive] missing parents are made, with [allow_recreate] an existing
	// directory isn't an error.
	void MakeDir(const string &path, bool recursive = false, bool allow_recreate = false) const;
	void Remove(const string &path) const;
	// Remove directory at [path]; with [force] its content is removed first, one remote call per entry.
	// [recursive] isn't supported.
	void RemoveDir(const string &path, bool recursive = false, bool force = false) const;

	// Rename [src] to [dst], which is taken relative to the directory of [src]; never overwrites.
	void Rename(const string &src, const string &dst) const;
	// Move a file.
	void Move(const string &src, const string &dst, bool overwrite = false) const;
	// Move a directory.
	void MoveDir(const string &src, const string &dst, bool overwrite = false) const;
	// Copy a file with a server side copy job.
	void Copy(const string &src, const string &dst, bool overwrite = false) const;
	// Copy a directory tree; with [parallel] all file copies are submitted as one batch.
	void CopyDir(const string &src, const string &dst, bool overwrite = false, bool parallel = true) const;

	// Stat [path], the extended attribute query is only issued for the details and access namespaces.
	XRootDInfo GetInfo(const string &path, const XRootDInfoNamespaces &namespaces = {}) const;

	string GetPathUrl(const string &path, bool with_querystring = false) const;
	// Root URL, followed by "/?<query>" if there're query arguments.
	string GetRootUrl() const;
	const string &GetBasePath() const {
		return base_path;
	}
	const QueryArgs &GetQueryArgs() const {
		return query_args;
	}

	// Get (algorithm, value) checksum of the file at [path], not all servers support it.
	std::pair<string, string> Checksum(const string &path) const;
	// Throws [XRootDRemoteConnectionException] if the server cannot be reached.
	void Ping() const;

private:
	// Stat a resolved path, return false if it doesn't exist.
	bool StatResolved(const string &full_path, const string &path, XRootDStatInfo &info) const;
	bool IsDirResolved(const string &full_path) const;
	bool IsFileResolved(const string &full_path) const;
	// List a resolved directory, with stat info for each entry if requested.
	vector<XRootDDirEntry> DirListResolved(const string &full_path, const string &path, bool with_stat) const;
	void RemoveDirResolved(const string &full_path, const string &path, bool force) const;
	// Remove a resolved directory tree depth-first.
	void RemoveTreeResolved(const string &full_path) const;
	// Replace the destination if allowed, then move [full_src] to [full_dst]; the caller checks the source.
	void MoveResolved(const string &full_src, const string &full_dst, bool overwrite) const;
	// Mirror the tree under [src] at [dst]; files are queued onto [copy_process] if given, copied one by one
	// otherwise.
	void CopyTree(const string &src, const string &dst, bool overwrite, XRootDCopyProcess *copy_process) const;
	// Issue a server query, trailing padding is stripped from the response.
	string Query(XRootDQueryCode code, const string &full_path) const;

	XRootDFileSystem &fs;
	string root_url;
	// Base path as given in the URL, i.e. "//eos/user/".
	string base_path;
	// Base path with a single leading slash and without trailing slashes, i.e. "/eos/user".
	string base_dir;
	QueryArgs query_args;
	unique_ptr<XRootDRemoteFileSystem> client;
};

} // namespace duckdb
