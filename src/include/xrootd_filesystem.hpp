// DuckDB virtual filesystem for "root://" and "roots://" URLs.
//
// The filesystem itself holds no connection: every call builds a facade rooted at "//" of the URL's server, file
// handles are [XRootDFileHandle] opened through it. Settings and the remote client factory are read from the per
// instance state on each call, so setting updates apply to later opens.

#pragma once

#include "duckdb/common/file_system.hpp"
#include "duckdb/common/open_file_info.hpp"
#include "duckdb/common/optional_ptr.hpp"
#include "duckdb/common/shared_ptr.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include "xrootd_client.hpp"
#include "xrootd_fs.hpp"
#include "xrootdfs_instance_state.hpp"

#include <functional>

namespace duckdb {

// Forward declaration.
class DatabaseInstance;

class XRootDFileSystem : public FileSystem {
public:
	// [db_instance_p] is only used for logging, and could be null.
	explicit XRootDFileSystem(weak_ptr<XRootDInstanceState> instance_state_p,
	                          optional_ptr<DatabaseInstance> db_instance_p = nullptr)
	    : instance_state(std::move(instance_state_p)), db_instance(db_instance_p) {
	}
	~XRootDFileSystem() override = default;

	unique_ptr<FileHandle> OpenFile(const string &path, FileOpenFlags flags,
	                                optional_ptr<FileOpener> opener = nullptr) override;
	// Doesn't update file offset (which acts as `PRead` semantics).
	void Read(FileHandle &handle, void *buffer, int64_t nr_bytes, idx_t location) override;
	// Does update file offset (which acts as `Read` semantics).
	int64_t Read(FileHandle &handle, void *buffer, int64_t nr_bytes) override;
	void Write(FileHandle &handle, void *buffer, int64_t nr_bytes, idx_t location) override;
	int64_t Write(FileHandle &handle, void *buffer, int64_t nr_bytes) override;
	int64_t GetFileSize(FileHandle &handle) override;
	timestamp_t GetLastModifiedTime(FileHandle &handle) override;
	FileType GetFileType(FileHandle &handle) override;
	void Truncate(FileHandle &handle, int64_t new_size) override;
	void FileSync(FileHandle &handle) override;
	void Seek(FileHandle &handle, idx_t location) override;
	void Reset(FileHandle &handle) override;
	idx_t SeekPosition(FileHandle &handle) override;
	bool CanSeek() override {
		return true;
	}
	bool OnDiskFile(FileHandle &/*handle*/) override {
		return false;
	}

	bool FileExists(const string &filename, optional_ptr<FileOpener> opener = nullptr) override;
	bool DirectoryExists(const string &directory, optional_ptr<FileOpener> opener = nullptr) override;
	// Creating an existing directory is not an error.
	void CreateDirectory(const string &directory, optional_ptr<FileOpener> opener = nullptr) override;
	// Remove directory together with its content.
	void RemoveDirectory(const string &directory, optional_ptr<FileOpener> opener = nullptr) override;
	void RemoveFile(const string &filename, optional_ptr<FileOpener> opener = nullptr) override;
	bool TryRemoveFile(const string &filename, optional_ptr<FileOpener> opener = nullptr) override;
	// Move a file within one server, an existing target is overwritten.
	void MoveFile(const string &source, const string &target, optional_ptr<FileOpener> opener = nullptr) override;
	bool ListFiles(const string &directory, const std::function<void(const string &, bool)> &callback,
	               FileOpener *opener = nullptr) override;
	// Only the last path component could contain wildcards.
	vector<OpenFileInfo> Glob(const string &path, FileOpener *opener = nullptr) override;

	bool CanHandleFile(const string &fpath) override;
	std::string GetName() const override {
		return "XRootDFileSystem";
	}

	// Create a facade rooted at "//" for the server of [url], with the URL and configured query arguments attached.
	unique_ptr<XRootDFS> CreateFacade(const string &url);

	// Accessors used by facades and file handles.
	XRootDClientFactory &GetClientFactory();
	XRootDClientConfig GetClientConfig();
	idx_t GetReadBufferSize();
	optional_ptr<DatabaseInstance> GetDatabaseInstance() const {
		return db_instance;
	}

private:
	// Per-instance state, owned by the object cache of the database instance.
	weak_ptr<XRootDInstanceState> instance_state;
	optional_ptr<DatabaseInstance> db_instance;
};

// Create a filesystem bound to the xrootdfs state of [instance], throws if the extension isn't loaded.
unique_ptr<XRootDFileSystem> CreateXRootDFileSystem(DatabaseInstance &instance);

} // namespace duckdb
