#include "xrootd_filesystem.hpp"

#include <algorithm>

#include "duckdb/common/exception.hpp"
#include "duckdb/common/helper.hpp"
#include "duckdb/common/numeric_utils.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/main/database.hpp"
#include "path_utils.hpp"
#include "url_utils.hpp"
#include "xrootd_exception.hpp"
#include "xrootd_file_handle.hpp"
#include "xrootd_filesystem_logger.hpp"

namespace duckdb {

namespace {

// Facade root shared by all virtual filesystem calls.
constexpr const char *SERVER_ROOT_PATH = "//";

// Map DuckDB open flags to an open mode token.
string GetOpenMode(const FileOpenFlags &flags, XRootDFS &facade, const string &path) {
	if (!flags.OpenForWriting()) {
		return "rb";
	}
	if (flags.OverwriteExistingFile()) {
		return flags.OpenForReading() ? "w+b" : "wb";
	}
	// Append and update opens require an existing remote file.
	if (flags.CreateFileIfNotExists() && !facade.Exists(path)) {
		return flags.OpenForReading() || !flags.OpenForAppending() ? "w+b" : "wb";
	}
	if (flags.OpenForAppending()) {
		return flags.OpenForReading() ? "a+b" : "ab";
	}
	return "r+b";
}

// Append the query string of the original URL to a URL generated for one of its paths.
string WithUrlQuery(const string &url, const ParsedURL &parsed_url) {
	if (parsed_url.query.empty()) {
		return url;
	}
	return url + "?" + parsed_url.query;
}

} // namespace

XRootDClientFactory &XRootDFileSystem::GetClientFactory() {
	auto state = GetInstanceConfig(instance_state);
	if (state->client_factory == nullptr) {
		throw InternalException("xrootdfs instance state has no remote client factory");
	}
	return *state->client_factory;
}

XRootDClientConfig XRootDFileSystem::GetClientConfig() {
	return GetInstanceConfig(instance_state)->config.GetClientConfig();
}

idx_t XRootDFileSystem::GetReadBufferSize() {
	return GetInstanceConfig(instance_state)->config.read_buffer_size;
}

unique_ptr<XRootDFS> XRootDFileSystem::CreateFacade(const string &url) {
	if (!URLUtils::IsValidXRootDUrl(url)) {
		throw XRootDPathFormatException(url);
	}
	const auto parsed_url = URLUtils::ParseURL(url);
	const auto facade_url = WithUrlQuery(parsed_url.root_url + SERVER_ROOT_PATH, parsed_url);

	// Arguments carried by the URL take precedence over configured ones.
	const auto url_args = URLUtils::ParseQueryString(parsed_url.query);
	QueryArgs extra_args;
	for (auto &cur_arg : GetInstanceConfig(instance_state)->config.GetQueryArgs()) {
		if (URLUtils::FindQueryArg(url_args, cur_arg.first) == nullptr) {
			extra_args.emplace_back(std::move(cur_arg));
		}
	}
	return make_uniq<XRootDFS>(*this, facade_url, extra_args);
}

unique_ptr<FileHandle> XRootDFileSystem::OpenFile(const string &path, FileOpenFlags flags,
                                                  optional_ptr<FileOpener> opener) {
	auto facade = CreateFacade(path);
	const auto remote_path = URLUtils::ParseURL(path).path;

	XRootDFileOptions options;
	options.mode = GetOpenMode(flags, *facade, remote_path);
	options.buffer_size = GetReadBufferSize();

	unique_ptr<XRootDFileHandle> file_handle;
	try {
		file_handle = facade->Open(remote_path, std::move(options));
	} catch (XRootDResourceNotFoundException &ex) {
		if (!flags.ReturnNullIfNotExists()) {
			throw;
		}
		XROOTDFS_LOG_DEBUG_OPTIONAL(db_instance,
		                            StringUtil::Format("XRootD file %s doesn't exist: %s", path, ex.what()));
		return nullptr;
	}

	if (opener) {
		file_handle->TryAddLogger(*opener);
	}
	DUCKDB_LOG_XROOTD_OPEN((*file_handle));
	return std::move(file_handle);
}

void XRootDFileSystem::Read(FileHandle &handle, void *buffer, int64_t nr_bytes, idx_t location) {
	auto &xrootd_handle = handle.Cast<XRootDFileHandle>();
	const auto bytes_to_read = NumericCast<idx_t>(nr_bytes);
	const auto bytes_read = xrootd_handle.ReadAt(static_cast<char *>(buffer), bytes_to_read, location);
	if (bytes_read != bytes_to_read) {
		throw IOException("Could not read all bytes from XRootD file %s: offset %llu, expected %llu bytes, got %llu",
		                  handle.GetPath(), location, bytes_to_read, bytes_read);
	}
}

int64_t XRootDFileSystem::Read(FileHandle &handle, void *buffer, int64_t nr_bytes) {
	auto &xrootd_handle = handle.Cast<XRootDFileHandle>();
	const auto bytes_read = xrootd_handle.Read(static_cast<char *>(buffer), NumericCast<idx_t>(nr_bytes));
	return NumericCast<int64_t>(bytes_read);
}

void XRootDFileSystem::Write(FileHandle &handle, void *buffer, int64_t nr_bytes, idx_t location) {
	auto &xrootd_handle = handle.Cast<XRootDFileHandle>();
	xrootd_handle.WriteAt(static_cast<const char *>(buffer), NumericCast<idx_t>(nr_bytes), location);
}

int64_t XRootDFileSystem::Write(FileHandle &handle, void *buffer, int64_t nr_bytes) {
	auto &xrootd_handle = handle.Cast<XRootDFileHandle>();
	xrootd_handle.Write(static_cast<const char *>(buffer), NumericCast<idx_t>(nr_bytes));
	return nr_bytes;
}

int64_t XRootDFileSystem::GetFileSize(FileHandle &handle) {
	auto &xrootd_handle = handle.Cast<XRootDFileHandle>();
	return NumericCast<int64_t>(xrootd_handle.GetSize());
}

timestamp_t XRootDFileSystem::GetLastModifiedTime(FileHandle &handle) {
	auto &xrootd_handle = handle.Cast<XRootDFileHandle>();
	return xrootd_handle.GetLastModifiedTime();
}

FileType XRootDFileSystem::GetFileType(FileHandle & /*handle*/) {
	return FileType::FILE_TYPE_REGULAR;
}

void XRootDFileSystem::Truncate(FileHandle &handle, int64_t new_size) {
	auto &xrootd_handle = handle.Cast<XRootDFileHandle>();
	xrootd_handle.Truncate(NumericCast<idx_t>(new_size));
}

void XRootDFileSystem::FileSync(FileHandle &handle) {
	auto &xrootd_handle = handle.Cast<XRootDFileHandle>();
	xrootd_handle.Flush();
}

void XRootDFileSystem::Seek(FileHandle &handle, idx_t location) {
	auto &xrootd_handle = handle.Cast<XRootDFileHandle>();
	xrootd_handle.Seek(NumericCast<int64_t>(location));
}

void XRootDFileSystem::Reset(FileHandle &handle) {
	Seek(handle, /*location=*/0);
}

idx_t XRootDFileSystem::SeekPosition(FileHandle &handle) {
	auto &xrootd_handle = handle.Cast<XRootDFileHandle>();
	return xrootd_handle.Tell();
}

bool XRootDFileSystem::FileExists(const string &filename, optional_ptr<FileOpener> opener) {
	auto facade = CreateFacade(filename);
	return facade->IsFile(URLUtils::ParseURL(filename).path);
}

bool XRootDFileSystem::DirectoryExists(const string &directory, optional_ptr<FileOpener> opener) {
	auto facade = CreateFacade(directory);
	return facade->IsDir(URLUtils::ParseURL(directory).path);
}

void XRootDFileSystem::CreateDirectory(const string &directory, optional_ptr<FileOpener> opener) {
	auto facade = CreateFacade(directory);
	facade->MakeDir(URLUtils::ParseURL(directory).path, /*recursive=*/false, /*allow_recreate=*/true);
}

void XRootDFileSystem::RemoveDirectory(const string &directory, optional_ptr<FileOpener> opener) {
	auto facade = CreateFacade(directory);
	facade->RemoveDir(URLUtils::ParseURL(directory).path, /*recursive=*/false, /*force=*/true);
}

void XRootDFileSystem::RemoveFile(const string &filename, optional_ptr<FileOpener> opener) {
	auto facade = CreateFacade(filename);
	facade->Remove(URLUtils::ParseURL(filename).path);
}

bool XRootDFileSystem::TryRemoveFile(const string &filename, optional_ptr<FileOpener> opener) {
	auto facade = CreateFacade(filename);
	const auto remote_path = URLUtils::ParseURL(filename).path;
	if (!facade->IsFile(remote_path)) {
		return false;
	}
	facade->Remove(remote_path);
	return true;
}

void XRootDFileSystem::MoveFile(const string &source, const string &target, optional_ptr<FileOpener> opener) {
	const auto parsed_source = URLUtils::ParseURL(source);
	const auto parsed_target = URLUtils::ParseURL(target);
	if (parsed_source.root_url != parsed_target.root_url) {
		throw InvalidInputException("Cannot move XRootD file %s to %s, which lives on another server", source,
		                            target);
	}
	auto facade = CreateFacade(source);
	facade->Move(parsed_source.path, parsed_target.path, /*overwrite=*/true);
}

bool XRootDFileSystem::ListFiles(const string &directory, const std::function<void(const string &, bool)> &callback,
                                 FileOpener *opener) {
	auto facade = CreateFacade(directory);
	const auto remote_path = URLUtils::ParseURL(directory).path;
	if (!facade->IsDir(remote_path)) {
		return false;
	}
	for (const auto &cur_entry : facade->ListDirInfo(remote_path)) {
		callback(cur_entry.name, cur_entry.stat_info.TestFlags(XRootDStatFlags::IS_DIR));
	}
	return true;
}

vector<OpenFileInfo> XRootDFileSystem::Glob(const string &path, FileOpener *opener) {
	auto facade = CreateFacade(path);
	const auto parsed_url = URLUtils::ParseURL(path);

	vector<OpenFileInfo> result;
	if (!FileSystem::HasGlob(parsed_url.path)) {
		if (facade->IsFile(parsed_url.path)) {
			result.emplace_back(path);
		}
		return result;
	}

	const auto directory = PathUtils::DirName(parsed_url.path);
	const auto pattern = PathUtils::BaseName(parsed_url.path);
	if (FileSystem::HasGlob(directory)) {
		throw NotImplementedException("Wildcards are only supported in the last path component of XRootD URL %s",
		                              path);
	}
	if (!facade->IsDir(directory)) {
		return result;
	}

	XRootDListOptions options;
	options.wildcard = pattern;
	options.files_only = true;
	options.absolute = true;
	vector<string> matched_paths = facade->ListDir(directory, options);
	std::sort(matched_paths.begin(), matched_paths.end());
	result.reserve(matched_paths.size());
	for (const auto &cur_path : matched_paths) {
		result.emplace_back(WithUrlQuery(parsed_url.root_url + cur_path, parsed_url));
	}
	return result;
}

bool XRootDFileSystem::CanHandleFile(const string &fpath) {
	return URLUtils::HasXRootDScheme(fpath);
}

unique_ptr<XRootDFileSystem> CreateXRootDFileSystem(DatabaseInstance &instance) {
	auto state = GetInstanceStateShared(instance);
	if (state == nullptr) {
		throw InternalException("xrootdfs instance state not found - extension not properly loaded");
	}
	return make_uniq<XRootDFileSystem>(state, &instance);
}

} // namespace duckdb
