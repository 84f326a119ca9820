#include "xrootd_fs.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/operator/cast_operators.hpp"
#include "duckdb/common/string_util.hpp"
#include "path_utils.hpp"
#include "xrootd_exception.hpp"
#include "xrootd_filesystem.hpp"
#include "xrootd_filesystem_logger.hpp"
#include "xrootd_status.hpp"

namespace duckdb {

namespace {

constexpr const char *OSS_TYPE_KEY = "oss.type";
constexpr const char *OSS_CREATED_TIME_KEY = "oss.ct";
constexpr const char *OSS_MODIFIED_TIME_KEY = "oss.mt";
constexpr const char *OSS_ACCESSED_TIME_KEY = "oss.at";
constexpr const char *OSS_UID_KEY = "oss.u";
constexpr const char *OSS_GID_KEY = "oss.g";

bool IsDirFlags(uint32_t flags) {
	return (flags & XRootDStatFlags::IS_DIR) != 0;
}

bool IsFileFlags(uint32_t flags) {
	return (flags & (XRootDStatFlags::IS_DIR | XRootDStatFlags::OTHER)) == 0;
}

XRootDResourceType GetResourceType(const string *oss_type) {
	if (oss_type == nullptr) {
		return XRootDResourceType::UNKNOWN;
	}
	if (*oss_type == "d") {
		return XRootDResourceType::DIRECTORY;
	}
	if (*oss_type == "f") {
		return XRootDResourceType::FILE;
	}
	return XRootDResourceType::UNKNOWN;
}

// Parse a timestamp attribute, malformed or out of range values are treated as absent.
optional_idx ParseTimeAttribute(const QueryArgs &attributes, const char *key) {
	const auto *value = URLUtils::FindQueryArg(attributes, key);
	if (value == nullptr) {
		return optional_idx {};
	}
	uint64_t result = 0;
	if (!TryCast::Operation<string_t, uint64_t>(string_t(*value), result, /*strict=*/true)) {
		return optional_idx {};
	}
	if (result == DConstants::INVALID_INDEX) {
		return optional_idx {};
	}
	return optional_idx {result};
}

} // namespace

XRootDFS::XRootDFS(XRootDFileSystem &fs_p, const string &url, const QueryArgs &query) : fs(fs_p) {
	if (!URLUtils::IsValidXRootDUrl(url)) {
		throw XRootDInvalidPathException(url);
	}
	const auto parsed_url = URLUtils::ParseURL(url);
	if (!URLUtils::IsValidXRootDPath(parsed_url.path)) {
		throw XRootDInvalidPathException(parsed_url.path);
	}
	root_url = parsed_url.root_url;
	base_path = parsed_url.path;
	base_dir = "/" + PathUtils::Relative(base_path);
	while (base_dir.length() > 1 && base_dir.back() == '/') {
		base_dir.pop_back();
	}

	query_args = URLUtils::ParseQueryString(parsed_url.query);
	for (const auto &cur_arg : query) {
		if (URLUtils::FindQueryArg(query_args, cur_arg.first) != nullptr) {
			throw InvalidInputException("Query string field %s conflicts with field in URL %s", cur_arg.first, url);
		}
		query_args.emplace_back(cur_arg);
	}

	client = fs.GetClientFactory().CreateFileSystem(GetRootUrl(), fs.GetClientConfig());
}

unique_ptr<XRootDFileHandle> XRootDFS::Open(const string &path, XRootDFileOptions options) const {
	auto remote_file = fs.GetClientFactory().CreateFile(fs.GetClientConfig());
	return make_uniq<XRootDFileHandle>(fs, GetPathUrl(path, /*with_querystring=*/true), std::move(options),
	                                   std::move(remote_file));
}

string XRootDFS::ResolvePath(const string &path) const {
	string relative_path = path;
	if (PathUtils::IsAbsolute(path)) {
		const auto single_slash_path = "/" + PathUtils::Relative(path);
		if (!PathUtils::HasPathPrefix(single_slash_path, base_dir)) {
			relative_path = PathUtils::Relative(path);
		}
	}
	return "/" + PathUtils::Join(base_dir, relative_path);
}

bool XRootDFS::StatResolved(const string &full_path, const string &path, XRootDStatInfo &info) const {
	const auto status = client->Stat(full_path, info);
	if (IsNotFoundStatus(status)) {
		return false;
	}
	ThrowIfXRootDError(status, path);
	return true;
}

bool XRootDFS::IsDirResolved(const string &full_path) const {
	XRootDStatInfo info;
	if (!StatResolved(full_path, full_path, info)) {
		return false;
	}
	return IsDirFlags(info.flags);
}

bool XRootDFS::IsFileResolved(const string &full_path) const {
	XRootDStatInfo info;
	if (!StatResolved(full_path, full_path, info)) {
		return false;
	}
	return IsFileFlags(info.flags);
}

bool XRootDFS::Exists(const string &path) const {
	XRootDStatInfo info;
	return client->Stat(ResolvePath(path), info).IsOk();
}

bool XRootDFS::IsDir(const string &path) const {
	XRootDStatInfo info;
	if (!StatResolved(ResolvePath(path), path, info)) {
		return false;
	}
	return IsDirFlags(info.flags);
}

bool XRootDFS::IsFile(const string &path) const {
	XRootDStatInfo info;
	if (!StatResolved(ResolvePath(path), path, info)) {
		return false;
	}
	return IsFileFlags(info.flags);
}

vector<XRootDDirEntry> XRootDFS::DirListResolved(const string &full_path, const string &path, bool with_stat) const {
	vector<XRootDDirEntry> entries;
	const auto status = client->DirList(full_path, with_stat, entries);
	ThrowIfXRootDError(status, path);
	return entries;
}

void XRootDFS::IListDir(const string &path, const XRootDListOptions &options,
                        const std::function<void(const string &)> &callback) const {
	if (options.dirs_only && options.files_only) {
		throw InvalidInputException("dirs_only and files_only cannot both be set to list %s", path);
	}
	const bool with_stat = options.dirs_only || options.files_only;
	const auto full_path = ResolvePath(path);
	const auto entries = DirListResolved(full_path, path, with_stat);

	unique_ptr<WildcardMatcher> matcher;
	if (!options.wildcard.empty()) {
		matcher = make_uniq<WildcardMatcher>(options.wildcard);
	}

	string prefix;
	if (options.full) {
		prefix = PathUtils::Normalize(path);
	} else if (options.absolute) {
		prefix = full_path;
	}
	const bool with_prefix = options.full || options.absolute;

	for (const auto &cur_entry : entries) {
		if (matcher != nullptr && !matcher->Matches(cur_entry.name)) {
			continue;
		}
		if (options.dirs_only && !IsDirFlags(cur_entry.stat_info.flags)) {
			continue;
		}
		if (options.files_only && !IsFileFlags(cur_entry.stat_info.flags)) {
			continue;
		}
		if (with_prefix) {
			callback(PathUtils::Combine(prefix, cur_entry.name));
		} else {
			callback(cur_entry.name);
		}
	}
}

vector<string> XRootDFS::ListDir(const string &path, const XRootDListOptions &options) const {
	vector<string> names;
	IListDir(path, options, [&names](const string &cur_name) { names.emplace_back(cur_name); });
	return names;
}

vector<XRootDDirEntry> XRootDFS::ListDirInfo(const string &path) const {
	return DirListResolved(ResolvePath(path), path, /*with_stat=*/true);
}

void XRootDFS::MakeDir(const string &path, bool recursive, bool allow_recreate) const {
	const auto status = client->MkDir(ResolvePath(path), /*make_path=*/recursive);
	if (allow_recreate && IsDestinationExistsStatus(status)) {
		return;
	}
	ThrowIfXRootDError(status, path);
}

void XRootDFS::Remove(const string &path) const {
	const auto status = client->Rm(ResolvePath(path));
	ThrowIfXRootDError(status, path);
}

void XRootDFS::RemoveTreeResolved(const string &full_path) const {
	const auto entries = DirListResolved(full_path, full_path, /*with_stat=*/true);
	for (const auto &cur_entry : entries) {
		const auto cur_path = PathUtils::Combine(full_path, cur_entry.name);
		if (IsDirFlags(cur_entry.stat_info.flags)) {
			RemoveTreeResolved(cur_path);
			continue;
		}
		ThrowIfXRootDError(client->Rm(cur_path), cur_path);
	}
	ThrowIfXRootDError(client->RmDir(full_path), full_path);
}

void XRootDFS::RemoveDir(const string &path, bool recursive, bool force) const {
	if (recursive) {
		throw XRootDUnsupportedException("recursive directory removal, use force instead");
	}
	RemoveDirResolved(ResolvePath(path), path, force);
}

void XRootDFS::RemoveDirResolved(const string &full_path, const string &path, bool force) const {
	const auto status = client->RmDir(full_path);
	if (force && IsDirectoryNotEmptyStatus(status)) {
		XROOTDFS_LOG_DEBUG_OPTIONAL(fs.GetDatabaseInstance(),
		                            StringUtil::Format("Remove non-empty XRootD directory %s entry by entry", full_path));
		RemoveTreeResolved(full_path);
		return;
	}
	ThrowIfXRootDError(status, path);
}

void XRootDFS::MoveResolved(const string &full_src, const string &full_dst, bool overwrite) const {
	XRootDStatInfo dst_info;
	if (client->Stat(full_dst, dst_info).IsOk()) {
		if (!overwrite) {
			throw XRootDDestinationExistsException(full_dst);
		}
		if (IsFileFlags(dst_info.flags)) {
			ThrowIfXRootDError(client->Rm(full_dst), full_dst);
		} else if (IsDirFlags(dst_info.flags)) {
			RemoveDirResolved(full_dst, full_dst, /*force=*/true);
		}
	}
	const auto status = client->Mv(full_src, full_dst);
	ThrowIfXRootDError(status, full_dst);
}

void XRootDFS::Rename(const string &src, const string &dst) const {
	const auto full_src = ResolvePath(src);
	const auto full_dst = ResolvePath(PathUtils::Join(PathUtils::DirName(full_src), dst));
	XRootDStatInfo src_info;
	if (!client->Stat(full_src, src_info).IsOk()) {
		throw XRootDResourceNotFoundException(full_src);
	}
	MoveResolved(full_src, full_dst, /*overwrite=*/false);
}

void XRootDFS::Move(const string &src, const string &dst, bool overwrite) const {
	const auto full_src = ResolvePath(src);
	XRootDStatInfo src_info;
	if (!client->Stat(full_src, src_info).IsOk()) {
		throw XRootDResourceNotFoundException(full_src);
	}
	if (!IsFileFlags(src_info.flags)) {
		throw XRootDResourceInvalidException(full_src, "source is not a file");
	}
	MoveResolved(full_src, ResolvePath(dst), overwrite);
}

void XRootDFS::MoveDir(const string &src, const string &dst, bool overwrite) const {
	const auto full_src = ResolvePath(src);
	XRootDStatInfo src_info;
	if (!client->Stat(full_src, src_info).IsOk()) {
		throw XRootDResourceNotFoundException(full_src);
	}
	if (!IsDirFlags(src_info.flags)) {
		throw XRootDResourceInvalidException(full_src, "source is not a directory");
	}
	MoveResolved(full_src, ResolvePath(dst), overwrite);
}

void XRootDFS::Copy(const string &src, const string &dst, bool overwrite) const {
	const auto full_src = ResolvePath(src);
	const auto full_dst = ResolvePath(dst);
	if (!IsFileResolved(full_src)) {
		if (IsDirResolved(full_src)) {
			throw XRootDResourceInvalidException(full_src, "source is not a file");
		}
		throw XRootDResourceNotFoundException(full_src);
	}
	if (overwrite && IsDirResolved(full_dst)) {
		RemoveDirResolved(full_dst, full_dst, /*force=*/true);
	}

	auto copy_process = fs.GetClientFactory().CreateCopyProcess(fs.GetClientConfig());
	ThrowIfXRootDError(copy_process->AddJob(root_url + full_src, root_url + full_dst, /*force=*/overwrite), full_dst);
	ThrowIfXRootDError(copy_process->Prepare(), full_dst);
	ThrowIfXRootDError(copy_process->Run(), full_dst);
}

void XRootDFS::CopyTree(const string &src, const string &dst, bool overwrite,
                        XRootDCopyProcess *copy_process) const {
	for (const auto &cur_entry : ListDirInfo(src)) {
		const auto cur_src = PathUtils::Combine(src, cur_entry.name);
		const auto cur_dst = PathUtils::Combine(dst, cur_entry.name);
		if (IsDirFlags(cur_entry.stat_info.flags)) {
			MakeDir(cur_dst, /*recursive=*/true, /*allow_recreate=*/true);
			CopyTree(cur_src, cur_dst, overwrite, copy_process);
			continue;
		}
		if (copy_process == nullptr) {
			Copy(cur_src, cur_dst, overwrite);
			continue;
		}
		const auto status = copy_process->AddJob(GetPathUrl(cur_src), GetPathUrl(cur_dst), /*force=*/overwrite);
		ThrowIfXRootDError(status, cur_dst);
	}
}

void XRootDFS::CopyDir(const string &src, const string &dst, bool overwrite, bool parallel) const {
	if (!IsDir(src)) {
		if (IsFile(src)) {
			throw XRootDResourceInvalidException(src, "source is not a directory");
		}
		throw XRootDResourceNotFoundException(src);
	}

	const auto full_dst = ResolvePath(dst);
	XRootDStatInfo dst_info;
	if (client->Stat(full_dst, dst_info).IsOk()) {
		if (!overwrite) {
			throw XRootDDestinationExistsException(dst);
		}
		if (IsDirFlags(dst_info.flags)) {
			RemoveDir(dst, /*recursive=*/false, /*force=*/true);
		} else if (IsFileFlags(dst_info.flags)) {
			Remove(dst);
		}
	}

	unique_ptr<XRootDCopyProcess> copy_process;
	if (parallel) {
		copy_process = fs.GetClientFactory().CreateCopyProcess(fs.GetClientConfig());
	}

	MakeDir(dst, /*recursive=*/false, /*allow_recreate=*/true);
	CopyTree(src, dst, overwrite, copy_process.get());

	if (copy_process != nullptr) {
		ThrowIfXRootDError(copy_process->Prepare(), full_dst);
		ThrowIfXRootDError(copy_process->Run(), full_dst);
	}
	XROOTDFS_LOG_DEBUG_OPTIONAL(fs.GetDatabaseInstance(),
	                            StringUtil::Format("Copied XRootD directory %s to %s (parallel: %s)", ResolvePath(src),
	                                               full_dst, parallel ? "true" : "false"));
}

string XRootDFS::Query(XRootDQueryCode code, const string &full_path) const {
	string response;
	const auto status = client->Query(code, full_path, response);
	ThrowIfXRootDQueryError(status, full_path);
	// Servers might pad the response buffer, everything after the first NUL byte is garbage.
	const auto nul_pos = response.find('\0');
	if (nul_pos != string::npos) {
		response.resize(nul_pos);
	}
	return response;
}

XRootDInfo XRootDFS::GetInfo(const string &path, const XRootDInfoNamespaces &namespaces) const {
	const auto full_path = ResolvePath(path);
	XRootDStatInfo stat_info;
	ThrowIfXRootDError(client->Stat(full_path, stat_info), path);

	XRootDInfo info;
	info.name = PathUtils::BaseName(path);
	info.is_dir = IsDirFlags(stat_info.flags);
	info.size = stat_info.size;
	info.flags = stat_info.flags;

	if (namespaces.details || namespaces.access) {
		const auto attributes = URLUtils::ParseQueryString(Query(XRootDQueryCode::XATTR, full_path));
		if (namespaces.details) {
			info.has_details = true;
			info.type = GetResourceType(URLUtils::FindQueryArg(attributes, OSS_TYPE_KEY));
			info.created = ParseTimeAttribute(attributes, OSS_CREATED_TIME_KEY);
			info.modified = ParseTimeAttribute(attributes, OSS_MODIFIED_TIME_KEY);
			info.accessed = ParseTimeAttribute(attributes, OSS_ACCESSED_TIME_KEY);
		}
		if (namespaces.access) {
			info.has_access = true;
			if (const auto *uid = URLUtils::FindQueryArg(attributes, OSS_UID_KEY)) {
				info.uid = *uid;
			}
			if (const auto *gid = URLUtils::FindQueryArg(attributes, OSS_GID_KEY)) {
				info.gid = *gid;
			}
		}
	}

	if (namespaces.xrootd) {
		info.has_xrootd = true;
		info.offline = stat_info.TestFlags(XRootDStatFlags::OFFLINE);
		info.writable = stat_info.TestFlags(XRootDStatFlags::IS_WRITABLE);
		info.readable = stat_info.TestFlags(XRootDStatFlags::IS_READABLE);
		info.executable = stat_info.TestFlags(XRootDStatFlags::X_BIT_SET);
	}
	return info;
}

string XRootDFS::GetPathUrl(const string &path, bool with_querystring) const {
	auto url = root_url + ResolvePath(path);
	if (with_querystring && !query_args.empty()) {
		url += "?" + URLUtils::EncodeQueryString(query_args);
	}
	return url;
}

string XRootDFS::GetRootUrl() const {
	if (query_args.empty()) {
		return root_url;
	}
	return root_url + "/?" + URLUtils::EncodeQueryString(query_args);
}

std::pair<string, string> XRootDFS::Checksum(const string &path) const {
	const auto full_path = ResolvePath(path);
	if (!IsFileResolved(full_path)) {
		throw XRootDResourceInvalidException(path, "path is not a file");
	}

	auto response = Query(XRootDQueryCode::CHECKSUM, full_path);
	StringUtil::Trim(response);
	const auto parts = StringUtil::Split(response, ' ');
	if (parts.size() != 2) {
		throw XRootDResourceErrorException(path, StringUtil::Format("malformed checksum response '%s'", response));
	}
	return std::make_pair(parts[0], parts[1]);
}

void XRootDFS::Ping() const {
	const auto status = client->Ping();
	if (!status.IsOk()) {
		throw XRootDRemoteConnectionException(GetRootUrl(), status.ToString());
	}
}

} // namespace duckdb
