#include "xrootd_status.hpp"

#include "duckdb/common/string_util.hpp"
#include "xrootd_exception.hpp"

namespace duckdb {

namespace {

// Servers report a 3005 both for non-empty directories and for path components which aren't directories.
constexpr const char *NOT_A_DIRECTORY_SUFFIX = "not a directory";

// Query strings may carry credentials (i.e. "authz=..."), keep them out of error messages.
string StripQuery(const string &path) {
	return path.substr(0, path.find('?'));
}

} // namespace

string XRootDStatus::ToString() const {
	if (ok) {
		return "[SUCCESS]";
	}
	return StringUtil::Format("[ERROR] %s (errno: %d)", message, err_no);
}

bool IsDestinationExistsStatus(const XRootDStatus &status) {
	if (status.ok) {
		return false;
	}
	return status.err_no == XRootDErrno::ITEM_EXISTS || status.err_no == XRootDErrno::POSIX_EXISTS ||
	       status.err_no == XRootDErrno::ITEM_EXISTS_V5;
}

bool IsNotFoundStatus(const XRootDStatus &status) {
	return !status.ok && status.err_no == XRootDErrno::NOT_FOUND;
}

bool IsDirectoryNotEmptyStatus(const XRootDStatus &status) {
	return !status.ok && status.err_no == XRootDErrno::NOT_EMPTY;
}

void ThrowIfXRootDError(const XRootDStatus &status, const string &url) {
	if (status.ok) {
		return;
	}
	const auto path = StripQuery(url);
	const auto detail = status.ToString();
	if (IsDestinationExistsStatus(status)) {
		throw XRootDDestinationExistsException(path, detail);
	}
	if (IsDirectoryNotEmptyStatus(status)) {
		string trimmed = status.message;
		StringUtil::Trim(trimmed);
		if (StringUtil::EndsWith(trimmed, NOT_A_DIRECTORY_SUFFIX)) {
			throw XRootDResourceInvalidException(path, detail);
		}
		throw XRootDDirectoryNotEmptyException(path, detail);
	}
	if (IsNotFoundStatus(status)) {
		throw XRootDResourceNotFoundException(path, detail);
	}
	throw XRootDResourceErrorException(path, detail);
}

void ThrowIfXRootDFileError(const XRootDStatus &status, const string &url, const string &operation) {
	if (status.ok) {
		return;
	}
	const auto path = StripQuery(url);
	if (IsNotFoundStatus(status)) {
		throw XRootDResourceNotFoundException(path, status.ToString());
	}
	throw IOException("XRootD error %s file (%s): %s", operation, path, status.message);
}

void ThrowIfXRootDQueryError(const XRootDStatus &status, const string &url) {
	if (status.ok) {
		return;
	}
	const auto path = StripQuery(url);
	if (status.err_no == XRootDErrno::UNSUPPORTED) {
		throw XRootDUnsupportedException(StringUtil::Format("query on %s, %s", path, status.ToString()));
	}
	throw XRootDResourceErrorException(path, status.ToString());
}

} // namespace duckdb
