#include "xrootd_open_mode.hpp"

namespace duckdb {

XRootDOpenMode XRootDOpenMode::Parse(const string &mode) {
	XRootDOpenMode result;
	result.mode = mode;
	for (const char cur : mode) {
		switch (cur) {
		case 'r':
			result.flags |= READ;
			break;
		case 'w':
			result.flags |= WRITE;
			break;
		case 'a':
			result.flags |= APPEND;
			break;
		case '-':
			result.flags |= STREAMING;
			break;
		case '+':
			result.flags |= READ_WRITE;
			break;
		case 'b':
			result.flags |= BINARY;
			break;
		default:
			break;
		}
	}
	return result;
}

XRootDOpenFlags XRootDOpenMode::ToOpenFlags() const {
	if ((Has(READ) && Has(READ_WRITE)) || Has(APPEND)) {
		return XRootDOpenFlags::UPDATE;
	}
	if (Has(WRITE)) {
		return XRootDOpenFlags::DELETE;
	}
	if (Has(READ)) {
		return XRootDOpenFlags::READ;
	}
	return XRootDOpenFlags::NONE;
}

bool XRootDOpenMode::CanRead() const {
	return Has(READ_WRITE) || Has(READ);
}

bool XRootDOpenMode::CanWrite() const {
	return Has(READ_WRITE) || Has(WRITE) || Has(APPEND);
}

bool XRootDOpenMode::CanTruncate() const {
	if (Has(READ_WRITE)) {
		return true;
	}
	return !Has(STREAMING) && (Has(WRITE) || Has(APPEND));
}

bool XRootDOpenMode::CanSeek() const {
	return !Has(STREAMING);
}

} // namespace duckdb
