// Exception taxonomy surfaced by XRootD file handles and filesystem facades.

#pragma once

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string.hpp"

namespace duckdb {

// Base class for all XRootD specific errors.
class XRootDException : public IOException {
public:
	explicit XRootDException(const string &msg) : IOException(msg) {
	}

protected:
	// Format "<what>: <path>", followed by remote detail if any.
	static string Describe(const string &what, const string &path, const string &detail) {
		string message = what + ": " + path;
		if (!detail.empty()) {
			message += " (" + detail + ")";
		}
		return message;
	}
};

// Malformed URL, i.e. unknown scheme or missing host.
class XRootDPathFormatException : public XRootDException {
public:
	explicit XRootDPathFormatException(const string &url, const string &detail = "")
	    : XRootDException(Describe("Malformed XRootD URL", url, detail)) {
	}
};

// Path component violates the "//" rooted grammar.
class XRootDInvalidPathException : public XRootDException {
public:
	explicit XRootDInvalidPathException(const string &path, const string &detail = "")
	    : XRootDException(Describe("Invalid XRootD path", path, detail)) {
	}
};

// Path resolution tried to climb above the namespace root.
class XRootDBackReferenceException : public XRootDException {
public:
	explicit XRootDBackReferenceException(const string &path)
	    : XRootDException(Describe("Illegal back reference", path, "")) {
	}
};

class XRootDResourceNotFoundException : public XRootDException {
public:
	explicit XRootDResourceNotFoundException(const string &path, const string &detail = "")
	    : XRootDException(Describe("Resource not found", path, detail)) {
	}
};

class XRootDDestinationExistsException : public XRootDException {
public:
	explicit XRootDDestinationExistsException(const string &path, const string &detail = "")
	    : XRootDException(Describe("Destination exists", path, detail)) {
	}
};

class XRootDDirectoryNotEmptyException : public XRootDException {
public:
	explicit XRootDDirectoryNotEmptyException(const string &path, const string &detail = "")
	    : XRootDException(Describe("Directory not empty", path, detail)) {
	}
};

// Resource has the wrong type, a file where a directory is expected or vice versa.
class XRootDResourceInvalidException : public XRootDException {
public:
	explicit XRootDResourceInvalidException(const string &path, const string &detail = "")
	    : XRootDException(Describe("Resource invalid", path, detail)) {
	}
};

// Operation or option not available, either locally or on the connected server.
class XRootDUnsupportedException : public XRootDException {
public:
	explicit XRootDUnsupportedException(const string &detail)
	    : XRootDException("Unsupported XRootD operation: " + detail) {
	}
};

class XRootDRemoteConnectionException : public XRootDException {
public:
	explicit XRootDRemoteConnectionException(const string &url, const string &detail = "")
	    : XRootDException(Describe("Cannot reach XRootD server", url, detail)) {
	}
};

// Catch-all for failed remote calls, carries the server message verbatim.
class XRootDResourceErrorException : public XRootDException {
public:
	explicit XRootDResourceErrorException(const string &path, const string &detail = "")
	    : XRootDException(Describe("XRootD resource error", path, detail)) {
	}
};

} // namespace duckdb
