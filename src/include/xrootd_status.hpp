// Translation from remote call statuses into the XRootD exception taxonomy.
//
// All failed remote calls issued by file handles and filesystem facades funnel through the functions below. Query
// strings of the reported URL are dropped from messages.

#pragma once

#include "duckdb/common/string.hpp"
#include "xrootd_client.hpp"

namespace duckdb {

bool IsDestinationExistsStatus(const XRootDStatus &status);
bool IsNotFoundStatus(const XRootDStatus &status);
bool IsDirectoryNotEmptyStatus(const XRootDStatus &status);

// Throw the taxonomy error for a failed namespace operation on [path]; no-op on success.
void ThrowIfXRootDError(const XRootDStatus &status, const string &path);

// Throw for a failed file operation, where [operation] describes what the handle was doing (i.e. "reading"); the
// message reads "XRootD error <operation> file (<path>): <server message>".
// Missing files surface as not-found, everything else as plain IO errors.
void ThrowIfXRootDFileError(const XRootDStatus &status, const string &path, const string &operation);

// Throw for a failed server query, unsupported query codes surface as unsupported errors.
void ThrowIfXRootDQueryError(const XRootDStatus &status, const string &path);

} // namespace duckdb
