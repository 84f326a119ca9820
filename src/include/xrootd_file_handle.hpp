// File handle which emulates a local seekable stream on top of an XRootD remote file.
//
// The remote file only offers reads and writes at explicit byte offsets, so the handle keeps the stream state itself:
// - an implicit position, moved by reads, writes and seeks;
// - the cached file size, fetched lazily with a remote stat and kept up to date on writes and truncation;
// - a small read-ahead buffer, which holds bytes already fetched past the last returned line.
//
// Which operations are legal is decided by the open mode once parsed, see [XRootDOpenMode].
// A handle is owned and used by a single thread.

#pragma once

#include <cstdio>

#include "duckdb/common/file_system.hpp"
#include "duckdb/common/optional_idx.hpp"
#include "duckdb/common/string.hpp"
#include "duckdb/common/types/timestamp.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include "duckdb/common/vector.hpp"
#include "xrootd_client.hpp"
#include "xrootd_filesystem_config.hpp"
#include "xrootd_open_mode.hpp"

namespace duckdb {

// Forward declaration.
class XRootDFileSystem;

struct XRootDFileOptions {
	// Open mode token, i.e. "r", "w+", "ab", "r-".
	string mode = "r";
	// -1 for default, 0 for unbuffered, 1 for line buffered, larger values for chunk size; only affects iteration.
	int64_t buffering = -1;
	// Line separator for line reads, one of "", "\n", "\r" and "\r\n"; empty means "\n".
	string newline;
	// Line buffering for writes isn't supported, only false is accepted.
	bool line_buffering = false;
	// Chunk size for line reads and chunked iteration.
	idx_t buffer_size = DEFAULT_READ_BUFFER_SIZE;
};

class XRootDFileHandle : public FileHandle {
public:
	// Validate [url] and [options], then open [remote_file] at [url].
	// Validation failures are raised before any remote call. If anything fails after the remote open, the remote file
	// is closed before the error propagates.
	XRootDFileHandle(XRootDFileSystem &fs, const string &url, XRootDFileOptions options,
	                 unique_ptr<XRootDRemoteFile> remote_file_p);
	// Close the remote file if still open, failures are logged instead of thrown.
	~XRootDFileHandle() override;

	// Read [size_hint] bytes if positive, otherwise all bytes from the current position to end of file.
	// Reading at or past end of file returns an empty string.
	string Read(int64_t size_hint = -1);
	// Read at most [nr_bytes] bytes into [buffer], return the number of bytes read.
	idx_t Read(char *buffer, idx_t nr_bytes);
	// Positional read at [location], which leaves the position untouched.
	// Only the remote file is accessed, so concurrent positional reads on one handle are fine.
	idx_t ReadAt(char *buffer, idx_t nr_bytes, idx_t location);

	// Read one line including its separator; the last line of a file might come without one.
	// Bytes fetched past the separator are kept for the next call, so the position afterwards reports the end of the
	// last chunk pulled from the remote, not the end of the returned line.
	string ReadLine();
	// Read all remaining lines.
	vector<string> ReadLines();

	// Iteration: fill [item] with the next line or chunk (depending on buffering and mode), return false once it's
	// empty. Restart iteration with a seek to 0.
	bool Next(string &item);

	// Write [data] at the current position, or at end of file for append modes. If [flushing], sync afterwards.
	void Write(const string &data, bool flushing = false);
	void Write(const char *buffer, idx_t nr_bytes);
	void WriteLines(const vector<string> &lines);
	// Positional write at [location], which leaves the position untouched, even for append modes.
	void WriteAt(const char *buffer, idx_t nr_bytes, idx_t location);

	// Move the position, [whence] is one of SEEK_SET, SEEK_CUR and SEEK_END.
	// Negative offsets are only accepted from end of file for binary modes; seeking past end of file is allowed and
	// doesn't grow the file.
	void Seek(int64_t offset, int whence = SEEK_SET);
	idx_t Tell() const {
		return position;
	}

	// Truncate (or zero-extend) the file to the current position or [new_size]. The position is left unchanged.
	void Truncate();
	void Truncate(idx_t new_size);

	// Sync written data on the remote, no-op for closed handles.
	void Flush();

	// Close the remote file, no-op for closed handles.
	void Close() override;

	// Get file size, a remote stat is issued on first access.
	idx_t GetSize();
	// Get last modification timestamp with a fresh remote stat.
	timestamp_t GetLastModifiedTime();

	bool Seekable() const;
	bool Readable() const;
	bool Writable() const;
	bool IsClosed() const;
	// Basename of the URL.
	string GetName() const;
	const XRootDOpenMode &GetMode() const {
		return mode;
	}

private:
	// Issue a remote stat and refresh the cached size.
	XRootDStatInfo StatRemote();
	// Whether iteration yields lines instead of chunks.
	bool IteratesLines() const;
	// Check the handle is open and readable.
	void CheckReadable() const;
	// Issue chunked remote writes of [nr_bytes] at [location].
	void WriteRemote(const char *buffer, idx_t nr_bytes, idx_t location);

	XRootDFileSystem &xrootd_fs;
	XRootDOpenMode mode;
	int64_t buffering;
	string newline;
	idx_t buffer_size;
	unique_ptr<XRootDRemoteFile> remote_file;

	// Emulated stream position.
	idx_t position = 0;
	// Last known remote file size, unset until first needed.
	optional_idx cached_size;
	// Bytes already fetched past the last returned line, valid only while [buffer_position] equals [position].
	string read_ahead_buffer;
	idx_t buffer_position = 0;
};

} // namespace duckdb
