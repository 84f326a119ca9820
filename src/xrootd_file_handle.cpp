#include "xrootd_file_handle.hpp"

#include <cstring>

#include "duckdb/common/exception.hpp"
#include "duckdb/common/helper.hpp"
#include "duckdb/common/numeric_utils.hpp"
#include "duckdb/common/string_util.hpp"
#include "path_utils.hpp"
#include "url_utils.hpp"
#include "xrootd_exception.hpp"
#include "xrootd_filesystem.hpp"
#include "xrootd_filesystem_logger.hpp"
#include "xrootd_status.hpp"

namespace duckdb {

namespace {

constexpr const char *DEFAULT_NEWLINE = "\n";

bool IsSupportedNewline(const string &newline) {
	return newline.empty() || newline == "\n" || newline == "\r" || newline == "\r\n";
}

// DuckDB open flags matching the capabilities of [mode].
FileOpenFlags GetFileOpenFlags(const string &mode_str) {
	const auto mode = XRootDOpenMode::Parse(mode_str);
	FileOpenFlags flags;
	if (mode.CanRead()) {
		flags = flags | FileOpenFlags::FILE_FLAGS_READ;
	}
	if (mode.CanWrite()) {
		flags = flags | FileOpenFlags::FILE_FLAGS_WRITE;
	}
	if (mode.IsAppend()) {
		flags = flags | FileOpenFlags::FILE_FLAGS_APPEND;
	}
	return flags;
}

} // namespace

XRootDFileHandle::XRootDFileHandle(XRootDFileSystem &fs, const string &url, XRootDFileOptions options,
                                   unique_ptr<XRootDRemoteFile> remote_file_p)
    : FileHandle(fs, url, GetFileOpenFlags(options.mode)), xrootd_fs(fs), mode(XRootDOpenMode::Parse(options.mode)),
      buffering(options.buffering), newline(std::move(options.newline)), buffer_size(options.buffer_size),
      remote_file(std::move(remote_file_p)) {
	D_ASSERT(remote_file != nullptr);

	if (!URLUtils::IsValidXRootDUrl(url)) {
		throw XRootDPathFormatException(url);
	}
	const auto remote_path = URLUtils::ParseURL(url).path;
	if (!URLUtils::IsValidXRootDPath(remote_path)) {
		throw XRootDInvalidPathException(remote_path);
	}
	if (!IsSupportedNewline(newline)) {
		throw XRootDUnsupportedException(StringUtil::Format("newline sequence '%s' for file %s", newline, url));
	}
	if (options.line_buffering) {
		throw NotImplementedException("Line buffering for writing XRootD file %s is not supported", url);
	}
	if (buffering == 1 && mode.IsBinary()) {
		throw XRootDUnsupportedException(StringUtil::Format("line buffering for binary file %s", url));
	}
	const auto open_flags = mode.ToOpenFlags();
	if (open_flags == XRootDOpenFlags::NONE) {
		throw InvalidInputException("Invalid open mode '%s' for XRootD file %s", mode.ToString(), url);
	}
	if (newline.empty()) {
		newline = DEFAULT_NEWLINE;
	}
	if (buffer_size == 0) {
		buffer_size = DEFAULT_READ_BUFFER_SIZE;
	}

	const auto status = remote_file->Open(url, open_flags);
	ThrowIfXRootDFileError(status, url, "instantiating");

	try {
		if (mode.IsAppend()) {
			position = GetSize();
		}
	} catch (std::exception &) {
		const auto close_status = remote_file->Close();
		XROOTDFS_LOG_DEBUG_OPTIONAL(xrootd_fs.GetDatabaseInstance(),
		                            StringUtil::Format("Close XRootD file %s after failed open: %s", url,
		                                               close_status.ToString()));
		throw;
	}
}

XRootDFileHandle::~XRootDFileHandle() {
	if (IsClosed()) {
		return;
	}
	try {
		Close();
	} catch (std::exception &ex) {
		XROOTDFS_LOG_DEBUG_OPTIONAL(xrootd_fs.GetDatabaseInstance(),
		                            StringUtil::Format("Failed to close XRootD file %s on destruction: %s", path,
		                                               ex.what()));
	}
}

void XRootDFileHandle::CheckReadable() const {
	if (IsClosed()) {
		throw InvalidInputException("I/O operation on closed file %s", path);
	}
	if (!mode.CanRead()) {
		throw IOException("File %s not opened for reading", path);
	}
}

string XRootDFileHandle::Read(int64_t size_hint) {
	CheckReadable();

	int64_t chunk_size = size_hint;
	if (chunk_size <= 0) {
		chunk_size = static_cast<int64_t>(GetSize()) - static_cast<int64_t>(position);
	}
	if (chunk_size >= MAX_READ_CHUNK_SIZE) {
		throw IOException("Chunk size %lld to read from file %s is 2GiB or more, which is not supported", chunk_size,
		                  path);
	}
	// Position is past end of file, a single byte request returns nothing.
	if (chunk_size < 0) {
		chunk_size = 1;
	}
	if (chunk_size == 0) {
		return "";
	}

	string content;
	const auto status = remote_file->Read(position, NumericCast<uint32_t>(chunk_size), content);
	ThrowIfXRootDFileError(status, path, "reading");
	DUCKDB_LOG_XROOTD_READ((*this));

	position += content.length();
	if (cached_size.IsValid() && position > cached_size.GetIndex()) {
		cached_size = position;
	}
	return content;
}

idx_t XRootDFileHandle::Read(char *buffer, idx_t nr_bytes) {
	if (nr_bytes == 0) {
		return 0;
	}
	const auto content = Read(NumericCast<int64_t>(nr_bytes));
	D_ASSERT(content.length() <= nr_bytes);
	std::memcpy(buffer, content.data(), content.length());
	return content.length();
}

idx_t XRootDFileHandle::ReadAt(char *buffer, idx_t nr_bytes, idx_t location) {
	CheckReadable();
	if (nr_bytes == 0) {
		return 0;
	}
	if (nr_bytes >= static_cast<idx_t>(MAX_READ_CHUNK_SIZE)) {
		throw IOException("Chunk size %llu to read from file %s is 2GiB or more, which is not supported", nr_bytes,
		                  path);
	}

	string content;
	const auto status = remote_file->Read(location, NumericCast<uint32_t>(nr_bytes), content);
	ThrowIfXRootDFileError(status, path, "reading");
	DUCKDB_LOG_XROOTD_READ((*this));

	D_ASSERT(content.length() <= nr_bytes);
	std::memcpy(buffer, content.data(), content.length());
	return content.length();
}

string XRootDFileHandle::ReadLine() {
	string line;
	if (buffer_position == position) {
		line = std::move(read_ahead_buffer);
	}
	read_ahead_buffer.clear();

	auto newline_pos = line.find(newline);
	while (newline_pos == string::npos) {
		auto chunk = Read(NumericCast<int64_t>(buffer_size));
		if (chunk.empty()) {
			break;
		}
		// A multi-byte separator could straddle two chunks.
		const idx_t search_start = line.length() >= newline.length() ? line.length() - newline.length() + 1 : 0;
		line += chunk;
		newline_pos = line.find(newline, search_start);
	}
	if (newline_pos == string::npos) {
		return line;
	}

	const idx_t line_end = newline_pos + newline.length();
	read_ahead_buffer = line.substr(line_end);
	buffer_position = position;
	line.resize(line_end);
	return line;
}

vector<string> XRootDFileHandle::ReadLines() {
	vector<string> lines;
	for (;;) {
		auto cur_line = ReadLine();
		if (cur_line.empty()) {
			break;
		}
		lines.emplace_back(std::move(cur_line));
	}
	return lines;
}

bool XRootDFileHandle::IteratesLines() const {
	return buffering == 1 || (buffering == -1 && !mode.IsBinary());
}

bool XRootDFileHandle::Next(string &item) {
	if (IteratesLines()) {
		item = ReadLine();
	} else {
		const int64_t chunk_size = buffering > 1 ? buffering : NumericCast<int64_t>(buffer_size);
		item = Read(chunk_size);
	}
	return !item.empty();
}

void XRootDFileHandle::Write(const string &data, bool flushing) {
	Write(data.data(), data.length());
	if (flushing) {
		Flush();
	}
}

void XRootDFileHandle::Write(const char *buffer, idx_t nr_bytes) {
	if (!mode.CanWrite()) {
		throw IOException("File %s not opened for writing", path);
	}
	if (mode.IsAppend()) {
		position = GetSize();
	}
	WriteRemote(buffer, nr_bytes, position);
	position += nr_bytes;
}

void XRootDFileHandle::WriteAt(const char *buffer, idx_t nr_bytes, idx_t location) {
	if (!mode.CanWrite()) {
		throw IOException("File %s not opened for writing", path);
	}
	WriteRemote(buffer, nr_bytes, location);
}

void XRootDFileHandle::WriteRemote(const char *buffer, idx_t nr_bytes, idx_t location) {
	if (nr_bytes == 0) {
		return;
	}
	idx_t bytes_written = 0;
	do {
		const idx_t cur_chunk_size = MinValue<idx_t>(nr_bytes - bytes_written, MAX_WRITE_CHUNK_SIZE);
		const auto status =
		    remote_file->Write(location + bytes_written, buffer + bytes_written, NumericCast<uint32_t>(cur_chunk_size));
		ThrowIfXRootDFileError(status, path, "writing");
		bytes_written += cur_chunk_size;
	} while (bytes_written < nr_bytes);
	DUCKDB_LOG_XROOTD_WRITE((*this));

	cached_size = MaxValue<idx_t>(GetSize(), location + nr_bytes);
	read_ahead_buffer.clear();
}

void XRootDFileHandle::WriteLines(const vector<string> &lines) {
	for (const auto &cur_line : lines) {
		Write(cur_line);
	}
}

void XRootDFileHandle::Seek(int64_t offset, int whence) {
	if (!mode.CanSeek()) {
		throw IOException("File %s opened in streaming mode is not seekable", path);
	}
	if (offset < 0 && !(mode.IsBinary() && whence == SEEK_END)) {
		throw IOException("Invalid argument: negative offset %lld to seek file %s", offset, path);
	}

	int64_t new_position = 0;
	switch (whence) {
	case SEEK_SET:
		new_position = offset;
		break;
	case SEEK_CUR:
		new_position = static_cast<int64_t>(position) + offset;
		break;
	case SEEK_END:
		new_position = static_cast<int64_t>(GetSize()) + offset;
		break;
	default:
		throw NotImplementedException("Unsupported whence %d to seek file %s", whence, path);
	}
	if (new_position < 0) {
		throw IOException("Invalid argument: seek file %s to negative position %lld", path, new_position);
	}
	position = static_cast<idx_t>(new_position);
}

void XRootDFileHandle::Truncate() {
	Truncate(position);
}

void XRootDFileHandle::Truncate(idx_t new_size) {
	if (!mode.CanTruncate()) {
		if (mode.IsStreaming()) {
			throw IOException("File %s opened in streaming mode cannot be truncated", path);
		}
		throw IOException("File %s not opened for writing", path);
	}
	const auto status = remote_file->Truncate(new_size);
	ThrowIfXRootDFileError(status, path, "truncating");
	DUCKDB_LOG_XROOTD_TRUNCATE((*this));

	cached_size = new_size;
	read_ahead_buffer.clear();
}

void XRootDFileHandle::Flush() {
	if (IsClosed()) {
		return;
	}
	const auto status = remote_file->Sync();
	ThrowIfXRootDFileError(status, path, "flushing write buffer of");
	DUCKDB_LOG_XROOTD_SYNC((*this));
}

void XRootDFileHandle::Close() {
	if (IsClosed()) {
		return;
	}
	const auto status = remote_file->Close();
	ThrowIfXRootDFileError(status, path, "closing");
	DUCKDB_LOG_XROOTD_CLOSE((*this));
}

XRootDStatInfo XRootDFileHandle::StatRemote() {
	XRootDStatInfo info;
	const auto status = remote_file->Stat(info);
	ThrowIfXRootDFileError(status, path, "retrieving size of");
	cached_size = info.size;
	return info;
}

idx_t XRootDFileHandle::GetSize() {
	if (!cached_size.IsValid()) {
		StatRemote();
	}
	return cached_size.GetIndex();
}

timestamp_t XRootDFileHandle::GetLastModifiedTime() {
	const auto info = StatRemote();
	return Timestamp::FromEpochSeconds(NumericCast<int64_t>(info.modification_time));
}

bool XRootDFileHandle::Seekable() const {
	return mode.CanSeek();
}

bool XRootDFileHandle::Readable() const {
	return mode.CanRead();
}

bool XRootDFileHandle::Writable() const {
	return mode.CanWrite();
}

bool XRootDFileHandle::IsClosed() const {
	return remote_file == nullptr || !remote_file->IsOpen();
}

string XRootDFileHandle::GetName() const {
	return PathUtils::BaseName(path);
}

} // namespace duckdb
