// Open mode tokens for XRootD file handles.
//
// A mode token is made of the characters "r", "w", "a" (direction), "+" (also allow the opposite direction), "-"
// (streaming, not seekable) and "b" or "t" (binary or text); other characters are ignored. The token is parsed once
// and every capability check afterwards only tests flags.

#pragma once

#include <cstdint>

#include "duckdb/common/string.hpp"
#include "xrootd_client.hpp"

namespace duckdb {

class XRootDOpenMode {
public:
	enum Flag : uint8_t {
		READ = 1 << 0,
		WRITE = 1 << 1,
		APPEND = 1 << 2,
		STREAMING = 1 << 3,
		READ_WRITE = 1 << 4,
		BINARY = 1 << 5,
	};

	XRootDOpenMode() = default;

	static XRootDOpenMode Parse(const string &mode);

	// Remote open flag for the mode:
	// - "r+" or any append mode: update;
	// - any write mode: delete existing file and create a new one;
	// - plain read: read only;
	// - anything else: none, which cannot be opened.
	XRootDOpenFlags ToOpenFlags() const;

	bool Has(Flag flag) const {
		return (flags & flag) != 0;
	}
	bool IsAppend() const {
		return Has(APPEND);
	}
	bool IsBinary() const {
		return Has(BINARY);
	}
	bool IsStreaming() const {
		return Has(STREAMING);
	}

	// Capability gates consulted by file handles.
	bool CanRead() const;
	bool CanWrite() const;
	bool CanTruncate() const;
	bool CanSeek() const;

	const string &ToString() const {
		return mode;
	}

private:
	string mode;
	uint8_t flags = 0;
};

} // namespace duckdb
