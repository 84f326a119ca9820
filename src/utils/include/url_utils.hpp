#pragma once

#include <utility>

#include "duckdb/common/string.hpp"
#include "duckdb/common/vector.hpp"

namespace duckdb {

//! Ordered query arguments, i.e. {{"xrd.wantprot", "krb5"}}
using QueryArgs = vector<std::pair<string, string>>;

//! Parsed URL components
struct ParsedURL {
	string scheme;   // e.g., "root", "roots"
	string host;     // e.g., "eosuser.cern.ch", "user:pw@localhost:1094"
	string path;     // e.g., "//eos/user/file.txt"
	string query;    // e.g., "xrd.wantprot=krb5"
	string fragment; // e.g., "section1"
	string root_url; // Scheme and host, e.g., "root://localhost:1094"
};

//! URL parsing and manipulation utilities
class URLUtils {
public:
	//! Parse URL into components
	//! Parses scheme, host, path, query, and fragment from a URL
	//! Example: "root://localhost:1094//tmp/file?xrd.wantprot=krb5#fragment"
	static ParsedURL ParseURL(const string &url);

	//! Whether the URL uses an XRootD scheme ("root" or "roots") and names a well-formed host
	static bool IsValidXRootDUrl(const string &url);

	//! Whether the path is a valid XRootD path: it starts with "//" and contains no other "//"
	static bool IsValidXRootDPath(const string &path);

	//! Whether the URL is handled by XRootD, only checks the scheme
	static bool HasXRootDScheme(const string &url);

	//! Parse a query string, blank values are dropped and the first value wins for duplicated keys
	//! Example: "a=1&b=x+y" -> {{"a", "1"}, {"b", "x y"}}
	static QueryArgs ParseQueryString(const string &query);

	//! Encode query arguments with form encoding
	//! Example: {{"a", "x y"}, {"b", "1/2"}} -> "a=x+y&b=1%2F2"
	static string EncodeQueryString(const QueryArgs &args);

	//! Lookup a key inside of query arguments, return nullptr if absent
	static const string *FindQueryArg(const QueryArgs &args, const string &key);
};

} // namespace duckdb
