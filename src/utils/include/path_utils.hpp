// Path helpers for "/" separated remote namespaces.
//
// Semantics follow POSIX-style path joining with explicit back reference detection: resolving ".." above the root is
// an error instead of being silently clamped.

#pragma once

#include "duckdb/common/string.hpp"
#include "duckdb/common/unique_ptr.hpp"
#include "duckdb/common/vector.hpp"
#include "re2/re2.h"

namespace duckdb {

class PathUtils {
public:
	// Whether [path] starts with "/".
	static bool IsAbsolute(const string &path);

	// Drop leading slashes, i.e. "/a/b" -> "a/b".
	static string Relative(const string &path);

	// Collapse repeated slashes, drop "." and resolve ".."; absolute paths keep a single leading "/" and trailing
	// slashes are dropped.
	// Throws [XRootDBackReferenceException] if ".." climbs above the first component.
	// Example: "/a/./b/../c/" -> "/a/c", "a//b" -> "a/b", "" -> ""
	static string Normalize(const string &path);

	// Join [path] onto [base] and normalize; an absolute [path] replaces [base].
	// Example: ("/a/b", "../c") -> "/a/c", ("/a", "/x") -> "/x"
	static string Join(const string &base, const string &path);

	// Concatenate two paths with a single separator and without normalization, i.e. ("a/", "/b") -> "a/b",
	// ("//", "b") -> "//b".
	static string Combine(const string &lhs, const string &rhs);

	// Last path component, i.e. "/a/b" -> "b", "/a/" -> "".
	static string BaseName(const string &path);

	// Everything before the last component, i.e. "/a/b" -> "/a", "/a" -> "/", "a" -> "".
	static string DirName(const string &path);

	// Whether [path] equals [prefix] or lies below it, comparing whole components.
	static bool HasPathPrefix(const string &path, const string &prefix);
};

// Shell-style wildcard ("*", "?", "[seq]", "[!seq]") matcher for single path components.
class WildcardMatcher {
public:
	explicit WildcardMatcher(const string &pattern);

	// Whether the whole [name] matches the pattern.
	bool Matches(const string &name) const;

	// Translate a wildcard pattern into an equivalent regular expression.
	static string TranslateToRegex(const string &pattern);

private:
	unique_ptr<::duckdb_re2::RE2> regex;
};

} // namespace duckdb
