#include "path_utils.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/helper.hpp"
#include "duckdb/common/string_util.hpp"
#include "xrootd_exception.hpp"

namespace duckdb {

bool PathUtils::IsAbsolute(const string &path) {
	return !path.empty() && path[0] == '/';
}

string PathUtils::Relative(const string &path) {
	const auto first_non_slash = path.find_first_not_of('/');
	if (first_non_slash == string::npos) {
		return "";
	}
	return path.substr(first_non_slash);
}

string PathUtils::Normalize(const string &path) {
	if (path.empty()) {
		return path;
	}

	vector<string> components;
	for (const auto &cur_part : StringUtil::Split(path, '/')) {
		if (cur_part.empty() || cur_part == ".") {
			continue;
		}
		if (cur_part == "..") {
			if (components.empty()) {
				throw XRootDBackReferenceException(path);
			}
			components.pop_back();
			continue;
		}
		components.emplace_back(cur_part);
	}

	auto normalized = StringUtil::Join(components, "/");
	if (IsAbsolute(path)) {
		return "/" + normalized;
	}
	return normalized;
}

string PathUtils::Join(const string &base, const string &path) {
	if (IsAbsolute(path) || base.empty()) {
		return Normalize(path);
	}
	return Normalize(base + "/" + path);
}

string PathUtils::Combine(const string &lhs, const string &rhs) {
	if (lhs.empty()) {
		return rhs;
	}
	if (lhs.back() == '/') {
		return lhs + Relative(rhs);
	}
	return lhs + "/" + Relative(rhs);
}

string PathUtils::BaseName(const string &path) {
	const auto slash_pos = path.rfind('/');
	if (slash_pos == string::npos) {
		return path;
	}
	return path.substr(slash_pos + 1);
}

string PathUtils::DirName(const string &path) {
	const auto slash_pos = path.rfind('/');
	if (slash_pos == string::npos) {
		return "";
	}
	if (slash_pos == 0) {
		return "/";
	}
	return path.substr(0, slash_pos);
}

bool PathUtils::HasPathPrefix(const string &path, const string &prefix) {
	if (prefix.empty()) {
		return true;
	}
	if (!StringUtil::StartsWith(path, prefix)) {
		return false;
	}
	return path.length() == prefix.length() || path[prefix.length()] == '/' || prefix.back() == '/';
}

WildcardMatcher::WildcardMatcher(const string &pattern) {
	::duckdb_re2::RE2::Options options;
	options.set_dot_nl(true);
	regex = make_uniq<::duckdb_re2::RE2>(TranslateToRegex(pattern), options);
	if (!regex->ok()) {
		throw InvalidInputException("Invalid wildcard pattern '%s': %s", pattern, regex->error());
	}
}

bool WildcardMatcher::Matches(const string &name) const {
	return ::duckdb_re2::RE2::FullMatch(name, *regex);
}

string WildcardMatcher::TranslateToRegex(const string &pattern) {
	string result;
	const idx_t pattern_len = pattern.length();
	idx_t idx = 0;
	while (idx < pattern_len) {
		const char cur = pattern[idx++];
		if (cur == '*') {
			// Consecutive stars match the same as a single one.
			if (!StringUtil::EndsWith(result, ".*")) {
				result += ".*";
			}
			continue;
		}
		if (cur == '?') {
			result += ".";
			continue;
		}
		if (cur != '[') {
			result += ::duckdb_re2::RE2::QuoteMeta(string(1, cur));
			continue;
		}

		// Character class, "]" right after the opening bracket (or "!") is a literal.
		idx_t class_end = idx;
		if (class_end < pattern_len && pattern[class_end] == '!') {
			++class_end;
		}
		if (class_end < pattern_len && pattern[class_end] == ']') {
			++class_end;
		}
		while (class_end < pattern_len && pattern[class_end] != ']') {
			++class_end;
		}
		if (class_end >= pattern_len) {
			result += "\\[";
			continue;
		}

		auto char_class = StringUtil::Replace(pattern.substr(idx, class_end - idx), "\\", "\\\\");
		idx = class_end + 1;
		if (!char_class.empty() && char_class[0] == '!') {
			char_class[0] = '^';
		} else if (!char_class.empty() && char_class[0] == '^') {
			char_class = "\\" + char_class;
		}
		result += "[" + char_class + "]";
	}
	return result;
}

} // namespace duckdb
