#include "url_utils.hpp"

#include <cctype>

#include "duckdb/common/string_util.hpp"
#include "xrootd_filesystem_config.hpp"

namespace duckdb {

namespace {

// Decode a form-encoded component, "+" stands for a space.
string FormDecode(const string &input) {
	return StringUtil::URLDecode(input, /*plus_to_space=*/true);
}

// Encode a component the way HTML forms do, spaces become "+".
string FormEncode(const string &input) {
	return StringUtil::Replace(StringUtil::URLEncode(input), "%20", "+");
}

// Validate "[user[:password]@]host[:port]".
bool IsValidNetloc(const string &netloc) {
	string host_port = netloc;
	const auto at_pos = netloc.rfind('@');
	if (at_pos != string::npos) {
		if (at_pos == 0) {
			return false;
		}
		host_port = netloc.substr(at_pos + 1);
	}
	if (host_port.empty()) {
		return false;
	}

	string host = host_port;
	string port;
	if (host_port[0] == '[') {
		// IPv6 literal, i.e. "[::1]:1094".
		const auto bracket_end = host_port.find(']');
		if (bracket_end == string::npos || bracket_end == 1) {
			return false;
		}
		host = host_port.substr(0, bracket_end + 1);
		const auto rest = host_port.substr(bracket_end + 1);
		if (!rest.empty()) {
			if (rest[0] != ':') {
				return false;
			}
			port = rest.substr(1);
			if (port.empty()) {
				return false;
			}
		}
	} else {
		const auto colon_pos = host_port.find(':');
		if (colon_pos != string::npos) {
			host = host_port.substr(0, colon_pos);
			port = host_port.substr(colon_pos + 1);
			if (port.empty()) {
				return false;
			}
		}
	}
	if (host.empty()) {
		return false;
	}
	for (const char cur : port) {
		if (!std::isdigit(static_cast<unsigned char>(cur))) {
			return false;
		}
	}
	return true;
}

} // namespace

ParsedURL URLUtils::ParseURL(const string &url) {
	ParsedURL result;

	if (url.empty()) {
		return result;
	}

	size_t pos = 0;
	const size_t url_len = url.length();

	// 1. Parse scheme (e.g., "root://", "roots://")
	auto scheme_end = url.find("://", pos);
	if (scheme_end != string::npos) {
		result.scheme = url.substr(pos, scheme_end - pos);
		pos = scheme_end + 3; // Skip "://"
	}

	// 2. Find the end of host (marked by '/', '?', or '#')
	size_t host_end = url.find_first_of("/?#", pos);
	if (host_end == string::npos) {
		result.host = url.substr(pos);
		result.root_url = url;
		return result;
	}

	result.host = url.substr(pos, host_end - pos);
	result.root_url = url.substr(0, host_end);
	pos = host_end;

	// 3. Parse path (until '?' or '#'); XRootD paths keep their leading "//"
	size_t path_end = url.find_first_of("?#", pos);
	if (path_end == string::npos) {
		result.path = url.substr(pos);
		return result;
	}
	result.path = url.substr(pos, path_end - pos);
	pos = path_end;

	// 4. Parse query (if starts with '?')
	if (pos < url_len && url[pos] == '?') {
		pos++;
		size_t query_end = url.find('#', pos);
		if (query_end == string::npos) {
			result.query = url.substr(pos);
			return result;
		}
		result.query = url.substr(pos, query_end - pos);
		pos = query_end;
	}

	// 5. Parse fragment (if starts with '#')
	if (pos < url_len && url[pos] == '#') {
		pos++;
		result.fragment = url.substr(pos);
	}

	return result;
}

bool URLUtils::HasXRootDScheme(const string &url) {
	return StringUtil::StartsWith(url, XROOTD_SCHEME_PREFIX) ||
	       StringUtil::StartsWith(url, XROOTD_SECURE_SCHEME_PREFIX);
}

bool URLUtils::IsValidXRootDUrl(const string &url) {
	if (!HasXRootDScheme(url)) {
		return false;
	}
	const auto parsed = ParseURL(url);
	return IsValidNetloc(parsed.host);
}

bool URLUtils::IsValidXRootDPath(const string &path) {
	if (path.length() <= 1) {
		return false;
	}
	if (!StringUtil::StartsWith(path, "//")) {
		return false;
	}
	return path.find("//", 1) == string::npos;
}

QueryArgs URLUtils::ParseQueryString(const string &query) {
	QueryArgs args;
	for (const auto &cur_field : StringUtil::Split(query, '&')) {
		if (cur_field.empty()) {
			continue;
		}
		const auto eq_pos = cur_field.find('=');
		if (eq_pos == string::npos) {
			continue;
		}
		auto key = FormDecode(cur_field.substr(0, eq_pos));
		auto value = FormDecode(cur_field.substr(eq_pos + 1));
		if (value.empty()) {
			continue;
		}
		if (FindQueryArg(args, key) != nullptr) {
			continue;
		}
		args.emplace_back(std::move(key), std::move(value));
	}
	return args;
}

string URLUtils::EncodeQueryString(const QueryArgs &args) {
	vector<string> fields;
	fields.reserve(args.size());
	for (const auto &cur_arg : args) {
		fields.emplace_back(FormEncode(cur_arg.first) + "=" + FormEncode(cur_arg.second));
	}
	return StringUtil::Join(fields, "&");
}

const string *URLUtils::FindQueryArg(const QueryArgs &args, const string &key) {
	for (const auto &cur_arg : args) {
		if (cur_arg.first == key) {
			return &cur_arg.second;
		}
	}
	return nullptr;
}

} // namespace duckdb
