#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <string>
#include <vector>

namespace rupload {

struct URIParse {
	URIParse(const std::string &uri_);

	URIParse() = default;
	void parse(const std::string &uri_);

	// RFC 3986 §5.2.1
	std::string transformRelativeReference(const std::string &relativeUri) const;

	// RFC 3986 §5.2.3
	std::string mergedRelativePath(const std::string &relativePath) const;

	// RFC 3986 §5.2.4
	static std::string removeDotSegments(const std::string &path);

	// split str on sep into at most maxParts (0 for unlimited)
	static std::vector<std::string> split(const std::string &str, char sep, size_t maxParts = 0);

	static std::string lowercase(const std::string &s);

	// decode a percent-encoded string, return empty string on error
	static std::string percentDecode(const std::string &str);

	// path plus query, "/" if empty. the request-target for origin-form requests.
	std::string requestTarget() const;

	std::string uri;
	std::string schemePart;
	std::string scheme;
	std::string canonicalScheme;
	std::string hierpart;
	std::string queryPart;
	std::string query;
	std::string fragmentPart;
	std::string fragment;
	std::string authorityPart;
	std::string authority;
	std::string path;
	std::string hostinfo;
	std::string host;
	std::string port;
	std::string effectivePort;
	std::string origin;
};

} // namespace rupload
