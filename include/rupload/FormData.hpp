#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

// multipart/form-data (RFC 7578) bodies. File parts refer to ranges of a
// ByteSource and are read only when the body is written.

#include "Http.hpp"

namespace rupload { namespace http {

class FormData {
public:
	FormData(); // random boundary
	explicit FormData(const std::string &boundary);

	void append(const std::string &name, const std::string &value);
	void append(const std::string &name, const std::string &filename, const std::string &contentType,
		std::shared_ptr<ByteSource> source, uint64_t offset, uint64_t length);

	std::string getBoundary() const;
	std::string contentType() const; // multipart/form-data; boundary=...

	Body encode() const;
	uint64_t encodedSize() const;

	struct Part {
		std::string name;
		std::string filename;
		std::string contentType;
		Bytes       value;

		std::string text() const;
		bool isFile() const;
	};
	using PartList = std::vector<Part>;

	// Split a received multipart body into its parts. Answer false if body
	// isn't a well-formed multipart body for boundary.
	static bool parse(const Bytes &body, const std::string &boundary, PartList &dst);

	// The boundary parameter of a multipart Content-Type, or empty.
	static std::string boundaryFromContentType(const std::string &contentType);

	static const Part * find(const PartList &parts, const std::string &name);

protected:
	struct Field {
		std::string head;
		std::string value;
		std::shared_ptr<ByteSource> source;
		uint64_t offset;
		uint64_t length;
	};

	std::string        m_boundary;
	std::vector<Field> m_fields;
};

} } // namespace rupload::http
