/*
MIT License

Copyright (c) 2020 Christian Greyeyes

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#ifndef MD_LINK_RESOLVER_H
#define MD_LINK_RESOLVER_H
#include <string>
#include <string_view>
#include <optional>
#include "md_branchman/ParserOptions.h"

namespace mdbm_impl {
	// Scanners take the subject and the position of the construct's first
	// character; lengths include delimiters and 0 means no match.

	auto scanLinkLabel(std::string_view s, size_t pos, md_branchman::UInt maxLength) noexcept -> size_t;

	struct DestinationMatch {
		size_t length;
		// without angle brackets, escapes still in place
		std::string_view raw;
	};
	auto scanLinkDestination(std::string_view s, size_t pos, md_branchman::UInt maxParenDepth) noexcept -> std::optional<DestinationMatch>;

	auto scanLinkTitle(std::string_view s, size_t pos) noexcept -> size_t;

	// Skips blanks, at most one line ending, and the blanks after it.
	auto skipSpacesAndNewline(std::string_view s, size_t pos) noexcept -> size_t;

	// Backslash escapes and entity references resolved.
	auto decodeLinkText(std::string_view s, const md_branchman::EntityTable& entities) -> std::string;
}

#endif
