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

#ifndef MD_TEXT_UTIL_H
#define MD_TEXT_UTIL_H
#include <string>
#include <string_view>
#include "md_branchman/IntegralTypes.h"

namespace mdbm_impl {
	constexpr char32_t REPLACEMENT_CHARACTER = 0xFFFD;

	struct CodePoint {
		char32_t value;
		md_branchman::UInt width;
	};

	// Malformed sequences decode as U+FFFD with a width of one byte.
	auto decodeUtf8(std::string_view s, size_t pos) noexcept -> CodePoint;
	auto decodeUtf8Before(std::string_view s, size_t pos) noexcept -> CodePoint;
	void encodeUtf8(char32_t cp, std::string& out);

	bool isSpaceOrTab(char c) noexcept;
	bool isLineEnding(char c) noexcept;
	bool isAsciiPunctuation(char c) noexcept;
	bool isUnicodeWhitespace(char32_t cp) noexcept;
	bool isUnicodePunctuation(char32_t cp) noexcept;
	bool isBlank(std::string_view s) noexcept;

	auto trimSpaces(std::string_view s) noexcept -> std::string_view;
	auto trimTrailingSpaces(std::string_view s) noexcept -> std::string_view;
	auto caseFold(std::string_view s) -> std::string;
	bool containsCaseInsensitive(std::string_view haystack, std::string_view needle) noexcept;
	bool equalsCaseInsensitive(std::string_view a, std::string_view b) noexcept;
}

#endif
