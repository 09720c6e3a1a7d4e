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

#include <string>
#include <string_view>
#include <algorithm>
#include <cstring>
#include "TextUtil.h"

using md_branchman::UInt;

auto mdbm_impl::decodeUtf8(std::string_view s, size_t pos) noexcept -> CodePoint {
	if (pos >= s.size()) {
		return { U'\n', 0 };
	}
	const auto lead = static_cast<unsigned char>(s[pos]);
	if (lead < 0x80) {
		return { lead, 1 };
	}
	UInt len = 0;
	char32_t cp = 0;
	if ((lead & 0xE0) == 0xC0) {
		len = 2;
		cp = lead & 0x1F;
	}
	else if ((lead & 0xF0) == 0xE0) {
		len = 3;
		cp = lead & 0x0F;
	}
	else if ((lead & 0xF8) == 0xF0) {
		len = 4;
		cp = lead & 0x07;
	}
	else {
		return { REPLACEMENT_CHARACTER, 1 };
	}
	if (pos + len > s.size()) {
		return { REPLACEMENT_CHARACTER, 1 };
	}
	for (UInt i = 1; i < len; ++i) {
		const auto trail = static_cast<unsigned char>(s[pos + i]);
		if ((trail & 0xC0) != 0x80) {
			return { REPLACEMENT_CHARACTER, 1 };
		}
		cp = (cp << 6) | (trail & 0x3F);
	}
	return { cp, len };
}

auto mdbm_impl::decodeUtf8Before(std::string_view s, size_t pos) noexcept -> CodePoint {
	if (pos == 0 or pos > s.size()) {
		return { U'\n', 0 };
	}
	size_t start = pos - 1;
	while (start > 0 and pos - start < 4 and (static_cast<unsigned char>(s[start]) & 0xC0) == 0x80) {
		--start;
	}
	CodePoint cp = decodeUtf8(s, start);
	if (start + cp.width != pos) {
		return { REPLACEMENT_CHARACTER, 1 };
	}
	return cp;
}

void mdbm_impl::encodeUtf8(char32_t cp, std::string& out) {
	if (cp == 0 or cp > 0x10FFFF or (cp >= 0xD800 and cp <= 0xDFFF)) {
		cp = REPLACEMENT_CHARACTER;
	}
	if (cp < 0x80) {
		out.push_back(static_cast<char>(cp));
	}
	else if (cp < 0x800) {
		out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
		out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
	}
	else if (cp < 0x10000) {
		out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
		out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
	}
	else {
		out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
		out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
	}
}

bool mdbm_impl::isSpaceOrTab(const char c) noexcept {
	return c == ' ' or c == '\t';
}

bool mdbm_impl::isLineEnding(const char c) noexcept {
	return c == '\n' or c == '\r';
}

bool mdbm_impl::isAsciiPunctuation(const char c) noexcept {
	return std::strchr("!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~", c) != nullptr and c != '\0';
}

bool mdbm_impl::isUnicodeWhitespace(const char32_t cp) noexcept {
	switch (cp) {
	case U' ': case U'\t': case U'\n': case U'\r': case U'\f':
	case 0x00A0: case 0x1680: case 0x202F: case 0x205F: case 0x3000:
		return true;
	default:
		return cp >= 0x2000 and cp <= 0x200A;
	}
}

bool mdbm_impl::isUnicodePunctuation(const char32_t cp) noexcept {
	if (cp < 0x80) {
		return isAsciiPunctuation(static_cast<char>(cp));
	}
	// Latin-1 punctuation and symbols
	if ((cp >= 0x00A1 and cp <= 0x00BF) or cp == 0x00D7 or cp == 0x00F7) {
		return true;
	}
	struct Range { char32_t lo, hi; };
	static constexpr Range ranges[] = {
		{ 0x02C2, 0x02C5 }, { 0x02D2, 0x02DF }, { 0x037E, 0x037E }, { 0x0387, 0x0387 },
		{ 0x055A, 0x055F }, { 0x0589, 0x058A }, { 0x05BE, 0x05BE }, { 0x05C0, 0x05C0 },
		{ 0x060C, 0x060D }, { 0x061B, 0x061F }, { 0x066A, 0x066D }, { 0x06D4, 0x06D4 },
		{ 0x0964, 0x0965 }, { 0x0E4F, 0x0E4F }, { 0x0E5A, 0x0E5B }, { 0x10FB, 0x10FB },
		{ 0x2010, 0x2027 }, { 0x2030, 0x205E }, { 0x207A, 0x207E }, { 0x208A, 0x208E },
		{ 0x20A0, 0x20C0 }, { 0x2100, 0x214F }, { 0x2190, 0x23FF }, { 0x2500, 0x27FF },
		{ 0x2900, 0x2BFF }, { 0x2E00, 0x2E5D }, { 0x3001, 0x3003 }, { 0x3008, 0x3011 },
		{ 0x3014, 0x301F }, { 0xFE10, 0xFE19 }, { 0xFE30, 0xFE52 }, { 0xFE54, 0xFE66 },
		{ 0xFF01, 0xFF0F }, { 0xFF1A, 0xFF20 }, { 0xFF3B, 0xFF40 }, { 0xFF5B, 0xFF65 },
	};
	return std::any_of(std::begin(ranges), std::end(ranges), [cp](const Range& r) {
		return cp >= r.lo and cp <= r.hi;
	});
}

bool mdbm_impl::isBlank(std::string_view s) noexcept {
	return std::all_of(s.begin(), s.end(), [](char c) { return c == ' ' or c == '\t' or isLineEnding(c); });
}

auto mdbm_impl::trimSpaces(std::string_view s) noexcept -> std::string_view {
	constexpr std::string_view ws = " \t\n\r";
	const size_t first = s.find_first_not_of(ws);
	if (first == std::string_view::npos) {
		return {};
	}
	const size_t last = s.find_last_not_of(ws);
	return s.substr(first, last - first + 1);
}

auto mdbm_impl::trimTrailingSpaces(std::string_view s) noexcept -> std::string_view {
	const size_t last = s.find_last_not_of(" \t");
	return last == std::string_view::npos ? std::string_view{} : s.substr(0, last + 1);
}

namespace {
	char32_t foldCodePoint(const char32_t cp) noexcept {
		if (cp >= U'A' and cp <= U'Z') {
			return cp + 32;
		}
		if (cp < 0xC0) {
			return cp;
		}
		if (cp <= 0xDE and cp != 0xD7) {
			return cp + 32;
		}
		if (cp >= 0x0100 and cp <= 0x0137) {
			return cp | 1;
		}
		if ((cp >= 0x0139 and cp <= 0x0148) or (cp >= 0x0179 and cp <= 0x017E)) {
			return (cp & 1) ? cp + 1 : cp;
		}
		if (cp >= 0x014A and cp <= 0x0177) {
			return cp | 1;
		}
		if (cp == 0x0178) {
			return 0x00FF;
		}
		if (cp >= 0x0391 and cp <= 0x03A9 and cp != 0x03A2) {
			return cp + 32;
		}
		if (cp == 0x03C2) {
			return 0x03C3;
		}
		if (cp >= 0x0410 and cp <= 0x042F) {
			return cp + 32;
		}
		if (cp >= 0x0400 and cp <= 0x040F) {
			return cp + 80;
		}
		return cp;
	}
}

auto mdbm_impl::caseFold(std::string_view s) -> std::string {
	std::string folded;
	folded.reserve(s.size());
	for (size_t pos = 0; pos < s.size();) {
		const CodePoint cp = decodeUtf8(s, pos);
		if (cp.value == 0x00DF or cp.value == 0x1E9E) {
			folded.append("ss");
		}
		else if (cp.value == REPLACEMENT_CHARACTER and cp.width == 1) {
			folded.push_back(s[pos]);
		}
		else {
			encodeUtf8(foldCodePoint(cp.value), folded);
		}
		pos += cp.width;
	}
	return folded;
}

namespace {
	char asciiLower(const char c) noexcept {
		return (c >= 'A' and c <= 'Z') ? static_cast<char>(c + 32) : c;
	}
}

bool mdbm_impl::equalsCaseInsensitive(std::string_view a, std::string_view b) noexcept {
	return a.size() == b.size() and std::equal(a.begin(), a.end(), b.begin(), [](char l, char r) {
		return asciiLower(l) == asciiLower(r);
	});
}

bool mdbm_impl::containsCaseInsensitive(std::string_view haystack, std::string_view needle) noexcept {
	if (needle.size() > haystack.size()) {
		return false;
	}
	for (size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
		if (equalsCaseInsensitive(haystack.substr(i, needle.size()), needle)) {
			return true;
		}
	}
	return false;
}
