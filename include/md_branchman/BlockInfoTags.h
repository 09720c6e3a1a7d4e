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

#ifndef BLOCK_INFO_TAGS_H
#define BLOCK_INFO_TAGS_H
#include <cstddef>
#include <cstdint>
#include <string>
#include <optional>

struct ListItemInfo {
	char       preIndent;
	char           sizeW;
	char      postIndent;
};

struct ListInfo {
	enum class symbol_e : uint8_t {
		dash = '-',
		plus = '+',
		star = '*',
		dot = '.',
		paranth = ')'
	};
	inline bool isOrdered() const noexcept {
		return symbolUsed == symbol_e::dot or symbolUsed == symbol_e::paranth;
	}
	symbol_e  symbolUsed;
	int32_t orderedStart;
	bool isTight;
};

struct FencedCode {
	enum class symbol_e : char {
		Tilde = '~', BackTick = '`'
	};
	int32_t           length;
	symbol_e            type;
	int8_t            indent;
	std::string      infoStr;
	bool              closed;
};

struct Heading {
	char lvl;
};

struct HtmlBlock {
	uint8_t rule;
};

// label is normalized; the owning node keeps the source text in literal
struct LinkRefDef {
	std::string label;
	std::string destination;
	std::optional<std::string> title;
};

struct LinkInfo {
	enum class form_e : uint8_t {
		Inline, Full, Collapsed, Shortcut
	};
	form_e                       form;
	std::string           destination;
	std::optional<std::string>  title;
	// everything after the closing bracket, e.g. `(/url "t")` or `[ref]`
	std::string               rawTail;
};

struct Autolink {
	std::string destination;
	bool            isEmail;
};

struct CharRef {
	std::string decoded;
};

struct CodeSpan {
	uint32_t fenceLength;
	std::string      raw;
};

struct EmphasisInfo {
	char delim;
};

struct LineBreak {
	enum class kind_e : uint8_t {
		Backslash, Spaces
	};
	kind_e kind;
	uint32_t trailingSpaces;
};

#endif
