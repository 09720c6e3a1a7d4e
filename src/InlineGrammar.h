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

#ifndef MD_INLINE_GRAMMAR_H
#define MD_INLINE_GRAMMAR_H
#include <string>
#include <string_view>
#include <optional>
#include "md_branchman/ParserOptions.h"

namespace mdbm_impl {
	// Each matcher expects the subject to start at the construct's first character.

	// length of the raw HTML tag, 0 when there is none
	auto matchRawHtml(std::string_view s) noexcept -> size_t;

	struct AutolinkMatch {
		size_t length;
		bool isEmail;
	};
	auto matchAutolink(std::string_view s) noexcept -> std::optional<AutolinkMatch>;

	struct EntityMatch {
		size_t length;
		std::string decoded;
		bool numeric;
	};
	auto matchEntity(std::string_view s, const md_branchman::EntityTable& entities) -> std::optional<EntityMatch>;
}

#endif
