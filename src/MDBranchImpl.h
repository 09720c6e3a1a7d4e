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

#ifndef MD_BRANCH_IMPL_H
#define MD_BRANCH_IMPL_H
#include <string>
#include <string_view>
#include <optional>
#include <tao/pegtl/memory_input.hpp>
#include "md_branchman/BlockInfoTags.h"
#include "md_branchman/IntegralTypes.h"

namespace mdbm_impl {
	namespace peggi = TAO_PEGTL_NAMESPACE;
	using line_input = peggi::memory_input<peggi::tracking_mode::eager>;

	constexpr md_branchman::UInt TAB_STOP = 4;
	constexpr md_branchman::UInt CODE_INDENT = 4;
	constexpr md_branchman::Int MIN_FENCE_SIZE = 3;

	// All try* functions expect the input to start at the first non-space
	// character of the line; on success the input is left past the marker.
	bool tryThematicBreak(line_input& input) noexcept;

	// lvl == 0 when the line is no ATX heading
	auto tryATXHeading(line_input& input) noexcept -> Heading;
	auto atxHeadingContent(std::string_view afterMarker) noexcept -> std::string_view;

	char trySetextHeading(line_input& input) noexcept;

	// length == 0 when the line opens no fence
	auto tryFencedCodeOpener(line_input& input) -> FencedCode;
	bool tryFencedCodeCloser(line_input& input, const FencedCode& opener) noexcept;

	bool tryBlockQuote(line_input& input) noexcept;

	struct ListMarker {
		ListInfo::symbol_e symbol;
		md_branchman::Int start;
		md_branchman::UInt width;
	};
	auto tryListMarker(line_input& input) noexcept -> std::optional<ListMarker>;

	// 0 when no start condition applies, otherwise the rule number 1-7
	auto tryHtmlBlockStart(line_input& input, const bool allowRule7) noexcept -> uint8_t;
	bool htmlBlockEndsOn(const uint8_t rule, std::string_view line) noexcept;
}
#endif
