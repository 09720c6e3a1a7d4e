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
#include <limits>
#include <algorithm>
#include "MDBranchImpl.h"
#include "TextUtil.h"

#include "tao/pegtl.hpp"

namespace mdbm_impl {
	using md_branchman::UInt;
	using md_branchman::Int;
}

namespace {
	struct ThematicBreakState {
		char symbol;
		md_branchman::UInt count;
	};
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct whitespace0 : one<' ', '\t'> {};
	struct thematic_break_symbol : one<'-', '_', '*'> {};

	// The remainder of the line may only hold the opening symbol and blanks.
	template<md_branchman::UInt N>
	struct thematic_break_run {
		using rule_t = thematic_break_run;
		using subs_t = TAO_PEGTL_NAMESPACE::empty_list;

		template < TAO_PEGTL_NAMESPACE::apply_mode A,
			TAO_PEGTL_NAMESPACE::rewind_mode M,
			template< typename... > class Action,
			template< typename... > class Control,
			typename ParseInput,
			typename... States >
		static bool match(ParseInput& in, ThematicBreakState& s, States&&...) {
			size_t i = 0;
			md_branchman::UInt count = s.count;
			for (; i < in.size(); ++i) {
				const char c = in.peek_char(i);
				if (c == s.symbol) {
					++count;
				}
				else if (c != ' ' and c != '\t') {
					return false;
				}
			}
			if (count < N) {
				return false;
			}
			in.bump(i);
			s.count = count;
			return true;
		}
	};
	struct thematic_break_rule : seq<thematic_break_symbol, thematic_break_run<3>, eolf> {};

	template <typename Rule>
	struct thematic_break_action : nothing<Rule> {};
	template <>
	struct thematic_break_action<thematic_break_symbol> : require_apply {
		template<typename ActionInput>
		static void apply(const ActionInput& in, ThematicBreakState& s) noexcept {
			s.symbol = in.peek_char();
			s.count = 1;
		}
	};
}

bool mdbm_impl::tryThematicBreak(line_input& input) noexcept {
	ThematicBreakState state{ 0, 0 };
	return mdlang::parse<mdlang::thematic_break_rule, mdlang::thematic_break_action>(input, state);
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct atx_grammar_prefix : rep_min_max<1, 6, one<'#'>> {};
	struct atx_line : seq< atx_grammar_prefix, sor<whitespace0, eolf> > {};

	template <typename Rule>
	struct atx_header_action : nothing<Rule> {};

	template <>
	struct atx_header_action<atx_grammar_prefix> : require_apply {
		template <typename ActionInput>
		static void apply(const ActionInput& in, md_branchman::UInt& lvl) noexcept {
			lvl = static_cast<md_branchman::UInt>(in.size());
		}
	};
}

auto mdbm_impl::tryATXHeading(line_input& input) noexcept -> Heading {
	UInt level = 0;
	if (not mdlang::parse<mdlang::atx_line, mdlang::atx_header_action>(input, level)) {
		level = 0;
	}
	return { static_cast<decltype(Heading::lvl)>(level) };
}

auto mdbm_impl::atxHeadingContent(std::string_view afterMarker) noexcept -> std::string_view {
	std::string_view s = trimSpaces(afterMarker);
	if (s.find_first_not_of('#') == std::string_view::npos) {
		return {};
	}
	const size_t pos = s.find_last_not_of('#');
	if (pos + 1 < s.size() and isSpaceOrTab(s[pos])) {
		s = trimTrailingSpaces(s.substr(0, pos));
	}
	return s;
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;
	struct setext_lvl_1_marker : plus<one<'='>> {};
	struct setext_lvl_2_marker : plus<one<'-'>> {};
	struct setext_rule : seq<sor<setext_lvl_1_marker, setext_lvl_2_marker>, star<whitespace0>, eolf> {};

	template<typename Rule>
	struct setext_action : nothing<Rule> {};

	template<>
	struct setext_action<setext_lvl_1_marker> : require_apply {
		template <typename ActionInput>
		static void apply(const ActionInput&, char& lvl) noexcept {
			lvl = 1;
		}
	};
	template<>
	struct setext_action<setext_lvl_2_marker> : require_apply {
		template <typename ActionInput>
		static void apply(const ActionInput&, char& lvl) noexcept {
			lvl = 2;
		}
	};
}

char mdbm_impl::trySetextHeading(line_input& input) noexcept {
	char res{};
	if (not mdlang::parse<mdlang::setext_rule, mdlang::setext_action>(input, res)) {
		return 0;
	}
	return res;
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct backtick_run : rep_min<mdbm_impl::MIN_FENCE_SIZE, one<'`'>> {};
	struct tilde_run : rep_min<mdbm_impl::MIN_FENCE_SIZE, one<'~'>> {};
	// backtick fences may not carry a backtick in their info string
	struct backtick_info : star<not_one<'`'>> {};
	struct tilde_info : star<any> {};
	struct fence_opener : sor<seq<backtick_run, backtick_info, eolf>, seq<tilde_run, tilde_info, eolf>> {};

	template<typename Rule>
	struct fence_action : nothing<Rule> {};

	template<>
	struct fence_action<backtick_run> : require_apply {
		template<typename ActionInput>
		static void apply(const ActionInput& in, FencedCode& fence) {
			fence.type = FencedCode::symbol_e::BackTick;
			fence.length = static_cast<int32_t>(in.size());
		}
	};
	template<>
	struct fence_action<tilde_run> : require_apply {
		template<typename ActionInput>
		static void apply(const ActionInput& in, FencedCode& fence) {
			fence.type = FencedCode::symbol_e::Tilde;
			fence.length = static_cast<int32_t>(in.size());
		}
	};
	template<>
	struct fence_action<backtick_info> : require_apply {
		template<typename ActionInput>
		static void apply(const ActionInput& in, FencedCode& fence) {
			fence.infoStr = std::string{ mdbm_impl::trimSpaces(in.string_view()) };
		}
	};
	template<>
	struct fence_action<tilde_info> : require_apply {
		template<typename ActionInput>
		static void apply(const ActionInput& in, FencedCode& fence) {
			fence.infoStr = std::string{ mdbm_impl::trimSpaces(in.string_view()) };
		}
	};

	template<char C>
	struct fence_closer : seq<rep_min<mdbm_impl::MIN_FENCE_SIZE, one<C>>, star<whitespace0>, eolf> {};
}

auto mdbm_impl::tryFencedCodeOpener(line_input& input) -> FencedCode {
	FencedCode fence{ 0, FencedCode::symbol_e::BackTick, 0, {}, false };
	if (not mdlang::parse<mdlang::fence_opener, mdlang::fence_action>(input, fence)) {
		fence.length = 0;
		fence.infoStr.clear();
	}
	return fence;
}

bool mdbm_impl::tryFencedCodeCloser(line_input& input, const FencedCode& opener) noexcept {
	const char* start = input.current();
	bool matched = false;
	if (opener.type == FencedCode::symbol_e::BackTick) {
		matched = mdlang::parse<mdlang::fence_closer<'`'>>(input);
	}
	else {
		matched = mdlang::parse<mdlang::fence_closer<'~'>>(input);
	}
	if (not matched) {
		return false;
	}
	const auto len = std::find_if(start, input.current(), [](char c) { return c != '`' and c != '~'; }) - start;
	return len >= opener.length;
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;
	struct block_quote_marker : one<'>'> {};
}

bool mdbm_impl::tryBlockQuote(line_input& input) noexcept {
	return mdlang::parse<mdlang::block_quote_marker>(input);
}
