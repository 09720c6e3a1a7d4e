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

#include <tao/pegtl.hpp>
#include "InlineGrammar.h"
#include "HtmlGrammar.h"
#include "TextUtil.h"

namespace md = md_branchman;

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct uri_scheme : seq<alpha, rep_min_max<1, 31, sor<alnum, one<'+', '.', '-'>>>> {};
	struct uri_forbidden : sor<range<'\0', ' '>, one<'<', '>', '\x7f'>> {};
	struct uri_body : star<not_at<uri_forbidden>, any> {};
	struct uri_autolink : seq<one<'<'>, uri_scheme, one<':'>, uri_body, one<'>'>> {};

	struct email_local : plus<sor<alnum, one<'.', '!', '#', '$', '%', '&', '\'', '*', '+', '/', '=', '?', '^', '_', '`', '{', '|', '}', '~', '-'>>> {};

	// up to 63 letters, digits or hyphens, neither first nor last a hyphen
	struct email_label {
		using rule_t = email_label;
		using subs_t = TAO_PEGTL_NAMESPACE::empty_list;

		template < TAO_PEGTL_NAMESPACE::apply_mode A,
			TAO_PEGTL_NAMESPACE::rewind_mode M,
			template< typename... > class Action,
			template< typename... > class Control,
			typename ParseInput,
			typename... States >
		static bool match(ParseInput& in, States&&...) {
			size_t i = 0;
			for (; i < in.size(); ++i) {
				const char c = in.peek_char(i);
				const bool an = (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or (c >= '0' and c <= '9');
				if (not an and c != '-') {
					break;
				}
			}
			if (i == 0 or i > 63 or in.peek_char(0) == '-' or in.peek_char(i - 1) == '-') {
				return false;
			}
			in.bump(i);
			return true;
		}
	};
	struct email_autolink : seq<one<'<'>, email_local, one<'@'>, list<email_label, one<'.'>>, one<'>'>> {};

	struct entity_name : rep_min_max<1, 32, alnum> {};
	struct named_entity : seq<one<'&'>, entity_name, one<';'>> {};
	struct decimal_digits : rep_min_max<1, 7, digit> {};
	struct hex_digits : rep_min_max<1, 6, xdigit> {};
	struct numeric_entity : seq<TAO_PEGTL_STRING("&#"), sor<seq<one<'x', 'X'>, hex_digits>, decimal_digits>, one<';'>> {};

	struct EntityState {
		std::string_view name;
		char32_t codePoint;
	};

	template<typename Rule>
	struct entity_action : nothing<Rule> {};

	template<>
	struct entity_action<entity_name> : require_apply {
		template<typename ActionInput>
		static void apply(const ActionInput& in, EntityState& s) noexcept {
			s.name = in.string_view();
		}
	};
	template<>
	struct entity_action<decimal_digits> : require_apply {
		template<typename ActionInput>
		static void apply(const ActionInput& in, EntityState& s) noexcept {
			char32_t cp = 0;
			for (const char c : in.string_view()) {
				cp = cp * 10 + static_cast<char32_t>(c - '0');
			}
			s.codePoint = cp;
		}
	};
	template<>
	struct entity_action<hex_digits> : require_apply {
		template<typename ActionInput>
		static void apply(const ActionInput& in, EntityState& s) noexcept {
			char32_t cp = 0;
			for (const char c : in.string_view()) {
				const char32_t digit = c <= '9' ? c - '0' : (c | 0x20) - 'a' + 10;
				cp = cp * 16 + digit;
			}
			s.codePoint = cp;
		}
	};
}

namespace {
	template<typename Rule, template<typename...> class Action = TAO_PEGTL_NAMESPACE::nothing, typename... States>
	auto matchedLength(std::string_view s, States&... st) -> size_t {
		TAO_PEGTL_NAMESPACE::memory_input<> in{ s.data(), s.data() + s.size(), "inline" };
		if (not TAO_PEGTL_NAMESPACE::parse<Rule, Action>(in, st...)) {
			return 0;
		}
		return static_cast<size_t>(in.current() - s.data());
	}
}

auto mdbm_impl::matchRawHtml(std::string_view s) noexcept -> size_t {
	return matchedLength<mdlang::raw_html>(s);
}

auto mdbm_impl::matchAutolink(std::string_view s) noexcept -> std::optional<AutolinkMatch> {
	if (const size_t len = matchedLength<mdlang::uri_autolink>(s)) {
		return AutolinkMatch{ len, false };
	}
	if (const size_t len = matchedLength<mdlang::email_autolink>(s)) {
		return AutolinkMatch{ len, true };
	}
	return std::nullopt;
}

auto mdbm_impl::matchEntity(std::string_view s, const md::EntityTable& entities) -> std::optional<EntityMatch> {
	mdlang::EntityState state{ {}, 0 };
	if (const size_t len = matchedLength<mdlang::numeric_entity, mdlang::entity_action>(s, state)) {
		char32_t cp = state.codePoint;
		if (cp == 0 or cp > 0x10FFFF or (cp >= 0xD800 and cp <= 0xDFFF)) {
			cp = REPLACEMENT_CHARACTER;
		}
		EntityMatch m{ len, {}, true };
		encodeUtf8(cp, m.decoded);
		return m;
	}
	if (const size_t len = matchedLength<mdlang::named_entity, mdlang::entity_action>(s, state)) {
		if (const auto text = entities.lookup(state.name)) {
			return EntityMatch{ len, std::string{ *text }, false };
		}
	}
	return std::nullopt;
}
