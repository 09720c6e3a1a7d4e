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

#include <iterator>
#include <algorithm>
#include <string>
#include <string_view>
#include "MDBranchImpl.h"
#include "HtmlGrammar.h"
#include "TextUtil.h"

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	// sorted; compared case-insensitively
	constexpr std::string_view blockTagNames[] = {
		"address", "article", "aside", "base", "basefont", "blockquote", "body",
		"caption", "center", "col", "colgroup", "dd", "details", "dialog", "dir",
		"div", "dl", "dt", "fieldset", "figcaption", "figure", "footer", "form",
		"frame", "frameset", "h1", "h2", "h3", "h4", "h5", "h6", "head", "header",
		"hr", "html", "iframe", "legend", "li", "link", "main", "menu", "menuitem",
		"nav", "noframes", "ol", "optgroup", "option", "p", "param", "search", "section",
		"source", "summary", "table", "tbody", "td", "tfoot", "th", "thead", "title", "tr",
		"track", "ul"
	};

	struct block_tag_name {
		using rule_t = block_tag_name;
		using subs_t = TAO_PEGTL_NAMESPACE::empty_list;

		template < TAO_PEGTL_NAMESPACE::apply_mode A,
			TAO_PEGTL_NAMESPACE::rewind_mode M,
			template< typename... > class Action,
			template< typename... > class Control,
			typename ParseInput,
			typename... States >
		static bool match(ParseInput& in, States&&...) {
			std::string name;
			for (size_t i = 0; i < in.size(); ++i) {
				const char c = in.peek_char(i);
				if ((c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or (c >= '0' and c <= '9')) {
					name.push_back(static_cast<char>(c | 0x20));
				}
				else {
					break;
				}
			}
			if (not std::binary_search(std::begin(blockTagNames), std::end(blockTagNames), std::string_view{ name })) {
				return false;
			}
			in.bump(name.size());
			return true;
		}
	};

	struct raw_text_tag : sor<TAO_PEGTL_ISTRING("script"), TAO_PEGTL_ISTRING("pre"),
		TAO_PEGTL_ISTRING("style"), TAO_PEGTL_ISTRING("textarea")> {};

	struct html_start_1 : seq<one<'<'>, raw_text_tag, sor<one<' ', '\t', '>'>, eolf>> {};
	struct html_start_2 : comment_open {};
	struct html_start_3 : TAO_PEGTL_STRING("<?") {};
	struct html_start_4 : seq<TAO_PEGTL_STRING("<!"), alpha> {};
	struct html_start_5 : cdata_open {};
	struct html_start_6 : seq<one<'<'>, opt<one<'/'>>, block_tag_name, sor<one<' ', '\t', '>'>, TAO_PEGTL_STRING("/>"), eolf>> {};
	struct html_start_7 : seq<sor<open_tag, closing_tag>, star<one<' ', '\t'>>, eolf> {};

	template<typename Rule>
	struct html_tag_action : nothing<Rule> {};

	template<>
	struct html_tag_action<tag_name> : require_apply {
		template<typename ActionInput>
		static void apply(const ActionInput& in, std::string& name) {
			name = in.string();
		}
	};
}

auto mdbm_impl::tryHtmlBlockStart(line_input& input, const bool allowRule7) noexcept -> uint8_t {
	if (input.empty() or input.peek_char() != '<') {
		return 0;
	}
	if (mdlang::parse<mdlang::html_start_1>(input)) {
		return 1;
	}
	if (mdlang::parse<mdlang::html_start_2>(input)) {
		return 2;
	}
	if (mdlang::parse<mdlang::html_start_3>(input)) {
		return 3;
	}
	if (mdlang::parse<mdlang::html_start_4>(input)) {
		return 4;
	}
	if (mdlang::parse<mdlang::html_start_5>(input)) {
		return 5;
	}
	if (mdlang::parse<mdlang::html_start_6>(input)) {
		return 6;
	}
	if (not allowRule7) {
		return 0;
	}
	std::string name;
	if (not mdlang::parse<mdlang::html_start_7, mdlang::html_tag_action>(input, name)) {
		return 0;
	}
	for (std::string_view raw : { "script", "style", "pre", "textarea" }) {
		if (equalsCaseInsensitive(name, raw)) {
			return 0;
		}
	}
	return 7;
}

bool mdbm_impl::htmlBlockEndsOn(const uint8_t rule, std::string_view line) noexcept {
	switch (rule) {
	case 1:
		return containsCaseInsensitive(line, "</script>") or containsCaseInsensitive(line, "</pre>")
			or containsCaseInsensitive(line, "</style>") or containsCaseInsensitive(line, "</textarea>");
	case 2:
		return line.find("-->") != std::string_view::npos;
	case 3:
		return line.find("?>") != std::string_view::npos;
	case 4:
		return line.find('>') != std::string_view::npos;
	case 5:
		return line.find("]]>") != std::string_view::npos;
	default:
		return false;
	}
}
