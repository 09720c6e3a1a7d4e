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
#include <tao/pegtl.hpp>
#include "BlockContext.h"
#include "TextUtil.h"

namespace md = md_branchman;
using md::UInt;
using md::impl::LineState;
using type_e = MDBMNode::type_e;

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct bullet_marker : one<'-', '+', '*'> {};
	struct ordinal : rep_min_max<1, 9, digit> {};
	struct ordinal_delim : one<'.', ')'> {};
	struct list_marker : sor<bullet_marker, seq<ordinal, ordinal_delim>> {};

	template<typename Rule>
	struct list_marker_action : nothing<Rule> {};

	template<>
	struct list_marker_action<bullet_marker> : require_apply {
		template<typename ActionInput>
		static void apply(const ActionInput& in, mdbm_impl::ListMarker& marker) noexcept {
			marker.symbol = static_cast<ListInfo::symbol_e>(in.peek_char());
			marker.start = 0;
			marker.width = 1;
		}
	};
	template<>
	struct list_marker_action<ordinal> : require_apply {
		template<typename ActionInput>
		static void apply(const ActionInput& in, mdbm_impl::ListMarker& marker) noexcept {
			md::Int start = 0;
			for (const char c : in.string_view()) {
				start = start * 10 + (c - '0');
			}
			marker.start = start;
			marker.width = static_cast<UInt>(in.size()) + 1;
		}
	};
	template<>
	struct list_marker_action<ordinal_delim> : require_apply {
		template<typename ActionInput>
		static void apply(const ActionInput& in, mdbm_impl::ListMarker& marker) noexcept {
			marker.symbol = static_cast<ListInfo::symbol_e>(in.peek_char());
		}
	};
}

auto mdbm_impl::tryListMarker(line_input& input) noexcept -> std::optional<ListMarker> {
	ListMarker marker{};
	if (not mdlang::parse<mdlang::list_marker, mdlang::list_marker_action>(input, marker)) {
		return std::nullopt;
	}
	return marker;
}

auto mdbm_impl::parseListMarker(LineState& ls, const bool interruptsParagraph) noexcept -> std::optional<ListItemStart> {
	if (ls.indented()) {
		return std::nullopt;
	}
	const std::string_view rest = ls.rest();
	line_input in{ rest.data(), rest.data() + rest.size(), "list" };
	const auto marker = tryListMarker(in);
	if (not marker) {
		return std::nullopt;
	}
	const std::string_view afterMarker = rest.substr(marker->width);
	if (not afterMarker.empty() and not isSpaceOrTab(afterMarker.front())) {
		return std::nullopt;
	}
	const bool ordered = marker->symbol == ListInfo::symbol_e::dot or marker->symbol == ListInfo::symbol_e::paranth;
	if (interruptsParagraph and (isBlank(afterMarker) or (ordered and marker->start != 1))) {
		return std::nullopt;
	}

	const UInt markerOffset = ls.indent;
	ls.advanceNextNonspace();
	ls.advanceOffset(marker->width, true);
	const UInt spacesStartCol = ls.column;
	const size_t spacesStartOffset = ls.offset;
	do {
		ls.advanceOffset(1, true);
	} while (ls.column - spacesStartCol < 5 and isSpaceOrTab(ls.peek(ls.offset)));

	const bool blankItem = ls.offset >= ls.line.size();
	const UInt spacesAfterMarker = ls.column - spacesStartCol;
	UInt padding = marker->width + spacesAfterMarker;
	// five or more spaces start indented code inside the item
	if (spacesAfterMarker >= 5 or spacesAfterMarker < 1 or blankItem) {
		padding = marker->width + 1;
		ls.column = spacesStartCol;
		ls.offset = spacesStartOffset;
		ls.partiallyConsumedTab = false;
		if (isSpaceOrTab(ls.peek(ls.offset))) {
			ls.advanceOffset(1, true);
		}
	}

	ListItemStart start{};
	start.list.symbolUsed = marker->symbol;
	start.list.orderedStart = ordered ? marker->start : 0;
	start.list.isTight = true;
	start.item.preIndent = static_cast<char>(markerOffset);
	start.item.sizeW = static_cast<char>(marker->width);
	start.item.postIndent = static_cast<char>(padding - marker->width);
	start.blankItem = blankItem;
	return start;
}

bool mdbm_impl::listsMatch(const ListInfo& a, const ListInfo& b) noexcept {
	return a.symbolUsed == b.symbolUsed;
}

bool mdbm_impl::matchListItem(LineState& ls, const MDBMNode& item) noexcept {
	const auto& info = std::get<ListItemInfo>(item.crtrstc);
	if (ls.blank) {
		// an item holding nothing yet closes on its second blank line
		if (item.children.empty()) {
			return false;
		}
		ls.advanceNextNonspace();
		return true;
	}
	const UInt need = static_cast<UInt>(info.preIndent + info.sizeW + info.postIndent);
	if (ls.indent >= need) {
		ls.advanceOffset(need, true);
		return true;
	}
	return false;
}

namespace {
	// Moves the blank lines ending `from` behind it into `to`.
	void hoistTrailingBlankLines(MDBMNode& to, MDBMNode& from) {
		auto first = from.children.end();
		while (first != from.children.begin() and std::prev(first)->flavor == type_e::BlankLine) {
			--first;
		}
		to.children.splice(to.children.end(), from.children, first, from.children.end());
		from.lineEnd = from.children.empty() ? from.lineBegin : from.children.back().lineEnd;
	}
}

void mdbm_impl::finalizeListItem(MDBMNode& list, MDBMNode& item) {
	if (&list.children.back() != &item) {
		throw md::GrammarInvariantError("list-item", item.lineBegin, "closing item is not the last child of its list");
	}
	hoistTrailingBlankLines(list, item);
}

void mdbm_impl::finalizeList(MDBMNode& parent, MDBMNode& list) {
	hoistTrailingBlankLines(parent, list);

	bool tight = true;
	for (const auto& child : list.children) {
		if (child.flavor == type_e::BlankLine) {
			tight = false;
			break;
		}
		for (const auto& grandChild : child.children) {
			if (grandChild.flavor == type_e::BlankLine) {
				tight = false;
				break;
			}
		}
	}
	std::get<ListInfo>(list.crtrstc).isTight = tight;
}
