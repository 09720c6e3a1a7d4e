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
#include "BlockContext.h"
#include "BranchSet.h"
#include "TextUtil.h"

namespace md = md_branchman;
using md::UInt;
using md::impl::Context;
using md::impl::LineState;
using type_e = MDBMNode::type_e;

namespace {
	/**
	Names the construct that ends the open paragraph on this line, or returns
	an empty view when the line may only continue it. Indented code never
	interrupts a paragraph and rule 7 HTML is not considered.
	*/
	auto interruptReason(const Context& ctx, const LineState& ls, const size_t containerIdx, const bool allMatched)
		-> std::string_view
	{
		if (ls.blank) {
			return "blank line";
		}
		if (ls.indented()) {
			return {};
		}
		const std::string_view rest = ls.rest();
		if (allMatched) {
			mdbm_impl::line_input in{ rest.data(), rest.data() + rest.size(), "setext" };
			if (mdbm_impl::trySetextHeading(in) != 0 and mdbm_impl::paragraphHasContent(ctx, ctx.tip().content)) {
				return "setext underline";
			}
		}
		{
			mdbm_impl::line_input in{ rest.data(), rest.data() + rest.size(), "thematic" };
			if (mdbm_impl::tryThematicBreak(in)) {
				return "thematic break";
			}
		}
		{
			mdbm_impl::line_input in{ rest.data(), rest.data() + rest.size(), "atx" };
			if (mdbm_impl::tryATXHeading(in).lvl != 0) {
				return "atx heading";
			}
		}
		{
			mdbm_impl::line_input in{ rest.data(), rest.data() + rest.size(), "fence" };
			if (mdbm_impl::tryFencedCodeOpener(in).length != 0) {
				return "code fence";
			}
		}
		if (mdbm_impl::containerDepth(ctx, containerIdx) < ctx.opts.maxNestingDepth) {
			if (rest.front() == '>') {
				return "block quote";
			}
			LineState trial = ls;
			if (mdbm_impl::parseListMarker(trial, allMatched)) {
				return "list item";
			}
		}
		{
			mdbm_impl::line_input in{ rest.data(), rest.data() + rest.size(), "html" };
			if (mdbm_impl::tryHtmlBlockStart(in, false) != 0) {
				return "html block";
			}
		}
		return {};
	}
}

auto mdbm_impl::resolveParagraphNewline(const Context& ctx, const LineState& ls,
	const size_t containerIdx, const bool allMatched) -> continuation_e
{
	BranchSet<continuation_e> branches{ "paragraph-newline", ls.number, ctx.trace() };
	auto& continuation = branches.fork(continuation_e::Continuation, 0, "continuation-assumed");
	auto& close = branches.fork(continuation_e::Close, 0, "close-assumed");

	const std::string_view reason = interruptReason(ctx, ls, containerIdx, allMatched);
	if (not reason.empty()) {
		branches.kill(continuation, reason);
	}

	const auto& container = ctx.stack[containerIdx];
	const bool containerIsParagraph = container.node->flavor == type_e::Paragraph;
	const OpenerContext octx{
		containerIsParagraph,
		true,
		containerIsParagraph ? &container : nullptr,
		containerDepth(ctx, containerIdx)
	};
	LineState trial = ls;
	if (detectOpener(ctx, trial, octx).kind == opener_e::None) {
		branches.kill(close, "no interrupting opener");
	}

	return branches.mergeExactlyOne().state;
}

bool mdbm_impl::paragraphHasContent(const Context& ctx, std::string_view content) {
	size_t pos = 0;
	while (pos < content.size()) {
		const auto def = parseReferenceDefinition(content.substr(pos), ctx.opts, ctx.entities());
		if (not def) {
			break;
		}
		pos += def->consumed;
	}
	return not isBlank(content.substr(pos));
}

auto mdbm_impl::extractReferenceDefinitions(Context& ctx, MDBMNode& parent, MDBMNode& paragraph, std::string_view content)
	-> std::string
{
	auto where = parent.children.begin();
	while (where != parent.children.end() and &*where != &paragraph) {
		++where;
	}
	if (where == parent.children.end()) {
		throw md::GrammarInvariantError("reference-definition", paragraph.lineBegin, "paragraph is not a child of its container");
	}

	size_t pos = 0;
	while (pos < content.size()) {
		auto def = parseReferenceDefinition(content.substr(pos), ctx.opts, ctx.entities());
		if (not def) {
			break;
		}
		std::string_view raw = content.substr(pos, def->consumed);
		if (not raw.empty() and raw.back() == '\n') {
			raw.remove_suffix(1);
		}
		const UInt lines = 1 + static_cast<UInt>(std::count(raw.begin(), raw.end(), '\n'));

		MDBMNode node{ type_e::LinkRefDef, false, paragraph.lineBegin, paragraph.lineBegin + lines - 1 };
		node.literal = std::string{ raw };
		node.crtrstc = std::move(def->definition);
		parent.children.insert(where, std::move(node));

		paragraph.lineBegin += lines;
		pos += def->consumed;
	}
	return std::string{ content.substr(pos) };
}
