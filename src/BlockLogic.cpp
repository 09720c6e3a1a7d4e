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
#include <fmt/format.h>
#include "BlockContext.h"
#include "BranchSet.h"
#include "TextUtil.h"

namespace md = md_branchman;
using md::UInt;
using md::impl::Context;
using md::impl::LineState;
using md::impl::OpenBlock;
using type_e = MDBMNode::type_e;

void LineState::findNextNonspace() noexcept {
	size_t i = offset;
	UInt cols = column;
	while (i < line.size()) {
		const char c = line[i];
		if (c == ' ') {
			++i;
			++cols;
		}
		else if (c == '\t') {
			++i;
			cols += mdbm_impl::TAB_STOP - (cols % mdbm_impl::TAB_STOP);
		}
		else {
			break;
		}
	}
	blank = i >= line.size();
	nextNonspace = i;
	nextNonspaceColumn = cols;
	indent = cols - column;
}

void LineState::advanceOffset(UInt count, const bool columns) noexcept {
	while (count > 0 and offset < line.size()) {
		if (line[offset] == '\t') {
			const UInt charsToTab = mdbm_impl::TAB_STOP - (column % mdbm_impl::TAB_STOP);
			if (columns) {
				partiallyConsumedTab = charsToTab > count;
				const UInt charsToAdvance = std::min(count, charsToTab);
				column += charsToAdvance;
				offset += partiallyConsumedTab ? 0 : 1;
				count -= charsToAdvance;
			}
			else {
				partiallyConsumedTab = false;
				column += charsToTab;
				++offset;
				--count;
			}
		}
		else {
			partiallyConsumedTab = false;
			++offset;
			++column;
			--count;
		}
	}
}

void LineState::advanceNextNonspace() noexcept {
	offset = nextNonspace;
	column = nextNonspaceColumn;
	partiallyConsumedTab = false;
}

namespace {
	enum class match_e : uint8_t {
		Matched, Failed, LineDone
	};

	bool canContain(const type_e parent, const type_e child) noexcept {
		switch (parent) {
		case type_e::Document:
		case type_e::Quote:
		case type_e::ListItem:
			return child != type_e::ListItem;
		case type_e::List:
			return child == type_e::ListItem;
		default:
			return false;
		}
	}

	bool acceptsLines(const OpenBlock& b) noexcept {
		switch (b.node->flavor) {
		case type_e::IndentedCode:
		case type_e::FencedCode:
		case type_e::HtmlBlock:
			return true;
		default:
			return false;
		}
	}

	auto continueBlock(OpenBlock& b, LineState& ls) noexcept -> match_e {
		MDBMNode& node = *b.node;
		switch (node.flavor) {
		case type_e::Document:
		case type_e::List:
			return match_e::Matched;
		case type_e::Quote:
		{
			if (ls.indented() or ls.blank) {
				return match_e::Failed;
			}
			const std::string_view rest = ls.rest();
			mdbm_impl::line_input in{ rest.data(), rest.data() + rest.size(), "quote" };
			if (not mdbm_impl::tryBlockQuote(in)) {
				return match_e::Failed;
			}
			ls.advanceNextNonspace();
			ls.advanceOffset(1, false);
			if (mdbm_impl::isSpaceOrTab(ls.peek(ls.offset))) {
				ls.advanceOffset(1, true);
			}
			return match_e::Matched;
		}
		case type_e::ListItem:
			return mdbm_impl::matchListItem(ls, node) ? match_e::Matched : match_e::Failed;
		case type_e::IndentedCode:
			if (ls.indented()) {
				ls.advanceOffset(mdbm_impl::CODE_INDENT, true);
				return match_e::Matched;
			}
			if (ls.blank) {
				ls.advanceNextNonspace();
				return match_e::Matched;
			}
			return match_e::Failed;
		case type_e::FencedCode:
		{
			const auto& fence = std::get<FencedCode>(node.crtrstc);
			if (not ls.indented() and ls.peek(ls.nextNonspace) == static_cast<char>(fence.type)) {
				const std::string_view rest = ls.rest();
				mdbm_impl::line_input in{ rest.data(), rest.data() + rest.size(), "fence" };
				if (mdbm_impl::tryFencedCodeCloser(in, fence)) {
					std::get<FencedCode>(node.crtrstc).closed = true;
					return match_e::LineDone;
				}
			}
			for (int i = fence.indent; i > 0 and mdbm_impl::isSpaceOrTab(ls.peek(ls.offset)); --i) {
				ls.advanceOffset(1, true);
			}
			return match_e::Matched;
		}
		case type_e::HtmlBlock:
			return (ls.blank and std::get<HtmlBlock>(node.crtrstc).rule >= 6) ? match_e::Failed : match_e::Matched;
		case type_e::Paragraph:
			return ls.blank ? match_e::Failed : match_e::Matched;
		default:
			return match_e::Failed;
		}
	}

	void addLine(OpenBlock& b, LineState& ls) {
		if (ls.partiallyConsumedTab) {
			++ls.offset;
			const UInt charsToTab = mdbm_impl::TAB_STOP - (ls.column % mdbm_impl::TAB_STOP);
			b.content.append(charsToTab, ' ');
		}
		b.content.append(ls.line.substr(std::min(ls.offset, ls.line.size())));
		b.content.push_back('\n');
	}

	void appendParagraphLine(OpenBlock& b, const LineState& ls) {
		std::string_view text = ls.line.substr(std::min(ls.offset, ls.line.size()));
		const size_t first = text.find_first_not_of(" \t");
		b.content.append(first == std::string_view::npos ? std::string_view{} : text.substr(first));
		b.content.push_back('\n');
	}

	void appendBlankLine(MDBMNode& container, const UInt line) {
		container.children.push_back(MDBMNode{ type_e::BlankLine, false, line, line });
	}

	void markLineEnd(Context& ctx) noexcept {
		for (auto& b : ctx.stack) {
			b.node->lineEnd = ctx.lineNumber;
		}
	}

	void finalizeIndentedCode(MDBMNode& parent, MDBMNode& code, std::string_view content) {
		std::vector<std::string_view> lines;
		for (size_t pos = 0; pos < content.size();) {
			const size_t nl = content.find('\n', pos);
			const size_t end = nl == std::string_view::npos ? content.size() : nl;
			lines.push_back(content.substr(pos, end - pos));
			pos = end + 1;
		}
		size_t keep = lines.size();
		while (keep > 0 and mdbm_impl::isBlank(lines[keep - 1])) {
			--keep;
		}
		code.literal.clear();
		for (size_t i = 0; i < keep; ++i) {
			code.literal.append(lines[i]);
			code.literal.push_back('\n');
		}
		code.lineEnd = code.lineBegin + static_cast<UInt>(keep) - 1;
		for (size_t i = keep; i < lines.size(); ++i) {
			appendBlankLine(parent, code.lineBegin + static_cast<UInt>(i));
		}
	}

	// Closes the innermost open block and turns its builder state into the node's final value.
	void closeTip(Context& ctx) {
		if (ctx.stack.size() < 2) {
			throw md::GrammarInvariantError("open-block-stack", ctx.lineNumber, "the document cannot be closed before finalization");
		}
		OpenBlock b = std::move(ctx.stack.back());
		ctx.stack.pop_back();
		MDBMNode& parent = *ctx.stack.back().node;
		MDBMNode& node = *b.node;
		node.isOpen = false;

		switch (node.flavor) {
		case type_e::Paragraph:
		{
			std::string rest = mdbm_impl::extractReferenceDefinitions(ctx, parent, node, b.content);
			const std::string_view text = mdbm_impl::trimTrailingSpaces(mdbm_impl::trimSpaces(rest));
			if (text.empty()) {
				parent.children.pop_back();
			}
			else {
				node.literal = std::string{ text };
			}
			break;
		}
		case type_e::IndentedCode:
			finalizeIndentedCode(parent, node, b.content);
			break;
		case type_e::FencedCode:
			node.literal = std::move(b.content);
			break;
		case type_e::HtmlBlock:
			if (not b.content.empty() and b.content.back() == '\n') {
				b.content.pop_back();
			}
			node.literal = std::move(b.content);
			break;
		case type_e::ListItem:
			mdbm_impl::finalizeListItem(parent, node);
			break;
		case type_e::List:
			mdbm_impl::finalizeList(parent, node);
			break;
		default:
			break;
		}
	}

	void closeBlocks(Context& ctx, const size_t keep) {
		while (ctx.stack.size() > keep) {
			closeTip(ctx);
		}
	}

	OpenBlock& addChild(Context& ctx, const type_e type, const UInt line) {
		while (not canContain(ctx.tip().node->flavor, type)) {
			if (ctx.stack.size() < 2) {
				throw md::GrammarInvariantError("open-block-stack", line,
					fmt::format("{} cannot hold {}", md::nodeTypeName(ctx.tip().node->flavor), md::nodeTypeName(type)));
			}
			closeTip(ctx);
		}
		MDBMNode& parent = *ctx.tip().node;
		parent.children.push_back(MDBMNode{ type, true, line, line });
		ctx.stack.push_back(OpenBlock{ &parent.children.back(), {} });
		return ctx.stack.back();
	}

	/**
	A line of only '=' or '-' under paragraph text may also read as a thematic
	break or a list item. Each reading is forked with its precedence and the
	live one with the highest priority is kept.
	*/
	auto resolveUnderline(const Context& ctx, LineState& ls, const mdbm_impl::OpenerContext& octx, const bool nestable)
		-> std::optional<mdbm_impl::OpenerProbe>
	{
		using mdbm_impl::opener_e;
		const std::string_view rest = ls.rest();
		mdbm_impl::line_input sin{ rest.data(), rest.data() + rest.size(), "setext" };
		const char level = mdbm_impl::trySetextHeading(sin);
		if (level == 0 or not octx.paragraph or not mdbm_impl::paragraphHasContent(ctx, octx.paragraph->content)) {
			return std::nullopt;
		}

		mdbm_impl::BranchSet<mdbm_impl::OpenerProbe> branches{ "setext-underline", ls.number, ctx.trace() };

		mdbm_impl::OpenerProbe setext{ opener_e::SetextHeading };
		setext.heading = Heading{ level };
		branches.fork(setext, 3, "setext heading");

		mdbm_impl::OpenerProbe thematic{ opener_e::ThematicBreak };
		thematic.text = mdbm_impl::trimSpaces(rest);
		auto& thematicBranch = branches.fork(thematic, 2, "thematic break");
		mdbm_impl::line_input tin{ rest.data(), rest.data() + rest.size(), "thematic" };
		if (not mdbm_impl::tryThematicBreak(tin)) {
			branches.kill(thematicBranch, "fewer than three markers");
		}

		LineState trial = ls;
		const auto item = nestable ? mdbm_impl::parseListMarker(trial, true) : std::nullopt;
		mdbm_impl::OpenerProbe listItem{ opener_e::ListItem };
		if (item) {
			listItem.listItem = *item;
		}
		auto& listBranch = branches.fork(listItem, 1, "list item");
		if (not item) {
			branches.kill(listBranch, "no marker that may interrupt a paragraph");
		}

		auto& winner = branches.mergeByPriority();
		if (winner.state.kind == opener_e::ListItem) {
			ls = trial;
		}
		return winner.state;
	}
}

auto mdbm_impl::containerDepth(const Context& ctx, const size_t containerIdx) noexcept -> UInt {
	UInt depth = 0;
	for (size_t i = 1; i <= containerIdx and i < ctx.stack.size(); ++i) {
		depth += ctx.stack[i].node->isContainer() ? 1 : 0;
	}
	return depth;
}

auto mdbm_impl::detectOpener(const Context& ctx, LineState& ls, const OpenerContext& octx) -> OpenerProbe {
	OpenerProbe probe{ opener_e::None };
	if (ls.blank) {
		probe.kind = opener_e::Blank;
		return probe;
	}
	if (ls.indented()) {
		if (not octx.tipIsParagraph) {
			ls.advanceOffset(CODE_INDENT, true);
			probe.kind = opener_e::IndentedCode;
		}
		return probe;
	}

	const std::string_view rest = ls.rest();
	const bool nestable = octx.depth < ctx.opts.maxNestingDepth;

	if (octx.containerIsParagraph) {
		if (auto underline = resolveUnderline(ctx, ls, octx, nestable)) {
			return *underline;
		}
	}
	{
		line_input in{ rest.data(), rest.data() + rest.size(), "thematic" };
		if (tryThematicBreak(in)) {
			probe.kind = opener_e::ThematicBreak;
			probe.text = trimSpaces(rest);
			return probe;
		}
	}
	{
		line_input in{ rest.data(), rest.data() + rest.size(), "atx" };
		const Heading h = tryATXHeading(in);
		if (h.lvl != 0) {
			probe.kind = opener_e::ATXHeading;
			probe.heading = h;
			probe.text = atxHeadingContent(rest.substr(static_cast<size_t>(h.lvl)));
			return probe;
		}
	}
	{
		line_input in{ rest.data(), rest.data() + rest.size(), "fence" };
		FencedCode fence = tryFencedCodeOpener(in);
		if (fence.length != 0) {
			fence.indent = static_cast<int8_t>(ls.indent);
			probe.kind = opener_e::FencedCode;
			probe.fence = std::move(fence);
			return probe;
		}
	}
	if (nestable) {
		line_input in{ rest.data(), rest.data() + rest.size(), "quote" };
		if (tryBlockQuote(in)) {
			ls.advanceNextNonspace();
			ls.advanceOffset(1, false);
			if (isSpaceOrTab(ls.peek(ls.offset))) {
				ls.advanceOffset(1, true);
			}
			probe.kind = opener_e::Quote;
			return probe;
		}
		LineState trial = ls;
		if (auto item = parseListMarker(trial, octx.containerIsParagraph)) {
			ls = trial;
			probe.kind = opener_e::ListItem;
			probe.listItem = *item;
			return probe;
		}
	}
	{
		line_input in{ rest.data(), rest.data() + rest.size(), "html" };
		const uint8_t rule = tryHtmlBlockStart(in, not octx.tipIsParagraph);
		if (rule != 0) {
			probe.kind = opener_e::HtmlBlock;
			probe.htmlRule = rule;
			return probe;
		}
	}
	return probe;
}

void mdbm_impl::incorporateLine(Context& ctx, std::string_view line) {
	LineState ls{ line, ctx.lineNumber };

	size_t matched = 1;
	for (size_t i = 1; i < ctx.stack.size(); ++i) {
		ls.findNextNonspace();
		const match_e res = continueBlock(ctx.stack[i], ls);
		if (res == match_e::Matched) {
			matched = i + 1;
			continue;
		}
		if (res == match_e::LineDone) {
			// closing fence; the fence is the tip and every block below it matched
			markLineEnd(ctx);
			closeTip(ctx);
			++ctx.lineNumber;
			return;
		}
		break;
	}

	const bool allMatched = matched == ctx.stack.size();
	size_t containerIdx = matched - 1;

	if (ctx.tip().node->flavor == type_e::Paragraph) {
		ls.findNextNonspace();
		if (resolveParagraphNewline(ctx, ls, containerIdx, allMatched) == continuation_e::Continuation) {
			ls.advanceNextNonspace();
			appendParagraphLine(ctx.tip(), ls);
			markLineEnd(ctx);
			++ctx.lineNumber;
			return;
		}
	}

	bool closedUnmatched = allMatched;
	bool openedOnLine = false;
	bool lineConsumed = false;
	bool matchedLeaf = acceptsLines(ctx.stack[containerIdx]);

	while (not matchedLeaf) {
		ls.findNextNonspace();
		if (ls.blank) {
			break;
		}
		const MDBMNode& container = *ctx.stack[containerIdx].node;
		const bool containerIsParagraph = container.flavor == type_e::Paragraph;
		const OpenerContext octx{
			containerIsParagraph,
			ctx.tip().node->flavor == type_e::Paragraph,
			containerIsParagraph ? &ctx.stack[containerIdx] : nullptr,
			containerDepth(ctx, containerIdx)
		};
		OpenerProbe probe = detectOpener(ctx, ls, octx);
		if (probe.kind == opener_e::None) {
			ls.advanceNextNonspace();
			break;
		}
		if (not closedUnmatched) {
			closeBlocks(ctx, containerIdx + 1);
			closedUnmatched = true;
		}
		openedOnLine = true;

		switch (probe.kind) {
		case opener_e::Quote:
			addChild(ctx, type_e::Quote, ls.number);
			containerIdx = ctx.stack.size() - 1;
			break;
		case opener_e::ListItem:
		{
			const MDBMNode& cont = *ctx.stack[containerIdx].node;
			if (cont.flavor != type_e::List or not listsMatch(std::get<ListInfo>(cont.crtrstc), probe.listItem.list)) {
				addChild(ctx, type_e::List, ls.number).node->crtrstc = probe.listItem.list;
			}
			addChild(ctx, type_e::ListItem, ls.number).node->crtrstc = probe.listItem.item;
			containerIdx = ctx.stack.size() - 1;
			break;
		}
		case opener_e::ATXHeading:
		{
			OpenBlock& hb = addChild(ctx, type_e::ATXHeading, ls.number);
			hb.node->crtrstc = probe.heading;
			hb.node->literal = std::string{ probe.text };
			closeTip(ctx);
			lineConsumed = true;
			matchedLeaf = true;
			break;
		}
		case opener_e::ThematicBreak:
		{
			OpenBlock& tb = addChild(ctx, type_e::ThematicBreak, ls.number);
			tb.node->literal = std::string{ probe.text };
			closeTip(ctx);
			lineConsumed = true;
			matchedLeaf = true;
			break;
		}
		case opener_e::SetextHeading:
		{
			OpenBlock para = std::move(ctx.stack.back());
			ctx.stack.pop_back();
			MDBMNode& parent = *ctx.tip().node;
			MDBMNode& heading = *para.node;
			const std::string rest = extractReferenceDefinitions(ctx, parent, heading, para.content);
			heading.flavor = type_e::SetextHeading;
			heading.crtrstc = probe.heading;
			heading.literal = std::string{ trimTrailingSpaces(trimSpaces(rest)) };
			heading.lineEnd = ls.number;
			heading.isOpen = false;
			lineConsumed = true;
			matchedLeaf = true;
			break;
		}
		case opener_e::FencedCode:
			addChild(ctx, type_e::FencedCode, ls.number).node->crtrstc = std::move(probe.fence);
			lineConsumed = true;
			matchedLeaf = true;
			break;
		case opener_e::HtmlBlock:
			addChild(ctx, type_e::HtmlBlock, ls.number).node->crtrstc = HtmlBlock{ probe.htmlRule };
			matchedLeaf = true;
			break;
		case opener_e::IndentedCode:
			addChild(ctx, type_e::IndentedCode, ls.number);
			matchedLeaf = true;
			break;
		default:
			throw md::GrammarInvariantError("block-opener", ls.number, "opener table produced no block");
		}
	}

	if (not closedUnmatched) {
		closeBlocks(ctx, containerIdx + 1);
	}
	if (lineConsumed) {
		markLineEnd(ctx);
		++ctx.lineNumber;
		return;
	}

	OpenBlock& tip = ctx.tip();
	if (ls.blank) {
		if (acceptsLines(tip)) {
			addLine(tip, ls);
		}
		else if (not openedOnLine) {
			appendBlankLine(*tip.node, ls.number);
		}
	}
	else if (acceptsLines(tip)) {
		addLine(tip, ls);
		if (tip.node->flavor == type_e::HtmlBlock) {
			const uint8_t rule = std::get<HtmlBlock>(tip.node->crtrstc).rule;
			if (rule <= 5 and htmlBlockEndsOn(rule, ls.line.substr(std::min(ls.offset, ls.line.size())))) {
				markLineEnd(ctx);
				closeTip(ctx);
				++ctx.lineNumber;
				return;
			}
		}
	}
	else if (tip.node->flavor == type_e::Paragraph) {
		ls.advanceNextNonspace();
		appendParagraphLine(tip, ls);
	}
	else {
		ls.advanceNextNonspace();
		OpenBlock& pb = addChild(ctx, type_e::Paragraph, ls.number);
		appendParagraphLine(pb, ls);
	}
	markLineEnd(ctx);
	++ctx.lineNumber;
}

void mdbm_impl::closeAllBlocks(Context& ctx) {
	closeBlocks(ctx, 1);
	ctx.document.isOpen = false;
}
