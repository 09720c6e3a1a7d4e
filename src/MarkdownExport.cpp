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
#include <vector>
#include <ostream>
#include <sstream>
#include "md_branchman/MDBranchMan.h"

namespace md = md_branchman;
using type_e = MDBMNode::type_e;

auto md::mdToMarkdown(std::string_view text, const ParserOptions& opts) -> std::string {
	const MDBMNode doc = parseDocument(text, opts);
	std::ostringstream sout{};
	markdownExport(doc, sout);
	return sout.str();
}

namespace {
	using lines_t = std::vector<std::string>;

	void renderBlock(const MDBMNode& block, lines_t& out, bool tight);
	void renderChildren(const MDBMNode& container, lines_t& out, bool tight);
	void renderInlines(const std::list<MDBMNode>& nodes, std::string& out);
	void renderTextBlock(const MDBMNode& block, lines_t& out, bool continuesDefinition);

	void splitInto(std::string_view text, lines_t& out) {
		size_t start = 0;
		while (true) {
			const size_t nl = text.find('\n', start);
			if (nl == std::string_view::npos) {
				out.emplace_back(text.substr(start));
				return;
			}
			out.emplace_back(text.substr(start, nl - start));
			start = nl + 1;
		}
	}

	void splitLiteral(std::string_view literal, lines_t& out) {
		if (literal.empty()) {
			return;
		}
		if (literal.back() == '\n') {
			literal.remove_suffix(1);
		}
		splitInto(literal, out);
	}

	// Blank lines take the first prefix trimmed of its trailing spaces, or nothing.
	void prefixLines(lines_t& lines, const std::string& first, const std::string& rest, const std::string& blank) {
		for (size_t i = 0; i < lines.size(); ++i) {
			if (lines[i].empty()) {
				lines[i] = i == 0 ? first.substr(0, first.find_last_not_of(' ') + 1) : blank;
			}
			else {
				lines[i].insert(0, i == 0 ? first : rest);
			}
		}
	}

	void renderList(const MDBMNode& list, lines_t& out) {
		const auto& info = std::get<ListInfo>(list.crtrstc);
		md::Int number = info.orderedStart;
		bool first = true;
		for (const auto& item : list.children) {
			if (item.flavor != type_e::ListItem) {
				continue;
			}
			if (not first and not info.isTight) {
				out.emplace_back();
			}
			first = false;

			std::string marker = info.isOrdered()
				? std::to_string(number++) + static_cast<char>(info.symbolUsed)
				: std::string(1, static_cast<char>(info.symbolUsed));
			lines_t itemLines;
			renderChildren(item, itemLines, info.isTight);
			if (itemLines.empty()) {
				out.push_back(std::move(marker));
				continue;
			}
			const std::string indent(marker.size() + 1, ' ');
			prefixLines(itemLines, marker + " ", indent, "");
			out.insert(out.end(), itemLines.begin(), itemLines.end());
		}
	}

	void renderBlock(const MDBMNode& block, lines_t& out, const bool tight) {
		switch (block.flavor) {
		case type_e::Document:
			renderChildren(block, out, false);
			break;
		case type_e::Quote:
		{
			lines_t inner;
			renderChildren(block, inner, false);
			if (inner.empty()) {
				inner.emplace_back();
			}
			prefixLines(inner, "> ", "> ", ">");
			out.insert(out.end(), inner.begin(), inner.end());
			break;
		}
		case type_e::List:
			renderList(block, out);
			break;
		case type_e::ListItem:
			renderChildren(block, out, tight);
			break;
		case type_e::Paragraph:
			renderTextBlock(block, out, false);
			break;
		case type_e::ATXHeading:
		{
			std::string text;
			renderInlines(block.children, text);
			std::string line(static_cast<size_t>(std::get<Heading>(block.crtrstc).lvl), '#');
			if (not text.empty()) {
				line += " " + text;
			}
			out.push_back(std::move(line));
			break;
		}
		case type_e::SetextHeading:
			renderTextBlock(block, out, false);
			break;
		case type_e::ThematicBreak:
			out.push_back(block.literal);
			break;
		case type_e::IndentedCode:
		{
			lines_t code;
			splitLiteral(block.literal, code);
			for (auto& line : code) {
				out.push_back(line.empty() ? line : "    " + line);
			}
			break;
		}
		case type_e::FencedCode:
		{
			const auto& fence = std::get<FencedCode>(block.crtrstc);
			const std::string delimiter(static_cast<size_t>(fence.length), static_cast<char>(fence.type));
			out.push_back(delimiter + fence.infoStr);
			splitLiteral(block.literal, out);
			out.push_back(delimiter);
			break;
		}
		case type_e::HtmlBlock:
		case type_e::LinkRefDef:
			splitInto(block.literal, out);
			break;
		default:
			break;
		}
	}

	bool isTextBlock(const MDBMNode& block) noexcept {
		return block.flavor == type_e::Paragraph or block.flavor == type_e::SetextHeading;
	}

	// A first character that could start a block once the line stops being a
	// paragraph continuation.
	bool mayOpenBlock(std::string_view line) noexcept {
		if (line.empty()) {
			return false;
		}
		const char c = line.front();
		return (c >= '0' and c <= '9') or std::string_view{ "#>=-+*_~`<" }.find(c) != std::string_view::npos;
	}

	/**
	Paragraph and setext heading text. Continuation lines that could be read as a
	block start are indented by four columns, which no opener accepts while a
	paragraph is open. When the block was split off the tail of reference
	definitions its first line is a continuation too.
	*/
	void renderTextBlock(const MDBMNode& block, lines_t& out, const bool continuesDefinition) {
		std::string text;
		renderInlines(block.children, text);
		lines_t lines;
		splitInto(text, lines);
		for (size_t i = 0; i < lines.size(); ++i) {
			if ((i > 0 or continuesDefinition) and mayOpenBlock(lines[i])) {
				lines[i].insert(0, "    ");
			}
		}
		out.insert(out.end(), lines.begin(), lines.end());
		if (block.flavor == type_e::SetextHeading) {
			out.emplace_back(std::get<Heading>(block.crtrstc).lvl == 1 ? "===" : "---");
		}
	}

	void renderChildren(const MDBMNode& container, lines_t& out, const bool tight) {
		const MDBMNode* previous = nullptr;
		for (const auto& child : container.children) {
			if (child.flavor == type_e::BlankLine) {
				continue;
			}
			const bool continuesDefinition = previous != nullptr and isTextBlock(child)
				and previous->flavor == type_e::LinkRefDef and previous->lineEnd + 1 == child.lineBegin;
			if (previous != nullptr and not tight and not continuesDefinition) {
				out.emplace_back();
			}
			previous = &child;
			if (isTextBlock(child)) {
				renderTextBlock(child, out, continuesDefinition);
			}
			else {
				renderBlock(child, out, tight);
			}
		}
	}

	void renderInlines(const std::list<MDBMNode>& nodes, std::string& out) {
		for (const auto& node : nodes) {
			switch (node.flavor) {
			case type_e::Text:
			case type_e::RawHtml:
			case type_e::EntityRef:
			case type_e::NumericCharRef:
			case type_e::SoftLineBreak:
				out += node.literal;
				break;
			case type_e::HardLineBreak:
				out += std::get<LineBreak>(node.crtrstc).kind == LineBreak::kind_e::Backslash ? "\\\n" : node.literal;
				break;
			case type_e::BackslashEscape:
				out += "\\" + node.literal;
				break;
			case type_e::CodeSpan:
			{
				const auto& span = std::get<CodeSpan>(node.crtrstc);
				const std::string fence(span.fenceLength, '`');
				out += fence + span.raw + fence;
				break;
			}
			case type_e::Emphasis:
			case type_e::StrongEmphasis:
				out += node.literal;
				renderInlines(node.children, out);
				out += node.literal;
				break;
			case type_e::Link:
			case type_e::Image:
				out += node.flavor == type_e::Image ? "![" : "[";
				renderInlines(node.children, out);
				out += "]" + std::get<LinkInfo>(node.crtrstc).rawTail;
				break;
			case type_e::Autolink:
				out += "<" + node.literal + ">";
				break;
			default:
				break;
			}
		}
	}
}

bool md::markdownExport(const MDBMNode& node, std::ostream& out) {
	lines_t lines;
	if (node.isInline()) {
		std::string text;
		renderInlines({ node }, text);
		splitInto(text, lines);
	}
	else {
		renderBlock(node, lines, false);
	}
	for (const auto& line : lines) {
		out << line << '\n';
	}
	return not out.fail();
}
