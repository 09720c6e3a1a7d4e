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
#include <fmt/format.h>
#include "md_branchman/MDBranchMan.h"

namespace md = md_branchman;
using type_e = MDBMNode::type_e;

auto md::nodeTypeName(const MDBMNode::type_e type) noexcept -> std::string_view {
	switch (type) {
	case type_e::Document: return "document";
	case type_e::Paragraph: return "paragraph";
	case type_e::ATXHeading: return "atx_heading";
	case type_e::SetextHeading: return "setext_heading";
	case type_e::IndentedCode: return "indented_code_block";
	case type_e::FencedCode: return "fenced_code_block";
	case type_e::Quote: return "block_quote";
	case type_e::List: return "list";
	case type_e::ListItem: return "list_item";
	case type_e::ThematicBreak: return "thematic_break";
	case type_e::HtmlBlock: return "html_block";
	case type_e::LinkRefDef: return "link_reference_definition";
	case type_e::BlankLine: return "blank_line";
	case type_e::Text: return "text";
	case type_e::SoftLineBreak: return "soft_line_break";
	case type_e::HardLineBreak: return "hard_line_break";
	case type_e::CodeSpan: return "code_span";
	case type_e::Emphasis: return "emphasis";
	case type_e::StrongEmphasis: return "strong_emphasis";
	case type_e::Link: return "link";
	case type_e::Image: return "image";
	case type_e::Autolink: return "autolink";
	case type_e::RawHtml: return "html_tag";
	case type_e::EntityRef: return "entity_reference";
	case type_e::NumericCharRef: return "numeric_character_reference";
	case type_e::BackslashEscape: return "backslash_escape";
	}
	return "unknown";
}

namespace {
	auto quoted(std::string_view s) -> std::string {
		std::string out{ "\"" };
		for (const char c : s) {
			switch (c) {
			case '\\': out += "\\\\"; break;
			case '"': out += "\\\""; break;
			case '\n': out += "\\n"; break;
			case '\t': out += "\\t"; break;
			default: out.push_back(c);
			}
		}
		out.push_back('"');
		return out;
	}

	void appendAttributes(const MDBMNode& node, std::string& out) {
		switch (node.flavor) {
		case type_e::ATXHeading:
		case type_e::SetextHeading:
			out += fmt::format(" level={}", static_cast<int>(std::get<Heading>(node.crtrstc).lvl));
			break;
		case type_e::IndentedCode:
			out += " " + quoted(node.literal);
			break;
		case type_e::FencedCode:
		{
			const auto& fence = std::get<FencedCode>(node.crtrstc);
			if (not fence.infoStr.empty()) {
				out += " info=" + quoted(fence.infoStr);
			}
			out += " " + quoted(node.literal);
			break;
		}
		case type_e::List:
		{
			const auto& list = std::get<ListInfo>(node.crtrstc);
			out += fmt::format(" marker=\"{}\"", static_cast<char>(list.symbolUsed));
			if (list.isOrdered()) {
				out += fmt::format(" start={}", list.orderedStart);
			}
			out += list.isTight ? " tight" : " loose";
			break;
		}
		case type_e::HtmlBlock:
			out += fmt::format(" rule={} ", std::get<HtmlBlock>(node.crtrstc).rule) + quoted(node.literal);
			break;
		case type_e::LinkRefDef:
		{
			const auto& def = std::get<LinkRefDef>(node.crtrstc);
			out += " label=" + quoted(def.label) + " dest=" + quoted(def.destination);
			if (def.title) {
				out += " title=" + quoted(*def.title);
			}
			break;
		}
		case type_e::Link:
		case type_e::Image:
		{
			const auto& link = std::get<LinkInfo>(node.crtrstc);
			out += " dest=" + quoted(link.destination);
			if (link.title) {
				out += " title=" + quoted(*link.title);
			}
			break;
		}
		case type_e::Autolink:
		{
			const auto& autolink = std::get<Autolink>(node.crtrstc);
			out += " dest=" + quoted(autolink.destination);
			if (autolink.isEmail) {
				out += " email";
			}
			break;
		}
		case type_e::Text:
		case type_e::CodeSpan:
		case type_e::RawHtml:
		case type_e::EntityRef:
		case type_e::NumericCharRef:
		case type_e::BackslashEscape:
			out += " " + quoted(node.literal);
			break;
		default:
			break;
		}
	}
}

auto md::treeDump(const MDBMNode& node, const TreeDumpOptions& opts) -> std::string {
	std::string out;
	const MDBMNode::public_iterator end{};
	for (MDBMNode::public_iterator it{ &node }; it != end; ++it) {
		if (it.isRetracting()) {
			out.push_back(')');
			continue;
		}
		if (not opts.includeBlankLines and it->flavor == type_e::BlankLine) {
			continue;
		}
		if (not out.empty()) {
			out.push_back(' ');
		}
		out += fmt::format("({}", nodeTypeName(it->flavor));
		if (opts.includePositions) {
			out += fmt::format(" [{}-{}]", it->lineBegin, it->lineEnd);
		}
		appendAttributes(*it, out);
		if (it->children.empty()) {
			out.push_back(')');
		}
	}
	return out;
}
