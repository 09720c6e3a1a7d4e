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
#include <utility>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "md_branchman/MDBranchMan.h"
#include "JsonExport.h"

#ifndef MDBRANCHMAN_TEST_DATA_DIR
#define MDBRANCHMAN_TEST_DATA_DIR "test/data"
#endif

namespace md = md_branchman;

namespace {
	auto loadCases() -> nlohmann::json {
		std::ifstream in{ std::string{ MDBRANCHMAN_TEST_DATA_DIR } + "/cases.json" };
		if (not in) {
			return nlohmann::json::array();
		}
		return nlohmann::json::parse(in);
	}

	// Every case's markdown with its options, plus inputs heavy on inline markup.
	auto loadInputs() -> std::vector<std::pair<std::string, md::ParserOptions>> {
		std::vector<std::pair<std::string, md::ParserOptions>> inputs;
		for (const auto& el : loadCases()) {
			md::ParserOptions opts{};
			if (el.contains("options")) {
				mdbtree::applyConfig(el["options"], opts);
			}
			inputs.emplace_back(el["markdown"].get<std::string>(), opts);
		}
		for (const char* text : {
			"a `b` \\* &amp; <i>c</i>  \nd",
			"<https://a.b> and <me@x.io>\\\nnext",
			"**strong** _em_ [t](/u \"x\") ![i][r]\n\n[r]: /img",
			"a\n    # b",
			"> a\n    - b",
			"- a\n        # b",
			"[x]: /u\n    # b" })
		{
			inputs.emplace_back(text, md::ParserOptions{});
		}
		return inputs;
	}

	// The source text an inline subtree was built from, piece by piece in order:
	// leaf text plus the delimiters, brackets, fences and link tails around it.
	void collectSourcePieces(const MDBMNode& node, std::vector<std::string>& pieces) {
		using type_e = MDBMNode::type_e;
		switch (node.flavor) {
		case type_e::SoftLineBreak:
			return;
		case type_e::HardLineBreak:
			if (std::get<LineBreak>(node.crtrstc).kind == LineBreak::kind_e::Backslash) {
				pieces.emplace_back("\\");
			}
			return;
		case type_e::BackslashEscape:
			pieces.emplace_back("\\");
			pieces.push_back(node.literal);
			return;
		case type_e::CodeSpan:
		{
			const auto& span = std::get<CodeSpan>(node.crtrstc);
			const std::string fence(span.fenceLength, '`');
			pieces.push_back(fence);
			pieces.push_back(span.raw);
			pieces.push_back(fence);
			return;
		}
		case type_e::Autolink:
			pieces.emplace_back("<");
			pieces.push_back(node.literal);
			pieces.emplace_back(">");
			return;
		case type_e::Emphasis:
		case type_e::StrongEmphasis:
			pieces.push_back(node.literal);
			for (const auto& child : node.children) {
				collectSourcePieces(child, pieces);
			}
			pieces.push_back(node.literal);
			return;
		case type_e::Link:
		case type_e::Image:
			pieces.emplace_back(node.flavor == type_e::Image ? "![" : "[");
			for (const auto& child : node.children) {
				collectSourcePieces(child, pieces);
			}
			pieces.emplace_back("]");
			pieces.push_back(std::get<LinkInfo>(node.crtrstc).rawTail);
			return;
		default:
			pieces.push_back(node.literal);
		}
	}

	auto sourceLines(std::string_view text, md::UInt first, md::UInt last) -> std::string {
		std::string out;
		md::UInt line = 0;
		size_t pos = 0;
		while (pos <= text.size() and line <= last) {
			size_t nl = text.find('\n', pos);
			if (nl == std::string_view::npos) {
				nl = text.size();
			}
			if (line >= first) {
				if (line > first) {
					out.push_back('\n');
				}
				out.append(text.substr(pos, nl - pos));
			}
			pos = nl + 1;
			++line;
		}
		return out;
	}

	// Whitespace and the block markup that owns no inline node.
	bool isBlockMarkup(const char c) noexcept {
		return std::string_view{ " \t\n>#=-+*.)0123456789" }.find(c) != std::string_view::npos;
	}
}

// Each entry: { "section", "example", "markdown", "tree", optional "options" }
TEST(CaseFile, AllExamples) {
	const nlohmann::json cases = loadCases();
	ASSERT_TRUE(cases.is_array());
	ASSERT_FALSE(cases.empty()) << "no cases in " << MDBRANCHMAN_TEST_DATA_DIR;

	for (const auto& el : cases) {
		const auto& section = el["section"].get_ref<const std::string&>();
		const unsigned example = el["example"].get<unsigned>();
		SCOPED_TRACE(section + " #" + std::to_string(example));

		md::ParserOptions opts{};
		if (el.contains("options")) {
			mdbtree::applyConfig(el["options"], opts);
		}
		const MDBMNode doc = md::parseDocument(el["markdown"].get<std::string>(), opts);
		EXPECT_EQ(md::treeDump(doc), el["tree"].get<std::string>());
	}
}

TEST(CaseFile, ExportReparsesToSameStructure) {
	md::TreeDumpOptions shape{};
	shape.includeBlankLines = false;
	for (const auto& [text, opts] : loadInputs()) {
		SCOPED_TRACE(text);
		const std::string exported = md::mdToMarkdown(text, opts);
		EXPECT_EQ(md::treeDump(md::parseDocument(exported, opts), shape), md::treeDump(md::parseDocument(text, opts), shape))
			<< "exported as:\n" << exported;
	}
}

TEST(CaseFile, InlineLeavesCoverOnlySourceText) {
	for (const auto& [text, opts] : loadInputs()) {
		SCOPED_TRACE(text);
		const MDBMNode doc = md::parseDocument(text, opts);
		const MDBMNode::public_iterator end{};
		for (MDBMNode::public_iterator it{ &doc }; it != end; ++it) {
			if (it.isRetracting() or not it->hasInlineContent()) {
				continue;
			}
			const std::string source = sourceLines(text, it->lineBegin, it->lineEnd);
			std::vector<std::string> pieces;
			for (const auto& child : it->children) {
				collectSourcePieces(child, pieces);
			}

			size_t cursor = 0;
			for (const auto& piece : pieces) {
				const size_t at = source.find(piece, cursor);
				ASSERT_NE(at, std::string::npos) << "\"" << piece << "\" is not in \"" << source << "\" after offset " << cursor;
				for (size_t i = cursor; i < at; ++i) {
					EXPECT_TRUE(isBlockMarkup(source[i])) << "dropped '" << source[i] << "' at offset " << i << " of \"" << source << "\"";
				}
				cursor = at + piece.size();
			}
			for (size_t i = cursor; i < source.size(); ++i) {
				EXPECT_TRUE(isBlockMarkup(source[i])) << "dropped '" << source[i] << "' at offset " << i << " of \"" << source << "\"";
			}
		}
	}
}
