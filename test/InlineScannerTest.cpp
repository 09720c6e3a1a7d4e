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
#include <gtest/gtest.h>
#include "md_branchman/MDBranchMan.h"
#include "InlineGrammar.h"
#include "TestUtil.h"

namespace md = md_branchman;
using mdbm_test::dumpOf;
using mdbm_test::TraceLog;

TEST(InlineScanner, EmphasisAndStrong) {
	EXPECT_EQ(dumpOf("*a* **b**"),
		"(document (paragraph (emphasis (text \"a\")) (text \" \") (strong_emphasis (text \"b\"))))");
	EXPECT_EQ(dumpOf("_a_"), "(document (paragraph (emphasis (text \"a\"))))");
}

TEST(InlineScanner, TripleRunNestsEmphasisInStrong) {
	EXPECT_EQ(dumpOf("***x***"), "(document (paragraph (strong_emphasis (emphasis (text \"x\")))))");
}

TEST(InlineScanner, UnbalancedRunsKeepLeftovers) {
	EXPECT_EQ(dumpOf("**x*"), "(document (paragraph (text \"*\") (emphasis (text \"x\"))))");
	EXPECT_EQ(dumpOf("*x**"), "(document (paragraph (emphasis (text \"x\")) (text \"*\")))");
}

TEST(InlineScanner, IntrawordUnderscoreIsText) {
	EXPECT_EQ(dumpOf("foo_bar_"), "(document (paragraph (text \"foo_bar_\")))");
	EXPECT_EQ(dumpOf("a * b"), "(document (paragraph (text \"a * b\")))");
}

TEST(InlineScanner, CodeSpans) {
	EXPECT_EQ(dumpOf("`a  b` and `` c ` d ``"),
		"(document (paragraph (code_span \"a  b\") (text \" and \") (code_span \"c ` d\")))");
	EXPECT_EQ(dumpOf("``open"), "(document (paragraph (text \"``open\")))");
	EXPECT_EQ(dumpOf("`*not emphasis*`"), "(document (paragraph (code_span \"*not emphasis*\")))");
}

TEST(InlineScanner, Autolinks) {
	EXPECT_EQ(dumpOf("<https://example.com> and <foo@bar.com>"),
		"(document (paragraph (autolink dest=\"https://example.com\") (text \" and \") (autolink dest=\"foo@bar.com\" email)))");
	EXPECT_EQ(dumpOf("1 < 2 > 0"), "(document (paragraph (text \"1 < 2 > 0\")))");
}

TEST(InlineScanner, RawHtml) {
	EXPECT_EQ(dumpOf("a <b class=\"x\">c</b>"),
		"(document (paragraph (text \"a \") (html_tag \"<b class=\\\"x\\\">\") (text \"c\") (html_tag \"</b>\")))");
	EXPECT_EQ(dumpOf("x <!-- note --> y"), "(document (paragraph (text \"x \") (html_tag \"<!-- note -->\") (text \" y\")))");
}

TEST(InlineScanner, CharacterReferences) {
	const MDBMNode doc = md::parseDocument("&amp; &copy; &#35; &#x22; &bogus;");
	EXPECT_EQ(md::treeDump(doc),
		"(document (paragraph (entity_reference \"&amp;\") (text \" \") (entity_reference \"&copy;\") (text \" \") "
		"(numeric_character_reference \"&#35;\") (text \" \") (numeric_character_reference \"&#x22;\") (text \" &bogus;\")))");
	const MDBMNode& para = doc.at(0);
	EXPECT_EQ(std::get<CharRef>(para.at(0).crtrstc).decoded, "&");
	EXPECT_EQ(std::get<CharRef>(para.at(2).crtrstc).decoded, u8"\u00A9");
	EXPECT_EQ(std::get<CharRef>(para.at(4).crtrstc).decoded, "#");
	EXPECT_EQ(std::get<CharRef>(para.at(6).crtrstc).decoded, "\"");
}

TEST(InlineScanner, InvalidCodePointDecodesToReplacement) {
	const auto match = mdbm_impl::matchEntity("&#0;", md::builtinEntityTable());
	ASSERT_TRUE(match);
	EXPECT_EQ(match->decoded, u8"\uFFFD");
	EXPECT_TRUE(match->numeric);
	EXPECT_FALSE(mdbm_impl::matchEntity("&#12345678;", md::builtinEntityTable()));
}

TEST(InlineScanner, BackslashEscapes) {
	EXPECT_EQ(dumpOf("\\*not\\*"), "(document (paragraph (backslash_escape \"*\") (text \"not\") (backslash_escape \"*\")))");
	EXPECT_EQ(dumpOf("\\q"), "(document (paragraph (text \"\\\\q\")))");
}

TEST(InlineScanner, LiteralsOfDecodedLeaves) {
	const MDBMNode doc = md::parseDocument("\\* `` a\nb `` <https://x.y> &amp;");
	const MDBMNode& para = doc.at(0);

	const MDBMNode& escape = para.at(0);
	ASSERT_EQ(escape.flavor, MDBMNode::type_e::BackslashEscape);
	EXPECT_EQ(escape.literal, "*");

	const MDBMNode& code = para.at(2);
	ASSERT_EQ(code.flavor, MDBMNode::type_e::CodeSpan);
	EXPECT_EQ(code.literal, "a b");
	EXPECT_EQ(std::get<CodeSpan>(code.crtrstc).raw, " a\nb ");
	EXPECT_EQ(std::get<CodeSpan>(code.crtrstc).fenceLength, 2u);

	const MDBMNode& autolink = para.at(4);
	ASSERT_EQ(autolink.flavor, MDBMNode::type_e::Autolink);
	EXPECT_EQ(autolink.literal, "https://x.y");
	EXPECT_EQ(std::get<Autolink>(autolink.crtrstc).destination, "https://x.y");

	const MDBMNode& entity = para.at(6);
	ASSERT_EQ(entity.flavor, MDBMNode::type_e::EntityRef);
	EXPECT_EQ(entity.literal, "&amp;");
	EXPECT_EQ(std::get<CharRef>(entity.crtrstc).decoded, "&");
}

TEST(InlineScanner, LineBreaks) {
	EXPECT_EQ(dumpOf("a  \nb"), "(document (paragraph (text \"a\") (hard_line_break) (text \"b\")))");
	EXPECT_EQ(dumpOf("a\\\nb"), "(document (paragraph (text \"a\") (hard_line_break) (text \"b\")))");
	EXPECT_EQ(dumpOf("a \n  b"), "(document (paragraph (text \"a\") (soft_line_break) (text \"b\")))");
}

TEST(InlineScanner, InlineLink) {
	const MDBMNode doc = md::parseDocument("[text](/url \"title\")");
	EXPECT_EQ(md::treeDump(doc), "(document (paragraph (link dest=\"/url\" title=\"title\" (text \"text\"))))");
	const auto& link = std::get<LinkInfo>(doc.at(0).at(0).crtrstc);
	EXPECT_EQ(link.form, LinkInfo::form_e::Inline);
	EXPECT_EQ(link.rawTail, "(/url \"title\")");
}

TEST(InlineScanner, ImageWithEmphasis) {
	EXPECT_EQ(dumpOf("![alt *x*](/i.png)"),
		"(document (paragraph (image dest=\"/i.png\" (text \"alt \") (emphasis (text \"x\")))))");
}

TEST(InlineScanner, LinkInsideImageDescriptionIsText) {
	TraceLog log;
	md::ParserOptions opts{};
	opts.branchTrace = log.sink();
	EXPECT_EQ(dumpOf("![a [b](/u)](/i)", opts), "(document (paragraph (image dest=\"/i\" (text \"a [b](/u)\"))))");
	EXPECT_TRUE(log.contains("line 0 link-or-text: killed link (link inside an image description)"));
}

TEST(InlineScanner, LinksDoNotNest) {
	EXPECT_EQ(dumpOf("[a [b](/u)](/v)"),
		"(document (paragraph (text \"[a \") (link dest=\"/u\" (text \"b\")) (text \"](/v)\")))");
}

TEST(InlineScanner, MissingTargetLeavesBrackets) {
	TraceLog log;
	md::ParserOptions opts{};
	opts.branchTrace = log.sink();
	EXPECT_EQ(dumpOf("[x]", opts), "(document (paragraph (text \"[x]\")))");
	EXPECT_TRUE(log.contains("line 0 link-or-text: killed link (no destination or matching definition)"));
	EXPECT_TRUE(log.contains("line 0 link-or-text: merged into text (priority 0)"));
}

TEST(InlineScanner, MultilineLinkTextOption) {
	EXPECT_EQ(dumpOf("[a\nb](/u)"),
		"(document (paragraph (link dest=\"/u\" (text \"a\") (soft_line_break) (text \"b\"))))");
	md::ParserOptions opts{};
	opts.multilineLinkText = false;
	EXPECT_EQ(dumpOf("[a\nb](/u)", opts),
		"(document (paragraph (text \"[a\") (soft_line_break) (text \"b](/u)\")))");
}

TEST(InlineScanner, DestinationParenDepth) {
	EXPECT_EQ(dumpOf("[a](/u(1))"), "(document (paragraph (link dest=\"/u(1)\" (text \"a\"))))");
	EXPECT_EQ(dumpOf("[a](/u((1)))"), "(document (paragraph (text \"[a](/u((1)))\")))");
	md::ParserOptions opts{};
	opts.maxDestinationParenDepth = 2;
	EXPECT_EQ(dumpOf("[a](/u((1)))", opts), "(document (paragraph (link dest=\"/u((1))\" (text \"a\"))))");
}

TEST(InlineScanner, HeadingsGetInlines) {
	EXPECT_EQ(dumpOf("# *a*"), "(document (atx_heading level=1 (emphasis (text \"a\"))))");
}
