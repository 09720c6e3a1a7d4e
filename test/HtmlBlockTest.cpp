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

#include <string_view>
#include <gtest/gtest.h>
#include "MDBranchImpl.h"
#include "TestUtil.h"

using mdbm_test::dumpOf;

namespace {
	auto startRule(std::string_view line, const bool allowRule7 = true) -> uint8_t {
		mdbm_impl::line_input in{ line.data(), line.data() + line.size(), "test" };
		return mdbm_impl::tryHtmlBlockStart(in, allowRule7);
	}
}

TEST(HtmlBlock, StartConditions) {
	EXPECT_EQ(startRule("<script>"), 1);
	EXPECT_EQ(startRule("<PRE class=\"x\">"), 1);
	EXPECT_EQ(startRule("<textarea"), 1);
	EXPECT_EQ(startRule("<!-- comment"), 2);
	EXPECT_EQ(startRule("<?php"), 3);
	EXPECT_EQ(startRule("<!DOCTYPE html>"), 4);
	EXPECT_EQ(startRule("<![CDATA["), 5);
	EXPECT_EQ(startRule("<div>"), 6);
	EXPECT_EQ(startRule("</TABLE>"), 6);
	EXPECT_EQ(startRule("<section id=x>"), 6);
	EXPECT_EQ(startRule("<hr/>"), 6);
	EXPECT_EQ(startRule("<custom-tag attr=\"v\">"), 7);
	EXPECT_EQ(startRule("</custom>  "), 7);
}

TEST(HtmlBlock, NonStarters) {
	EXPECT_EQ(startRule("<custom-tag attr=\"v\">", false), 0);
	EXPECT_EQ(startRule("<span>x"), 0);
	EXPECT_EQ(startRule("</textarea>"), 0);
	EXPECT_EQ(startRule("<divx"), 0);
	EXPECT_EQ(startRule("text"), 0);
	EXPECT_EQ(startRule("<"), 0);
}

TEST(HtmlBlock, EndConditions) {
	EXPECT_TRUE(mdbm_impl::htmlBlockEndsOn(1, "foo</STYLE>bar"));
	EXPECT_FALSE(mdbm_impl::htmlBlockEndsOn(1, "</div>"));
	EXPECT_TRUE(mdbm_impl::htmlBlockEndsOn(2, "end -->"));
	EXPECT_TRUE(mdbm_impl::htmlBlockEndsOn(3, "?>"));
	EXPECT_TRUE(mdbm_impl::htmlBlockEndsOn(4, ">"));
	EXPECT_TRUE(mdbm_impl::htmlBlockEndsOn(5, "]]>"));
	EXPECT_FALSE(mdbm_impl::htmlBlockEndsOn(6, "</div>"));
	EXPECT_FALSE(mdbm_impl::htmlBlockEndsOn(7, ""));
}

TEST(HtmlBlock, BlankLineEndsRuleSix) {
	EXPECT_EQ(dumpOf("<div>\n*hello*\n\nafter"),
		"(document (html_block rule=6 \"<div>\\n*hello*\") (blank_line) (paragraph (text \"after\")))");
}

TEST(HtmlBlock, CommentRunsToItsEnd) {
	EXPECT_EQ(dumpOf("<!-- a\n\nb -->\nafter"),
		"(document (html_block rule=2 \"<!-- a\\n\\nb -->\") (paragraph (text \"after\")))");
}

TEST(HtmlBlock, SingleLineBlock) {
	EXPECT_EQ(dumpOf("<script>x</script>\ntext"),
		"(document (html_block rule=1 \"<script>x</script>\") (paragraph (text \"text\")))");
}

TEST(HtmlBlock, RuleSevenAtDocumentStart) {
	EXPECT_EQ(dumpOf("<custom>\na"), "(document (html_block rule=7 \"<custom>\\na\"))");
}

TEST(HtmlBlock, ContainerEndsBlock) {
	EXPECT_EQ(dumpOf("> <div>\n> x\ny"),
		"(document (block_quote (html_block rule=6 \"<div>\\nx\")) (paragraph (text \"y\")))");
}
