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
#include "TestUtil.h"

namespace md = md_branchman;
using mdbm_test::dumpOf;
using mdbm_test::TraceLog;

TEST(ParagraphContinuation, PlainLineContinues) {
	TraceLog log;
	md::ParserOptions opts{};
	opts.branchTrace = log.sink();
	EXPECT_EQ(dumpOf("a\nb", opts), "(document (paragraph (text \"a\") (soft_line_break) (text \"b\")))");
	EXPECT_TRUE(log.contains("line 1 paragraph-newline: killed close-assumed (no interrupting opener)"));
	EXPECT_TRUE(log.contains("line 1 paragraph-newline: merged into continuation-assumed"));
}

TEST(ParagraphContinuation, ThematicBreakInterrupts) {
	TraceLog log;
	md::ParserOptions opts{};
	opts.branchTrace = log.sink();
	dumpOf("a\n***", opts);
	EXPECT_TRUE(log.contains("line 1 paragraph-newline: killed continuation-assumed (thematic break)"));
	EXPECT_TRUE(log.contains("line 1 paragraph-newline: merged into close-assumed"));
}

TEST(ParagraphContinuation, BlankLineCloses) {
	TraceLog log;
	md::ParserOptions opts{};
	opts.branchTrace = log.sink();
	EXPECT_EQ(dumpOf("a\n\nb", opts), "(document (paragraph (text \"a\")) (blank_line) (paragraph (text \"b\")))");
	EXPECT_TRUE(log.contains("line 1 paragraph-newline: killed continuation-assumed (blank line)"));
}

TEST(ParagraphContinuation, InterruptingBlocks) {
	EXPECT_EQ(dumpOf("a\n# h"), "(document (paragraph (text \"a\")) (atx_heading level=1 (text \"h\")))");
	EXPECT_EQ(dumpOf("a\n```\nx\n```"), "(document (paragraph (text \"a\")) (fenced_code_block \"x\\n\"))");
	EXPECT_EQ(dumpOf("a\n> q"), "(document (paragraph (text \"a\")) (block_quote (paragraph (text \"q\"))))");
	EXPECT_EQ(dumpOf("a\n<div>"), "(document (paragraph (text \"a\")) (html_block rule=6 \"<div>\"))");
}

TEST(ParagraphContinuation, SetextUnderlineOutranksOtherReadings) {
	TraceLog log;
	md::ParserOptions opts{};
	opts.branchTrace = log.sink();
	EXPECT_EQ(dumpOf("Foo\n---", opts), "(document (setext_heading level=2 (text \"Foo\")))");
	EXPECT_TRUE(log.contains("line 1 setext-underline: killed list item (no marker that may interrupt a paragraph)"));
	EXPECT_TRUE(log.contains("line 1 setext-underline: merged into setext heading (priority 3)"));
	EXPECT_TRUE(log.contains("line 1 paragraph-newline: killed continuation-assumed (setext underline)"));
}

TEST(ParagraphContinuation, LazyUnderlineIsParagraphText) {
	EXPECT_EQ(dumpOf("> Foo\n==="), "(document (block_quote (paragraph (text \"Foo\") (soft_line_break) (text \"===\"))))");
}

TEST(ParagraphContinuation, MultiLineSetextContent) {
	EXPECT_EQ(dumpOf("Foo\nBar\n==="),
		"(document (setext_heading level=1 (text \"Foo\") (soft_line_break) (text \"Bar\")))");
}

TEST(ParagraphContinuation, RawHtmlLineDoesNotInterrupt) {
	EXPECT_EQ(dumpOf("a\n<custom>"), "(document (paragraph (text \"a\") (soft_line_break) (html_tag \"<custom>\")))");
}
