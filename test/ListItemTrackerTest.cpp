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
#include <gtest/gtest.h>
#include "BlockContext.h"
#include "TestUtil.h"

namespace md = md_branchman;
using mdbm_test::dumpOf;

namespace {
	auto markerOf(std::string_view line, const bool interruptsParagraph = false) -> std::optional<mdbm_impl::ListItemStart> {
		md::impl::LineState ls{ line, 0 };
		ls.findNextNonspace();
		return mdbm_impl::parseListMarker(ls, interruptsParagraph);
	}
}

TEST(ListItemTracker, MarkerPadding) {
	const auto bullet = markerOf("-   text");
	ASSERT_TRUE(bullet);
	EXPECT_EQ(bullet->list.symbolUsed, ListInfo::symbol_e::dash);
	EXPECT_EQ(bullet->item.sizeW, 1);
	EXPECT_EQ(bullet->item.postIndent, 3);
	EXPECT_FALSE(bullet->blankItem);

	const auto ordered = markerOf(" 12) x");
	ASSERT_TRUE(ordered);
	EXPECT_TRUE(ordered->list.isOrdered());
	EXPECT_EQ(ordered->list.orderedStart, 12);
	EXPECT_EQ(ordered->item.preIndent, 1);
	EXPECT_EQ(ordered->item.sizeW, 3);
	EXPECT_EQ(ordered->item.postIndent, 1);
}

TEST(ListItemTracker, MarkerRejections) {
	EXPECT_FALSE(markerOf("-text"));
	EXPECT_FALSE(markerOf("1234567890. too long"));
	EXPECT_FALSE(markerOf("2. x", true));
	EXPECT_FALSE(markerOf("-", true));
	EXPECT_TRUE(markerOf("1. x", true));
	const auto blank = markerOf("-");
	ASSERT_TRUE(blank);
	EXPECT_TRUE(blank->blankItem);
}

TEST(ListItemTracker, TightList) {
	EXPECT_EQ(dumpOf("- a\n- b"),
		"(document (list marker=\"-\" tight (list_item (paragraph (text \"a\"))) (list_item (paragraph (text \"b\")))))");
}

TEST(ListItemTracker, BlankLineBetweenItemsMakesListLoose) {
	EXPECT_EQ(dumpOf("- a\n\n- b"),
		"(document (list marker=\"-\" loose (list_item (paragraph (text \"a\"))) (blank_line) (list_item (paragraph (text \"b\")))))");
}

TEST(ListItemTracker, BlankLineInsideItemMakesListLoose) {
	EXPECT_EQ(dumpOf("- a\n\n  b\n- c"),
		"(document (list marker=\"-\" loose (list_item (paragraph (text \"a\")) (blank_line) (paragraph (text \"b\"))) "
		"(list_item (paragraph (text \"c\")))))");
}

TEST(ListItemTracker, TrailingBlankLineLeavesTheList) {
	EXPECT_EQ(dumpOf("- a\n- b\n\nafter"),
		"(document (list marker=\"-\" tight (list_item (paragraph (text \"a\"))) (list_item (paragraph (text \"b\")))) "
		"(blank_line) (paragraph (text \"after\")))");
}

TEST(ListItemTracker, OrderedStart) {
	EXPECT_EQ(dumpOf("3. x\n4. y"),
		"(document (list marker=\".\" start=3 tight (list_item (paragraph (text \"x\"))) (list_item (paragraph (text \"y\")))))");
}

TEST(ListItemTracker, ChangedMarkerStartsNewList) {
	EXPECT_EQ(dumpOf("- a\n+ b"),
		"(document (list marker=\"-\" tight (list_item (paragraph (text \"a\")))) "
		"(list marker=\"+\" tight (list_item (paragraph (text \"b\")))))");
}

TEST(ListItemTracker, OnlyStartOneInterruptsParagraph) {
	EXPECT_EQ(dumpOf("text\n2. no"), "(document (paragraph (text \"text\") (soft_line_break) (text \"2. no\")))");
	EXPECT_EQ(dumpOf("text\n1. yes"),
		"(document (paragraph (text \"text\")) (list marker=\".\" start=1 tight (list_item (paragraph (text \"yes\")))))");
	EXPECT_EQ(dumpOf("text\n*"), "(document (paragraph (text \"text\") (soft_line_break) (text \"*\")))");
}

TEST(ListItemTracker, EmptyItemClosesOnBlankLine) {
	EXPECT_EQ(dumpOf("-\n\n  foo"),
		"(document (list marker=\"-\" tight (list_item)) (blank_line) (paragraph (text \"foo\")))");
}

TEST(ListItemTracker, NestedList) {
	EXPECT_EQ(dumpOf("- a\n  - b\n- c"),
		"(document (list marker=\"-\" tight (list_item (paragraph (text \"a\")) "
		"(list marker=\"-\" tight (list_item (paragraph (text \"b\"))))) (list_item (paragraph (text \"c\")))))");
}

TEST(ListItemTracker, WideGapOpensIndentedCode) {
	EXPECT_EQ(dumpOf("-     code"),
		"(document (list marker=\"-\" tight (list_item (indented_code_block \"code\\n\"))))");
}

TEST(ListItemTracker, ItemLineSpans) {
	const MDBMNode doc = md::parseDocument("- a\n  b\n- c");
	const MDBMNode& list = doc.at(0);
	EXPECT_EQ(list.lineBegin, 0u);
	EXPECT_EQ(list.lineEnd, 2u);
	EXPECT_EQ(list.at(0).lineEnd, 1u);
	EXPECT_EQ(list.at(1).lineBegin, 2u);
}
