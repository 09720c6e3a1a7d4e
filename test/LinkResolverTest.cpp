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
#include "BlockContext.h"
#include "LinkResolver.h"
#include "TestUtil.h"

namespace md = md_branchman;
using mdbm_test::dumpOf;

TEST(LinkResolver, NormalizeLabel) {
	EXPECT_EQ(md::normalizeLabel("  Foo \n  Bar "), "foo bar");
	EXPECT_EQ(md::normalizeLabel("STRASSE"), md::normalizeLabel(u8"Straße"));
}

TEST(LinkResolver, ScanLabel) {
	EXPECT_EQ(mdbm_impl::scanLinkLabel("[foo] x", 0, 999), 5u);
	EXPECT_EQ(mdbm_impl::scanLinkLabel("[a\\]b]", 0, 999), 6u);
	EXPECT_EQ(mdbm_impl::scanLinkLabel("[a[b]", 0, 999), 0u);
	EXPECT_EQ(mdbm_impl::scanLinkLabel("[abcd]", 0, 3), 0u);
	EXPECT_EQ(mdbm_impl::scanLinkLabel("[unclosed", 0, 999), 0u);
}

TEST(LinkResolver, ScanDestination) {
	const auto pointy = mdbm_impl::scanLinkDestination("<a b> rest", 0, 1);
	ASSERT_TRUE(pointy);
	EXPECT_EQ(pointy->length, 5u);
	EXPECT_EQ(pointy->raw, "a b");

	const auto bare = mdbm_impl::scanLinkDestination("a(b)c rest", 0, 1);
	ASSERT_TRUE(bare);
	EXPECT_EQ(bare->raw, "a(b)c");

	EXPECT_FALSE(mdbm_impl::scanLinkDestination("a(b)c", 0, 0));
	EXPECT_FALSE(mdbm_impl::scanLinkDestination("a((b))c", 0, 1));
	EXPECT_TRUE(mdbm_impl::scanLinkDestination("a((b))c", 0, 2));
	EXPECT_FALSE(mdbm_impl::scanLinkDestination("<a\nb>", 0, 1));
	EXPECT_FALSE(mdbm_impl::scanLinkDestination("a(b", 0, 1));
}

TEST(LinkResolver, ScanTitle) {
	EXPECT_EQ(mdbm_impl::scanLinkTitle("\"t\" x", 0), 3u);
	EXPECT_EQ(mdbm_impl::scanLinkTitle("'it\\'s'", 0), 7u);
	EXPECT_EQ(mdbm_impl::scanLinkTitle("(paren)", 0), 7u);
	EXPECT_EQ(mdbm_impl::scanLinkTitle("\"a\n\nb\"", 0), 0u);
	EXPECT_EQ(mdbm_impl::scanLinkTitle("x", 0), 0u);
}

TEST(LinkResolver, ParseDefinition) {
	const md::ParserOptions opts{};
	const std::string text{ "[Foo Bar]: <my url> 'the &amp; title'\nnext" };
	const auto def = mdbm_impl::parseReferenceDefinition(text, opts, md::builtinEntityTable());
	ASSERT_TRUE(def);
	EXPECT_EQ(def->definition.label, "foo bar");
	EXPECT_EQ(def->definition.destination, "my url");
	ASSERT_TRUE(def->definition.title);
	EXPECT_EQ(*def->definition.title, "the & title");
	EXPECT_EQ(def->consumed, text.find("next"));
}

TEST(LinkResolver, TitleOnFollowingLineMayBeDropped) {
	const md::ParserOptions opts{};
	EXPECT_FALSE(mdbm_impl::parseReferenceDefinition("[a]: /u \"t\" junk", opts, md::builtinEntityTable()));

	const auto def = mdbm_impl::parseReferenceDefinition("[a]: /u\n\"t\" junk", opts, md::builtinEntityTable());
	ASSERT_TRUE(def);
	EXPECT_EQ(def->consumed, 8u);
	EXPECT_FALSE(def->definition.title);
}

TEST(LinkResolver, DefinitionsNeedALabelAndDestination) {
	const md::ParserOptions opts{};
	EXPECT_FALSE(mdbm_impl::parseReferenceDefinition("[]: /u", opts, md::builtinEntityTable()));
	EXPECT_FALSE(mdbm_impl::parseReferenceDefinition("[a]:", opts, md::builtinEntityTable()));
	EXPECT_FALSE(mdbm_impl::parseReferenceDefinition("[a] /u", opts, md::builtinEntityTable()));
}

TEST(LinkResolver, ReferenceForms) {
	const MDBMNode doc = md::parseDocument("[foo]: /url \"title\"\n\n[foo] [bar][foo] [foo][]");
	EXPECT_EQ(md::treeDump(doc),
		"(document (link_reference_definition label=\"foo\" dest=\"/url\" title=\"title\") (blank_line) "
		"(paragraph (link dest=\"/url\" title=\"title\" (text \"foo\")) (text \" \") "
		"(link dest=\"/url\" title=\"title\" (text \"bar\")) (text \" \") (link dest=\"/url\" title=\"title\" (text \"foo\"))))");
	const MDBMNode& para = doc.at(2);
	EXPECT_EQ(std::get<LinkInfo>(para.at(0).crtrstc).form, LinkInfo::form_e::Shortcut);
	EXPECT_EQ(std::get<LinkInfo>(para.at(2).crtrstc).form, LinkInfo::form_e::Full);
	EXPECT_EQ(std::get<LinkInfo>(para.at(4).crtrstc).form, LinkInfo::form_e::Collapsed);
	EXPECT_EQ(doc.at(0).literal, "[foo]: /url \"title\"");
}

TEST(LinkResolver, FirstDefinitionWins) {
	EXPECT_EQ(dumpOf("[a]: /one\n[a]: /two\n\n[A]"),
		"(document (link_reference_definition label=\"a\" dest=\"/one\") (link_reference_definition label=\"a\" dest=\"/two\") "
		"(blank_line) (paragraph (link dest=\"/one\" (text \"A\"))))");
}

TEST(LinkResolver, ResolutionCanBeDisabled) {
	md::ParserOptions opts{};
	opts.resolveReferences = false;
	EXPECT_EQ(dumpOf("[a]: /one\n\n[a]", opts),
		"(document (link_reference_definition label=\"a\" dest=\"/one\") (blank_line) (paragraph (text \"[a]\")))");
}

TEST(LinkResolver, DefinitionCannotInterruptParagraph) {
	EXPECT_EQ(dumpOf("foo\n[a]: /u\n\n[a]"),
		"(document (paragraph (text \"foo\") (soft_line_break) (text \"[a]: /u\")) (blank_line) (paragraph (text \"[a]\")))");
}

TEST(LinkResolver, UnderlineAfterOnlyDefinitionsIsText) {
	EXPECT_EQ(dumpOf("[a]: /u\n==="),
		"(document (link_reference_definition label=\"a\" dest=\"/u\") (paragraph (text \"===\")))");
}

TEST(LinkResolver, DefinitionLinePositions) {
	const MDBMNode doc = md::parseDocument("[a]:\n/u\n'title'\ntext");
	const MDBMNode& def = doc.at(0);
	EXPECT_EQ(def.lineBegin, 0u);
	EXPECT_EQ(def.lineEnd, 2u);
	EXPECT_EQ(doc.at(1).lineBegin, 3u);
	EXPECT_EQ(md::treeDump(doc.at(1)), "(paragraph (text \"text\"))");
}
