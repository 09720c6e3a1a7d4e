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

// MDBranchMan.h : structural markdown tree and the line-driven parser.
#ifndef MD_BRANCH_MAN_H
#define MD_BRANCH_MAN_H
#include <list>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include "BlockInfoTags.h"
#include "IntegralTypes.h"
#include "ParserOptions.h"
#include "Errors.h"
#include "mdbranchman_export.h"

namespace md_branchman {
	class Parser;
}

struct MDBMNode {
	enum class type_e : uint8_t {
		Document,
		Paragraph,
		ATXHeading,
		SetextHeading,
		IndentedCode,
		FencedCode,
		Quote,
		List,
		ListItem,
		ThematicBreak,
		HtmlBlock,
		LinkRefDef,
		BlankLine,
		Text,
		SoftLineBreak,
		HardLineBreak,
		CodeSpan,
		Emphasis,
		StrongEmphasis,
		Link,
		Image,
		Autolink,
		RawHtml,
		EntityRef,
		NumericCharRef,
		BackslashEscape
	};
	inline bool isContainer() const noexcept {
		return (
			flavor == type_e::Document or
			flavor == type_e::Quote or
			flavor == type_e::List or
			flavor == type_e::ListItem);
	}
	inline bool isInline() const noexcept {
		return flavor >= type_e::Text;
	}
	inline bool isLeaf() const noexcept {
		return not isContainer() and not isInline();
	}
	// blocks whose literal is handed to the inline scanner
	inline bool hasInlineContent() const noexcept {
		return (
			flavor == type_e::Paragraph or
			flavor == type_e::ATXHeading or
			flavor == type_e::SetextHeading);
	}
	MDBRANCHMAN_EXPORT bool endsWithBlankLine() const noexcept;
	MDBRANCHMAN_EXPORT const MDBMNode& at(size_t i) const;

	type_e flavor;
	bool isOpen;
	md_branchman::UInt lineBegin;
	md_branchman::UInt lineEnd;

	// leaf blocks: content with container prefixes removed; inlines: source text,
	// except the escaped character, code span content and autolink address
	std::string literal;
	std::list<MDBMNode> children;

	std::variant<std::monostate, ListInfo, ListItemInfo, FencedCode, Heading, HtmlBlock,
		LinkRefDef, LinkInfo, Autolink, CharRef, CodeSpan, EmphasisInfo, LineBreak> crtrstc;

	/**
	Depth-first walk. Every node is visited twice, once on the way in and once
	when retracting; isRetracting() tells the two apart. Leaf nodes are only
	visited on the way in.
	*/
	class public_iterator;
	class public_iterator {
	public:
		using self_type = MDBMNode::public_iterator;
		using value_type = const MDBMNode;
		using pointer_type = const MDBMNode*;
		using reference = const MDBMNode&;

		public_iterator(pointer_type ptr) noexcept : _retracting{ false }, _valPtr{ ptr }, _root{ ptr } {}
		public_iterator() noexcept : _retracting{ false }, _valPtr{ nullptr } {}

		reference operator*() const noexcept { return std::holds_alternative<pointer_type>(_valPtr) ? *std::get<0>(_valPtr) : *std::get<1>(_valPtr); }
		pointer_type operator->() const noexcept { return std::holds_alternative<pointer_type>(_valPtr) ? std::get<0>(_valPtr) : &*std::get<1>(_valPtr); }

		MDBRANCHMAN_EXPORT self_type& operator++() noexcept;
		MDBRANCHMAN_EXPORT self_type operator++(int) noexcept;

		bool isRetracting() const noexcept { return _retracting; }
		size_t depth() const noexcept { return _parents.size(); }

		bool operator==(const self_type& rhs) const { return this->_valPtr == rhs._valPtr and this->_retracting == rhs._retracting and this->_parents == rhs._parents; }
		bool operator!=(const self_type& rhs) const { return !operator==(rhs); }

	private:
		using storage_it_t = std::list<MDBMNode>::const_iterator;

		bool _retracting;
		std::variant<pointer_type, storage_it_t> _valPtr{};
		std::vector<storage_it_t> _parents;
		pointer_type _root{};
	};
};

namespace md_branchman {
	constexpr size_t NPOS = static_cast<size_t>(-1);
	namespace impl {
		struct Context;
	}

	class Parser {
	public:
		Parser(const Parser&) = delete;
		MDBRANCHMAN_EXPORT Parser(Parser&& o) noexcept;

		MDBRANCHMAN_EXPORT Parser();
		MDBRANCHMAN_EXPORT explicit Parser(ParserOptions opts);
		MDBRANCHMAN_EXPORT Parser(const char* begin, const char* end, ParserOptions opts = {});
		MDBRANCHMAN_EXPORT virtual ~Parser();

		// Each call consumes one physical line; false once the source is exhausted.
		MDBRANCHMAN_EXPORT bool processLine(std::istream& in);
		MDBRANCHMAN_EXPORT bool processLine(const char* data, const size_t len);
		MDBRANCHMAN_EXPORT bool processLine();

		MDBRANCHMAN_EXPORT void finalizeDocument();

		MDBRANCHMAN_EXPORT const MDBMNode& document() const noexcept;
		MDBRANCHMAN_EXPORT MDBMNode takeDocument();

		MDBRANCHMAN_EXPORT MDBMNode::public_iterator begin() const noexcept;
		MDBRANCHMAN_EXPORT MDBMNode::public_iterator end() const noexcept;
	private:
		impl::Context* ctx_;
	};

	MDBRANCHMAN_EXPORT auto parseDocument(std::string_view text, const ParserOptions& opts = {}) -> MDBMNode;
	MDBRANCHMAN_EXPORT auto parseDocument(std::istream& in, const ParserOptions& opts = {}) -> MDBMNode;

	// Trimmed, inner whitespace collapsed to one space, case folded.
	MDBRANCHMAN_EXPORT auto normalizeLabel(std::string_view label) -> std::string;

	MDBRANCHMAN_EXPORT bool markdownExport(const MDBMNode& node, std::ostream& out);
	MDBRANCHMAN_EXPORT auto mdToMarkdown(std::string_view text, const ParserOptions& opts = {}) -> std::string;

	struct TreeDumpOptions {
		bool includeBlankLines = true;
		bool includePositions = false;
	};
	MDBRANCHMAN_EXPORT auto treeDump(const MDBMNode& node, const TreeDumpOptions& opts = {}) -> std::string;
	MDBRANCHMAN_EXPORT auto nodeTypeName(MDBMNode::type_e type) noexcept -> std::string_view;
}

#endif
