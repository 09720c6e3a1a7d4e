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

#ifndef MD_BLOCK_CONTEXT_H
#define MD_BLOCK_CONTEXT_H
#include <map>
#include <algorithm>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include "md_branchman/MDBranchMan.h"
#include "MDBranchImpl.h"

namespace md_branchman {
	namespace impl {
		/**
		Column-aware cursor over one physical line. Tabs advance to the next
		multiple of TAB_STOP; a tab that a container prefix only partly used
		leaves partiallyConsumedTab set so the remaining columns can be
		re-emitted as spaces.
		*/
		struct LineState {
			std::string_view line;
			UInt number;
			size_t offset = 0;
			UInt column = 0;
			size_t nextNonspace = 0;
			UInt nextNonspaceColumn = 0;
			UInt indent = 0;
			bool blank = false;
			bool partiallyConsumedTab = false;

			char peek(const size_t pos) const noexcept { return pos < line.size() ? line[pos] : '\0'; }
			bool indented() const noexcept { return indent >= mdbm_impl::CODE_INDENT; }
			auto rest() const noexcept -> std::string_view { return line.substr(std::min(nextNonspace, line.size())); }

			void findNextNonspace() noexcept;
			void advanceOffset(UInt count, const bool columns) noexcept;
			void advanceNextNonspace() noexcept;
		};

		struct OpenBlock {
			MDBMNode* node;
			std::string content;
		};

		struct Context {
			ParserOptions opts;
			MDBMNode document;
			// outermost first; stack.front() is always the document
			std::vector<OpenBlock> stack;
			UInt lineNumber = 0;
			bool finalized = false;

			const char* srcCur = nullptr;
			const char* srcEnd = nullptr;

			// normalized label -> first definition
			std::map<std::string, LinkRefDef, std::less<>> refmap;

			const EntityTable& entities() const noexcept {
				return opts.entities ? *opts.entities : builtinEntityTable();
			}
			const TraceSink* trace() const noexcept {
				return opts.branchTrace ? &opts.branchTrace : nullptr;
			}
			OpenBlock& tip() noexcept { return stack.back(); }
			const OpenBlock& tip() const noexcept { return stack.back(); }
		};
	}
}

namespace mdbm_impl {
	namespace md = md_branchman;

	enum class opener_e : uint8_t {
		None,
		Blank,
		ThematicBreak,
		ATXHeading,
		FencedCode,
		Quote,
		ListItem,
		IndentedCode,
		HtmlBlock,
		SetextHeading
	};

	struct OpenerContext {
		bool containerIsParagraph;
		bool tipIsParagraph;
		// the open paragraph when containerIsParagraph, for setext checks
		const md::impl::OpenBlock* paragraph;
		md::UInt depth;
	};

	struct ListItemStart {
		ListInfo list;
		ListItemInfo item;
		bool blankItem;
	};

	struct OpenerProbe {
		opener_e kind;
		Heading heading;
		FencedCode fence;
		ListItemStart listItem;
		uint8_t htmlRule;
		// heading content or the thematic break line
		std::string_view text;
	};

	// Block Matcher
	void incorporateLine(md::impl::Context& ctx, std::string_view line);
	auto containerDepth(const md::impl::Context& ctx, const size_t containerIdx) noexcept -> md::UInt;
	void closeAllBlocks(md::impl::Context& ctx);
	auto detectOpener(const md::impl::Context& ctx, md::impl::LineState& ls, const OpenerContext& octx) -> OpenerProbe;

	// Paragraph Continuation Resolver
	enum class continuation_e : uint8_t {
		Continuation, Close
	};
	auto resolveParagraphNewline(const md::impl::Context& ctx, const md::impl::LineState& ls,
		const size_t containerIdx, const bool allMatched) -> continuation_e;
	bool paragraphHasContent(const md::impl::Context& ctx, std::string_view content);
	// Moves leading definitions of a closing paragraph into LinkRefDef siblings placed before it.
	auto extractReferenceDefinitions(md::impl::Context& ctx, MDBMNode& parent, MDBMNode& paragraph, std::string_view content) -> std::string;

	// List Item Tracker
	auto parseListMarker(md::impl::LineState& ls, const bool interruptsParagraph) noexcept -> std::optional<ListItemStart>;
	bool listsMatch(const ListInfo& a, const ListInfo& b) noexcept;
	bool matchListItem(md::impl::LineState& ls, const MDBMNode& item) noexcept;
	void finalizeListItem(MDBMNode& list, MDBMNode& item);
	void finalizeList(MDBMNode& parent, MDBMNode& list);

	// Link/Image Reference Resolver, block side
	struct ReferenceDefinitionMatch {
		LinkRefDef definition;
		size_t consumed;
	};
	auto parseReferenceDefinition(std::string_view text, const md::ParserOptions& opts, const md::EntityTable& entities) -> std::optional<ReferenceDefinitionMatch>;
	void collectReferenceDefinitions(md::impl::Context& ctx);

	// Inline Delimiter Scanner
	void parseInlines(const md::impl::Context& ctx, MDBMNode& block);
	void parseAllInlines(const md::impl::Context& ctx, MDBMNode& node);
}

#endif
