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

#include <array>
#include <list>
#include <vector>
#include <string>
#include <string_view>
#include <optional>
#include <algorithm>
#include <iterator>
#include "BlockContext.h"
#include "BranchSet.h"
#include "InlineGrammar.h"
#include "LinkResolver.h"
#include "TextUtil.h"

namespace md = md_branchman;
using md::UInt;
using md::impl::Context;
using type_e = MDBMNode::type_e;

namespace {
	using NodeList = std::list<MDBMNode>;
	using NodeIt = NodeList::iterator;

	struct Delimiter {
		char cc;
		UInt numDelims;
		UInt origDelims;
		NodeIt node;
		bool canOpen;
		bool canClose;
		// stable ordering key; indices shift as delimiters are removed
		UInt seq;
	};

	struct Bracket {
		NodeIt node;
		// delimiters pushed after this bracket have seq >= bottomSeq
		UInt bottomSeq;
		// position of '['
		size_t index;
		bool image;
		bool active;
		bool bracketAfter;
	};

	struct LinkTarget {
		LinkInfo::form_e form;
		std::string destination;
		std::optional<std::string> title;
		size_t end;
	};

	bool isSpecial(const char c) noexcept {
		switch (c) {
		case '\n': case '`': case '\\': case '[': case ']': case '!':
		case '<': case '&': case '*': case '_':
			return true;
		default:
			return false;
		}
	}

	class InlineScanner {
	public:
		InlineScanner(const Context& ctx, MDBMNode& block)
			: ctx_{ ctx }, subject_{ block.literal }, out_{ block.children }, firstLine_{ block.lineBegin }
		{
			for (size_t i = 0; i < subject_.size(); ++i) {
				if (subject_[i] == '\n') {
					newlines_.push_back(i);
				}
			}
		}

		void run() {
			while (pos_ < subject_.size()) {
				parseInline();
			}
			processEmphasis(0);
			mergeText(out_);
		}

	private:
		auto lineAt(const size_t pos) const noexcept -> UInt {
			const auto before = std::lower_bound(newlines_.begin(), newlines_.end(), pos) - newlines_.begin();
			return firstLine_ + static_cast<UInt>(before);
		}

		NodeIt append(const type_e type, const size_t begin, const size_t end, std::string literal) {
			out_.push_back(MDBMNode{ type, false, lineAt(begin), lineAt(end == begin ? begin : end - 1) });
			out_.back().literal = std::move(literal);
			return std::prev(out_.end());
		}

		NodeIt appendText(const size_t begin, const size_t end) {
			return append(type_e::Text, begin, end, std::string{ subject_.substr(begin, end - begin) });
		}

		void parseInline() {
			const char c = subject_[pos_];
			switch (c) {
			case '\n':
				parseNewline();
				break;
			case '\\':
				parseBackslash();
				break;
			case '`':
				parseBackticks();
				break;
			case '*':
			case '_':
				parseDelimiterRun(c);
				break;
			case '[':
				pushBracket(pos_, pos_ + 1, false);
				break;
			case '!':
				if (pos_ + 1 < subject_.size() and subject_[pos_ + 1] == '[') {
					pushBracket(pos_ + 1, pos_ + 2, true);
				}
				else {
					appendText(pos_, pos_ + 1);
					++pos_;
				}
				break;
			case ']':
				parseCloseBracket();
				break;
			case '<':
				parseAngle();
				break;
			case '&':
				parseEntity();
				break;
			default:
			{
				size_t end = pos_ + 1;
				while (end < subject_.size() and not isSpecial(subject_[end])) {
					++end;
				}
				appendText(pos_, end);
				pos_ = end;
				break;
			}
			}
		}

		void skipLeadingBlanks() noexcept {
			while (pos_ < subject_.size() and mdbm_impl::isSpaceOrTab(subject_[pos_])) {
				++pos_;
			}
		}

		void parseNewline() {
			UInt trailing = 0;
			if (not out_.empty() and out_.back().flavor == type_e::Text) {
				std::string& text = out_.back().literal;
				while (not text.empty() and text.back() == ' ') {
					text.pop_back();
					++trailing;
				}
			}
			if (trailing >= 2) {
				append(type_e::HardLineBreak, pos_, pos_ + 1, std::string(trailing, ' ') + "\n")->crtrstc =
					LineBreak{ LineBreak::kind_e::Spaces, trailing };
			}
			else {
				// a single space before the line end is dropped
				append(type_e::SoftLineBreak, pos_, pos_ + 1, "\n");
			}
			++pos_;
			skipLeadingBlanks();
		}

		void parseBackslash() {
			if (pos_ + 1 < subject_.size() and subject_[pos_ + 1] == '\n') {
				append(type_e::HardLineBreak, pos_, pos_ + 2, "\\\n")->crtrstc = LineBreak{ LineBreak::kind_e::Backslash, 0 };
				pos_ += 2;
				skipLeadingBlanks();
			}
			else if (pos_ + 1 < subject_.size() and mdbm_impl::isAsciiPunctuation(subject_[pos_ + 1])) {
				append(type_e::BackslashEscape, pos_, pos_ + 2, std::string(1, subject_[pos_ + 1]));
				pos_ += 2;
			}
			else {
				appendText(pos_, pos_ + 1);
				++pos_;
			}
		}

		auto backtickRun(const size_t from) const noexcept -> size_t {
			size_t end = from;
			while (end < subject_.size() and subject_[end] == '`') {
				++end;
			}
			return end - from;
		}

		void parseBackticks() {
			const size_t start = pos_;
			const size_t n = backtickRun(start);
			const size_t contentStart = start + n;
			size_t i = contentStart;
			while (i < subject_.size()) {
				if (subject_[i] != '`') {
					++i;
					continue;
				}
				const size_t run = backtickRun(i);
				if (run == n) {
					const std::string_view raw = subject_.substr(contentStart, i - contentStart);
					std::string content{ raw };
					std::replace(content.begin(), content.end(), '\n', ' ');
					if (content.size() >= 2 and content.front() == ' ' and content.back() == ' '
						and content.find_first_not_of(' ') != std::string::npos)
					{
						content = content.substr(1, content.size() - 2);
					}
					auto node = append(type_e::CodeSpan, start, i + run, std::move(content));
					node->crtrstc = CodeSpan{ static_cast<uint32_t>(n), std::string{ raw } };
					pos_ = i + run;
					return;
				}
				i += run;
			}
			// no closing run of the same length
			appendText(start, contentStart);
			pos_ = contentStart;
		}

		void parseDelimiterRun(const char cc) {
			const size_t start = pos_;
			size_t end = start;
			while (end < subject_.size() and subject_[end] == cc) {
				++end;
			}
			const char32_t before = mdbm_impl::decodeUtf8Before(subject_, start).value;
			const char32_t after = mdbm_impl::decodeUtf8(subject_, end).value;

			const bool afterIsWhitespace = mdbm_impl::isUnicodeWhitespace(after);
			const bool afterIsPunctuation = mdbm_impl::isUnicodePunctuation(after);
			const bool beforeIsWhitespace = mdbm_impl::isUnicodeWhitespace(before);
			const bool beforeIsPunctuation = mdbm_impl::isUnicodePunctuation(before);

			const bool leftFlanking = not afterIsWhitespace and
				(not afterIsPunctuation or beforeIsWhitespace or beforeIsPunctuation);
			const bool rightFlanking = not beforeIsWhitespace and
				(not beforeIsPunctuation or afterIsWhitespace or afterIsPunctuation);

			bool canOpen = leftFlanking;
			bool canClose = rightFlanking;
			if (cc == '_') {
				canOpen = leftFlanking and (not rightFlanking or beforeIsPunctuation);
				canClose = rightFlanking and (not leftFlanking or afterIsPunctuation);
			}

			const NodeIt node = appendText(start, end);
			if (canOpen or canClose) {
				const UInt count = static_cast<UInt>(end - start);
				delimiters_.push_back(Delimiter{ cc, count, count, node, canOpen, canClose, nextSeq_++ });
			}
			pos_ = end;
		}

		void pushBracket(const size_t index, const size_t end, const bool image) {
			const NodeIt node = appendText(pos_, end);
			if (not brackets_.empty()) {
				brackets_.back().bracketAfter = true;
			}
			brackets_.push_back(Bracket{ node, nextSeq_, index, image, true, false });
			pos_ = end;
		}

		void parseAngle() {
			const std::string_view rest = subject_.substr(pos_);
			if (const auto autolink = mdbm_impl::matchAutolink(rest)) {
				const std::string_view inner = rest.substr(1, autolink->length - 2);
				auto node = append(type_e::Autolink, pos_, pos_ + autolink->length, std::string{ inner });
				node->crtrstc = Autolink{ std::string{ inner }, autolink->isEmail };
				pos_ += autolink->length;
				return;
			}
			if (const size_t length = mdbm_impl::matchRawHtml(rest)) {
				append(type_e::RawHtml, pos_, pos_ + length, std::string{ rest.substr(0, length) });
				pos_ += length;
				return;
			}
			appendText(pos_, pos_ + 1);
			++pos_;
		}

		void parseEntity() {
			if (auto ent = mdbm_impl::matchEntity(subject_.substr(pos_), ctx_.entities())) {
				const type_e type = ent->numeric ? type_e::NumericCharRef : type_e::EntityRef;
				auto node = append(type, pos_, pos_ + ent->length, std::string{ subject_.substr(pos_, ent->length) });
				node->crtrstc = CharRef{ std::move(ent->decoded) };
				pos_ += ent->length;
				return;
			}
			appendText(pos_, pos_ + 1);
			++pos_;
		}

		auto inlineTarget(size_t p) const -> std::optional<LinkTarget> {
			if (p >= subject_.size() or subject_[p] != '(') {
				return std::nullopt;
			}
			p = mdbm_impl::skipSpacesAndNewline(subject_, p + 1);
			const auto dest = mdbm_impl::scanLinkDestination(subject_, p, ctx_.opts.maxDestinationParenDepth);
			if (not dest) {
				return std::nullopt;
			}
			p += dest->length;
			std::optional<std::string> title;
			const size_t beforeTitle = p;
			p = mdbm_impl::skipSpacesAndNewline(subject_, p);
			if (p != beforeTitle) {
				if (const size_t titleLength = mdbm_impl::scanLinkTitle(subject_, p)) {
					title = mdbm_impl::decodeLinkText(subject_.substr(p + 1, titleLength - 2), ctx_.entities());
					p = mdbm_impl::skipSpacesAndNewline(subject_, p + titleLength);
				}
			}
			if (p >= subject_.size() or subject_[p] != ')') {
				return std::nullopt;
			}
			return LinkTarget{ LinkInfo::form_e::Inline,
				mdbm_impl::decodeLinkText(dest->raw, ctx_.entities()), std::move(title), p + 1 };
		}

		auto referenceTarget(const Bracket& opener, const size_t closePos) const -> std::optional<LinkTarget> {
			const size_t p = closePos + 1;
			const size_t n = mdbm_impl::scanLinkLabel(subject_, p, ctx_.opts.maxLinkLabelLength);
			std::string_view label;
			LinkInfo::form_e form = LinkInfo::form_e::Shortcut;
			size_t end = p;
			if (n > 2) {
				label = subject_.substr(p + 1, n - 2);
				form = LinkInfo::form_e::Full;
				end = p + n;
			}
			else if (not opener.bracketAfter) {
				label = subject_.substr(opener.index + 1, closePos - opener.index - 1);
				if (n == 2) {
					form = LinkInfo::form_e::Collapsed;
					end = p + n;
				}
			}
			if (label.empty() or label.size() > ctx_.opts.maxLinkLabelLength) {
				return std::nullopt;
			}
			const auto found = ctx_.refmap.find(md::normalizeLabel(label));
			if (found == ctx_.refmap.end()) {
				return std::nullopt;
			}
			return LinkTarget{ form, found->second.destination, found->second.title, end };
		}

		bool insideImage() const noexcept {
			for (size_t i = 0; i + 1 < brackets_.size(); ++i) {
				if (brackets_[i].image) {
					return true;
				}
			}
			return false;
		}

		/**
		A closing bracket either completes a link or image, or is literal text.
		Both readings are forked; the link reading is killed when no target
		resolves or nesting forbids it.
		*/
		void parseCloseBracket() {
			const size_t closePos = pos_;
			++pos_;
			if (brackets_.empty()) {
				appendText(closePos, pos_);
				return;
			}
			Bracket opener = brackets_.back();
			if (not opener.active) {
				brackets_.pop_back();
				appendText(closePos, pos_);
				return;
			}

			mdbm_impl::BranchSet<std::optional<LinkTarget>> branches{ "link-or-text", lineAt(closePos), ctx_.trace() };
			auto target = inlineTarget(pos_);
			if (not target) {
				target = referenceTarget(opener, closePos);
			}
			auto& link = branches.fork(target, 1, opener.image ? "image" : "link");
			branches.fork(std::nullopt, 0, "text");
			if (not target) {
				branches.kill(link, "no destination or matching definition");
			}
			else if (not opener.image and insideImage()) {
				branches.kill(link, "link inside an image description");
			}
			else if (not ctx_.opts.multilineLinkText and
				subject_.substr(opener.index, closePos - opener.index).find('\n') != std::string_view::npos)
			{
				branches.kill(link, "link text spans lines");
			}
			auto& winner = branches.mergeByPriority();
			brackets_.pop_back();

			if (not winner.state) {
				appendText(closePos, pos_);
				return;
			}
			buildLink(opener, closePos, *winner.state);
		}

		void buildLink(const Bracket& opener, const size_t closePos, LinkTarget& target) {
			processEmphasis(opener.bottomSeq);

			const type_e type = opener.image ? type_e::Image : type_e::Link;
			MDBMNode node{ type, false, opener.node->lineBegin, lineAt(target.end - 1) };
			node.literal = std::string{ subject_.substr(opener.image ? opener.index - 1 : opener.index,
				target.end - (opener.image ? opener.index - 1 : opener.index)) };
			node.crtrstc = LinkInfo{ target.form, std::move(target.destination), std::move(target.title),
				std::string{ subject_.substr(closePos + 1, target.end - closePos - 1) } };

			const NodeIt linkIt = out_.insert(std::next(opener.node), std::move(node));
			linkIt->children.splice(linkIt->children.end(), out_, std::next(linkIt), out_.end());
			out_.erase(opener.node);
			pos_ = target.end;

			if (not opener.image) {
				for (auto& b : brackets_) {
					if (not b.image) {
						b.active = false;
					}
				}
			}
		}

		static auto bottomSlot(const Delimiter& closer) noexcept -> size_t {
			return (closer.cc == '_' ? 6 : 0) + (closer.canOpen ? 3 : 0) + closer.origDelims % 3;
		}

		// Resolves emphasis among the delimiters with seq >= bottomSeq and drops them from the stack.
		void processEmphasis(const UInt bottomSeq) {
			std::array<UInt, 12> openersBottom;
			openersBottom.fill(bottomSeq);

			size_t closerIdx = 0;
			while (closerIdx < delimiters_.size() and delimiters_[closerIdx].seq < bottomSeq) {
				++closerIdx;
			}
			const size_t firstIdx = closerIdx;

			while (closerIdx < delimiters_.size()) {
				Delimiter& closer = delimiters_[closerIdx];
				if (not closer.canClose) {
					++closerIdx;
					continue;
				}
				const UInt bound = openersBottom[bottomSlot(closer)];
				size_t openerIdx = closerIdx;
				bool found = false;
				while (openerIdx > firstIdx and delimiters_[openerIdx - 1].seq >= bound) {
					--openerIdx;
					const Delimiter& candidate = delimiters_[openerIdx];
					if (candidate.cc != closer.cc or not candidate.canOpen) {
						continue;
					}
					const bool oddMatch = (closer.canOpen or candidate.canClose) and closer.origDelims % 3 != 0
						and (candidate.origDelims + closer.origDelims) % 3 == 0;
					if (not oddMatch) {
						found = true;
						break;
					}
				}

				if (not found) {
					openersBottom[bottomSlot(closer)] = closer.seq;
					if (not closer.canOpen) {
						delimiters_.erase(delimiters_.begin() + static_cast<std::ptrdiff_t>(closerIdx));
					}
					else {
						++closerIdx;
					}
					continue;
				}

				Delimiter& opener = delimiters_[openerIdx];
				const UInt smaller = std::min(opener.numDelims, closer.numDelims);
				const UInt use = (smaller >= 2 and smaller % 2 == 0) ? 2 : 1;
				opener.numDelims -= use;
				closer.numDelims -= use;
				opener.node->literal.resize(opener.numDelims);
				closer.node->literal.resize(closer.numDelims);

				MDBMNode emph{ use == 1 ? type_e::Emphasis : type_e::StrongEmphasis, false,
					opener.node->lineBegin, closer.node->lineEnd };
				emph.literal = std::string(use, opener.cc);
				emph.crtrstc = EmphasisInfo{ opener.cc };
				const NodeIt emphIt = out_.insert(std::next(opener.node), std::move(emph));
				emphIt->children.splice(emphIt->children.end(), out_, std::next(emphIt), closer.node);

				// delimiters between the pair now live inside the emphasis node
				delimiters_.erase(delimiters_.begin() + static_cast<std::ptrdiff_t>(openerIdx + 1),
					delimiters_.begin() + static_cast<std::ptrdiff_t>(closerIdx));
				closerIdx = openerIdx + 1;

				if (delimiters_[openerIdx].numDelims == 0) {
					out_.erase(delimiters_[openerIdx].node);
					delimiters_.erase(delimiters_.begin() + static_cast<std::ptrdiff_t>(openerIdx));
					--closerIdx;
				}
				if (delimiters_[closerIdx].numDelims == 0) {
					out_.erase(delimiters_[closerIdx].node);
					delimiters_.erase(delimiters_.begin() + static_cast<std::ptrdiff_t>(closerIdx));
				}
			}

			delimiters_.erase(delimiters_.begin() + static_cast<std::ptrdiff_t>(firstIdx), delimiters_.end());
		}

		static void mergeText(NodeList& nodes) {
			for (auto it = nodes.begin(); it != nodes.end();) {
				if (it->flavor == type_e::Text and it->literal.empty()) {
					it = nodes.erase(it);
					continue;
				}
				if (it->flavor == type_e::Text) {
					auto next = std::next(it);
					while (next != nodes.end() and next->flavor == type_e::Text) {
						it->literal += next->literal;
						it->lineEnd = next->lineEnd;
						next = nodes.erase(next);
					}
				}
				else {
					mergeText(it->children);
				}
				++it;
			}
		}

		const Context& ctx_;
		std::string_view subject_;
		NodeList& out_;
		md::UInt firstLine_;
		std::vector<size_t> newlines_;
		size_t pos_ = 0;
		std::vector<Delimiter> delimiters_;
		std::vector<Bracket> brackets_;
		UInt nextSeq_ = 0;
	};
}

void mdbm_impl::parseInlines(const Context& ctx, MDBMNode& block) {
	block.children.clear();
	InlineScanner scanner{ ctx, block };
	scanner.run();
}

void mdbm_impl::parseAllInlines(const Context& ctx, MDBMNode& node) {
	for (auto& child : node.children) {
		if (child.hasInlineContent()) {
			parseInlines(ctx, child);
		}
		else if (child.isContainer()) {
			parseAllInlines(ctx, child);
		}
	}
}
