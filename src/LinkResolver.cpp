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
#include "BlockContext.h"
#include "LinkResolver.h"
#include "InlineGrammar.h"
#include "TextUtil.h"

namespace md = md_branchman;
using md::UInt;
using md::impl::Context;
using type_e = MDBMNode::type_e;

auto mdbm_impl::scanLinkLabel(std::string_view s, size_t pos, const UInt maxLength) noexcept -> size_t {
	if (pos >= s.size() or s[pos] != '[') {
		return 0;
	}
	for (size_t i = pos + 1; i < s.size(); ++i) {
		const char c = s[i];
		if (c == '\\' and i + 1 < s.size() and s[i + 1] != '\n') {
			++i;
		}
		else if (c == '[') {
			return 0;
		}
		else if (c == ']') {
			return (i - pos - 1) <= maxLength ? i + 1 - pos : 0;
		}
		if (i - pos - 1 > maxLength) {
			return 0;
		}
	}
	return 0;
}

auto mdbm_impl::scanLinkDestination(std::string_view s, size_t pos, const UInt maxParenDepth) noexcept
	-> std::optional<DestinationMatch>
{
	if (pos < s.size() and s[pos] == '<') {
		for (size_t i = pos + 1; i < s.size(); ++i) {
			const char c = s[i];
			if (c == '\\' and i + 1 < s.size() and isAsciiPunctuation(s[i + 1])) {
				++i;
			}
			else if (c == '>') {
				return DestinationMatch{ i + 1 - pos, s.substr(pos + 1, i - pos - 1) };
			}
			else if (c == '<' or c == '\n') {
				return std::nullopt;
			}
		}
		return std::nullopt;
	}

	UInt depth = 0;
	size_t i = pos;
	while (i < s.size()) {
		const auto c = static_cast<unsigned char>(s[i]);
		if (c == '\\' and i + 1 < s.size() and isAsciiPunctuation(s[i + 1])) {
			i += 2;
			continue;
		}
		if (c == '(') {
			if (++depth > maxParenDepth) {
				return std::nullopt;
			}
		}
		else if (c == ')') {
			if (depth == 0) {
				break;
			}
			--depth;
		}
		else if (c <= 0x20 or c == 0x7f) {
			break;
		}
		++i;
	}
	if (i == pos and (i >= s.size() or s[i] != ')')) {
		return std::nullopt;
	}
	if (depth != 0) {
		return std::nullopt;
	}
	return DestinationMatch{ i - pos, s.substr(pos, i - pos) };
}

auto mdbm_impl::scanLinkTitle(std::string_view s, size_t pos) noexcept -> size_t {
	if (pos >= s.size()) {
		return 0;
	}
	char closer = 0;
	switch (s[pos]) {
	case '"': closer = '"'; break;
	case '\'': closer = '\''; break;
	case '(': closer = ')'; break;
	default: return 0;
	}
	for (size_t i = pos + 1; i < s.size(); ++i) {
		const char c = s[i];
		if (c == '\\' and i + 1 < s.size() and isAsciiPunctuation(s[i + 1])) {
			++i;
		}
		else if (c == closer) {
			return i + 1 - pos;
		}
		else if (closer == ')' and c == '(') {
			return 0;
		}
		else if (c == '\n') {
			size_t j = i + 1;
			while (j < s.size() and isSpaceOrTab(s[j])) {
				++j;
			}
			if (j >= s.size() or s[j] == '\n') {
				return 0;
			}
		}
	}
	return 0;
}

auto mdbm_impl::skipSpacesAndNewline(std::string_view s, size_t pos) noexcept -> size_t {
	while (pos < s.size() and isSpaceOrTab(s[pos])) {
		++pos;
	}
	if (pos < s.size() and s[pos] == '\n') {
		++pos;
		while (pos < s.size() and isSpaceOrTab(s[pos])) {
			++pos;
		}
	}
	return pos;
}

auto mdbm_impl::decodeLinkText(std::string_view s, const md::EntityTable& entities) -> std::string {
	std::string out;
	out.reserve(s.size());
	for (size_t i = 0; i < s.size();) {
		const char c = s[i];
		if (c == '\\' and i + 1 < s.size() and isAsciiPunctuation(s[i + 1])) {
			out.push_back(s[i + 1]);
			i += 2;
			continue;
		}
		if (c == '&') {
			if (auto ent = matchEntity(s.substr(i), entities)) {
				out.append(ent->decoded);
				i += ent->length;
				continue;
			}
		}
		out.push_back(c);
		++i;
	}
	return out;
}

auto mdbm_impl::parseReferenceDefinition(std::string_view text, const md::ParserOptions& opts, const md::EntityTable& entities)
	-> std::optional<ReferenceDefinitionMatch>
{
	const size_t labelLength = scanLinkLabel(text, 0, opts.maxLinkLabelLength);
	if (labelLength == 0 or labelLength >= text.size() or text[labelLength] != ':') {
		return std::nullopt;
	}
	const std::string label = md::normalizeLabel(text.substr(1, labelLength - 2));
	if (label.empty()) {
		return std::nullopt;
	}

	size_t pos = skipSpacesAndNewline(text, labelLength + 1);
	const auto dest = scanLinkDestination(text, pos, opts.maxDestinationParenDepth);
	if (not dest) {
		return std::nullopt;
	}
	pos += dest->length;

	auto atLineEnd = [&text](size_t p) -> std::optional<size_t> {
		while (p < text.size() and isSpaceOrTab(text[p])) {
			++p;
		}
		if (p >= text.size()) {
			return p;
		}
		if (text[p] == '\n') {
			return p + 1;
		}
		return std::nullopt;
	};

	const size_t beforeTitle = pos;
	const size_t titleStart = skipSpacesAndNewline(text, pos);
	size_t titleLength = titleStart != beforeTitle ? scanLinkTitle(text, titleStart) : 0;
	std::optional<size_t> end;
	if (titleLength != 0) {
		end = atLineEnd(titleStart + titleLength);
		if (not end) {
			// the title was not alone on its line; the definition may still end at the destination
			titleLength = 0;
		}
	}
	if (titleLength == 0) {
		end = atLineEnd(beforeTitle);
	}
	if (not end) {
		return std::nullopt;
	}

	ReferenceDefinitionMatch match{};
	match.definition.label = label;
	match.definition.destination = decodeLinkText(dest->raw, entities);
	if (titleLength != 0) {
		match.definition.title = decodeLinkText(text.substr(titleStart + 1, titleLength - 2), entities);
	}
	match.consumed = *end;
	return match;
}

namespace {
	void collectFrom(Context& ctx, const MDBMNode& node) {
		for (const auto& child : node.children) {
			if (child.flavor == type_e::LinkRefDef) {
				const auto& def = std::get<LinkRefDef>(child.crtrstc);
				ctx.refmap.emplace(def.label, def);
			}
			else if (child.isContainer()) {
				collectFrom(ctx, child);
			}
		}
	}
}

void mdbm_impl::collectReferenceDefinitions(Context& ctx) {
	ctx.refmap.clear();
	if (ctx.opts.resolveReferences) {
		collectFrom(ctx, ctx.document);
	}
}

auto md_branchman::normalizeLabel(std::string_view label) -> std::string {
	std::string collapsed;
	collapsed.reserve(label.size());
	bool pendingSpace = false;
	for (const char c : mdbm_impl::trimSpaces(label)) {
		if (c == ' ' or c == '\t' or c == '\n' or c == '\r') {
			pendingSpace = true;
			continue;
		}
		if (pendingSpace) {
			collapsed.push_back(' ');
			pendingSpace = false;
		}
		collapsed.push_back(c);
	}
	return mdbm_impl::caseFold(collapsed);
}
