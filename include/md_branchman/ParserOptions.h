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

#ifndef PARSER_OPTIONS_H
#define PARSER_OPTIONS_H
#include <map>
#include <string>
#include <string_view>
#include <optional>
#include <functional>
#include "IntegralTypes.h"
#include "mdbranchman_export.h"

namespace md_branchman {
	/**
	Read-only lookup of named character references. Names are given without
	the leading '&' and trailing ';'.
	*/
	class EntityTable {
	public:
		virtual ~EntityTable() = default;
		virtual auto lookup(std::string_view name) const noexcept -> std::optional<std::string_view> = 0;
	};

	class MapEntityTable : public EntityTable {
	public:
		MapEntityTable() = default;
		MDBRANCHMAN_EXPORT void insert(std::string name, std::string replacement);
		MDBRANCHMAN_EXPORT size_t size() const noexcept;
		MDBRANCHMAN_EXPORT auto lookup(std::string_view name) const noexcept -> std::optional<std::string_view> override;
	private:
		std::map<std::string, std::string, std::less<>> entries_;
	};

	// The common HTML5 names; static for the life of the process.
	MDBRANCHMAN_EXPORT auto builtinEntityTable() noexcept -> const EntityTable&;

	using TraceSink = std::function<void(std::string_view)>;

	struct ParserOptions {
		bool keepBlankLines = true;
		bool resolveReferences = true;
		bool multilineLinkText = true;
		UInt maxDestinationParenDepth = 1;
		UInt maxLinkLabelLength = 999;
		UInt maxNestingDepth = 128;
		// nullptr selects builtinEntityTable()
		const EntityTable* entities = nullptr;
		TraceSink branchTrace;
	};
}

#endif
