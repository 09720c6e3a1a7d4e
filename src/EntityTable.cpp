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
#include <utility>
#include "md_branchman/ParserOptions.h"

namespace md = md_branchman;

namespace {
	struct BuiltinEntity {
		const char* name;
		const char* text;
	};

	const BuiltinEntity builtinEntities[] = {
		{ "AElig", u8"\u00C6" },
		{ "Aacute", u8"\u00C1" },
		{ "Acirc", u8"\u00C2" },
		{ "Agrave", u8"\u00C0" },
		{ "Alpha", u8"\u0391" },
		{ "Aring", u8"\u00C5" },
		{ "Atilde", u8"\u00C3" },
		{ "Auml", u8"\u00C4" },
		{ "Beta", u8"\u0392" },
		{ "Ccedil", u8"\u00C7" },
		{ "Chi", u8"\u03A7" },
		{ "ClockwiseContourIntegral", u8"\u2232" },
		{ "Dagger", u8"\u2021" },
		{ "Dcaron", u8"\u010E" },
		{ "Delta", u8"\u0394" },
		{ "DifferentialD", u8"\u2146" },
		{ "ETH", u8"\u00D0" },
		{ "Eacute", u8"\u00C9" },
		{ "Ecirc", u8"\u00CA" },
		{ "Egrave", u8"\u00C8" },
		{ "Epsilon", u8"\u0395" },
		{ "Eta", u8"\u0397" },
		{ "Euml", u8"\u00CB" },
		{ "Gamma", u8"\u0393" },
		{ "HilbertSpace", u8"\u210B" },
		{ "Iacute", u8"\u00CD" },
		{ "Icirc", u8"\u00CE" },
		{ "Igrave", u8"\u00CC" },
		{ "Iota", u8"\u0399" },
		{ "Iuml", u8"\u00CF" },
		{ "Kappa", u8"\u039A" },
		{ "Lambda", u8"\u039B" },
		{ "Mu", u8"\u039C" },
		{ "NewLine", "\n" },
		{ "Ntilde", u8"\u00D1" },
		{ "Nu", u8"\u039D" },
		{ "OElig", u8"\u0152" },
		{ "Oacute", u8"\u00D3" },
		{ "Ocirc", u8"\u00D4" },
		{ "Ograve", u8"\u00D2" },
		{ "Omega", u8"\u03A9" },
		{ "Omicron", u8"\u039F" },
		{ "Oslash", u8"\u00D8" },
		{ "Otilde", u8"\u00D5" },
		{ "Ouml", u8"\u00D6" },
		{ "Phi", u8"\u03A6" },
		{ "Pi", u8"\u03A0" },
		{ "Prime", u8"\u2033" },
		{ "Psi", u8"\u03A8" },
		{ "Rho", u8"\u03A1" },
		{ "Scaron", u8"\u0160" },
		{ "Sigma", u8"\u03A3" },
		{ "THORN", u8"\u00DE" },
		{ "Tab", "\t" },
		{ "Tau", u8"\u03A4" },
		{ "Theta", u8"\u0398" },
		{ "Uacute", u8"\u00DA" },
		{ "Ucirc", u8"\u00DB" },
		{ "Ugrave", u8"\u00D9" },
		{ "Upsilon", u8"\u03A5" },
		{ "Uuml", u8"\u00DC" },
		{ "Xi", u8"\u039E" },
		{ "Yacute", u8"\u00DD" },
		{ "Yuml", u8"\u0178" },
		{ "Zeta", u8"\u0396" },
		{ "aacute", u8"\u00E1" },
		{ "acirc", u8"\u00E2" },
		{ "acute", u8"\u00B4" },
		{ "aelig", u8"\u00E6" },
		{ "agrave", u8"\u00E0" },
		{ "alefsym", u8"\u2135" },
		{ "alpha", u8"\u03B1" },
		{ "amp", "&" },
		{ "and", u8"\u2227" },
		{ "ang", u8"\u2220" },
		{ "apos", "'" },
		{ "aring", u8"\u00E5" },
		{ "ast", "*" },
		{ "asymp", u8"\u2248" },
		{ "atilde", u8"\u00E3" },
		{ "auml", u8"\u00E4" },
		{ "bdquo", u8"\u201E" },
		{ "beta", u8"\u03B2" },
		{ "brvbar", u8"\u00A6" },
		{ "bsol", "\\" },
		{ "bull", u8"\u2022" },
		{ "cap", u8"\u2229" },
		{ "ccedil", u8"\u00E7" },
		{ "cedil", u8"\u00B8" },
		{ "cent", u8"\u00A2" },
		{ "chi", u8"\u03C7" },
		{ "circ", u8"\u02C6" },
		{ "clubs", u8"\u2663" },
		{ "colon", ":" },
		{ "comma", "," },
		{ "commat", "@" },
		{ "cong", u8"\u2245" },
		{ "copy", u8"\u00A9" },
		{ "crarr", u8"\u21B5" },
		{ "cup", u8"\u222A" },
		{ "curren", u8"\u00A4" },
		{ "dArr", u8"\u21D3" },
		{ "dagger", u8"\u2020" },
		{ "darr", u8"\u2193" },
		{ "deg", u8"\u00B0" },
		{ "delta", u8"\u03B4" },
		{ "diams", u8"\u2666" },
		{ "divide", u8"\u00F7" },
		{ "dollar", "$" },
		{ "eacute", u8"\u00E9" },
		{ "ecirc", u8"\u00EA" },
		{ "egrave", u8"\u00E8" },
		{ "empty", u8"\u2205" },
		{ "emsp", u8"\u2003" },
		{ "ensp", u8"\u2002" },
		{ "epsilon", u8"\u03B5" },
		{ "equals", "=" },
		{ "equiv", u8"\u2261" },
		{ "eta", u8"\u03B7" },
		{ "eth", u8"\u00F0" },
		{ "euml", u8"\u00EB" },
		{ "euro", u8"\u20AC" },
		{ "excl", "!" },
		{ "exist", u8"\u2203" },
		{ "fnof", u8"\u0192" },
		{ "forall", u8"\u2200" },
		{ "frac12", u8"\u00BD" },
		{ "frac14", u8"\u00BC" },
		{ "frac34", u8"\u00BE" },
		{ "frasl", u8"\u2044" },
		{ "gamma", u8"\u03B3" },
		{ "ge", u8"\u2265" },
		{ "grave", "`" },
		{ "gt", ">" },
		{ "hArr", u8"\u21D4" },
		{ "harr", u8"\u2194" },
		{ "hearts", u8"\u2665" },
		{ "hellip", u8"\u2026" },
		{ "iacute", u8"\u00ED" },
		{ "icirc", u8"\u00EE" },
		{ "iexcl", u8"\u00A1" },
		{ "igrave", u8"\u00EC" },
		{ "image", u8"\u2111" },
		{ "infin", u8"\u221E" },
		{ "int", u8"\u222B" },
		{ "iota", u8"\u03B9" },
		{ "iquest", u8"\u00BF" },
		{ "isin", u8"\u2208" },
		{ "iuml", u8"\u00EF" },
		{ "kappa", u8"\u03BA" },
		{ "lArr", u8"\u21D0" },
		{ "lambda", u8"\u03BB" },
		{ "lang", u8"\u27E8" },
		{ "laquo", u8"\u00AB" },
		{ "larr", u8"\u2190" },
		{ "lcub", "{" },
		{ "lceil", u8"\u2308" },
		{ "ldquo", u8"\u201C" },
		{ "le", u8"\u2264" },
		{ "lfloor", u8"\u230A" },
		{ "lowast", u8"\u2217" },
		{ "lowbar", "_" },
		{ "loz", u8"\u25CA" },
		{ "lpar", "(" },
		{ "lrm", u8"\u200E" },
		{ "lsaquo", u8"\u2039" },
		{ "lsqb", "[" },
		{ "lsquo", u8"\u2018" },
		{ "lt", "<" },
		{ "macr", u8"\u00AF" },
		{ "mdash", u8"\u2014" },
		{ "micro", u8"\u00B5" },
		{ "middot", u8"\u00B7" },
		{ "minus", u8"\u2212" },
		{ "mu", u8"\u03BC" },
		{ "nabla", u8"\u2207" },
		{ "nbsp", u8"\u00A0" },
		{ "ndash", u8"\u2013" },
		{ "ne", u8"\u2260" },
		{ "ni", u8"\u220B" },
		{ "not", u8"\u00AC" },
		{ "notin", u8"\u2209" },
		{ "nsub", u8"\u2284" },
		{ "ntilde", u8"\u00F1" },
		{ "nu", u8"\u03BD" },
		{ "num", "#" },
		{ "oacute", u8"\u00F3" },
		{ "ocirc", u8"\u00F4" },
		{ "oelig", u8"\u0153" },
		{ "ograve", u8"\u00F2" },
		{ "oline", u8"\u203E" },
		{ "omega", u8"\u03C9" },
		{ "omicron", u8"\u03BF" },
		{ "oplus", u8"\u2295" },
		{ "or", u8"\u2228" },
		{ "ordf", u8"\u00AA" },
		{ "ordm", u8"\u00BA" },
		{ "oslash", u8"\u00F8" },
		{ "otilde", u8"\u00F5" },
		{ "otimes", u8"\u2297" },
		{ "ouml", u8"\u00F6" },
		{ "para", u8"\u00B6" },
		{ "part", u8"\u2202" },
		{ "percnt", "%" },
		{ "period", "." },
		{ "permil", u8"\u2030" },
		{ "perp", u8"\u22A5" },
		{ "phi", u8"\u03C6" },
		{ "pi", u8"\u03C0" },
		{ "piv", u8"\u03D6" },
		{ "plus", "+" },
		{ "plusmn", u8"\u00B1" },
		{ "pound", u8"\u00A3" },
		{ "prime", u8"\u2032" },
		{ "prod", u8"\u220F" },
		{ "prop", u8"\u221D" },
		{ "psi", u8"\u03C8" },
		{ "quest", "?" },
		{ "quot", "\"" },
		{ "rArr", u8"\u21D2" },
		{ "radic", u8"\u221A" },
		{ "rang", u8"\u27E9" },
		{ "raquo", u8"\u00BB" },
		{ "rarr", u8"\u2192" },
		{ "rcub", "}" },
		{ "rceil", u8"\u2309" },
		{ "rdquo", u8"\u201D" },
		{ "real", u8"\u211C" },
		{ "reg", u8"\u00AE" },
		{ "rfloor", u8"\u230B" },
		{ "rho", u8"\u03C1" },
		{ "rlm", u8"\u200F" },
		{ "rpar", ")" },
		{ "rsaquo", u8"\u203A" },
		{ "rsqb", "]" },
		{ "rsquo", u8"\u2019" },
		{ "sbquo", u8"\u201A" },
		{ "scaron", u8"\u0161" },
		{ "sdot", u8"\u22C5" },
		{ "sect", u8"\u00A7" },
		{ "semi", ";" },
		{ "shy", u8"\u00AD" },
		{ "sigma", u8"\u03C3" },
		{ "sigmaf", u8"\u03C2" },
		{ "sim", u8"\u223C" },
		{ "sol", "/" },
		{ "spades", u8"\u2660" },
		{ "sub", u8"\u2282" },
		{ "sube", u8"\u2286" },
		{ "sum", u8"\u2211" },
		{ "sup", u8"\u2283" },
		{ "sup1", u8"\u00B9" },
		{ "sup2", u8"\u00B2" },
		{ "sup3", u8"\u00B3" },
		{ "supe", u8"\u2287" },
		{ "szlig", u8"\u00DF" },
		{ "tau", u8"\u03C4" },
		{ "there4", u8"\u2234" },
		{ "theta", u8"\u03B8" },
		{ "thetasym", u8"\u03D1" },
		{ "thinsp", u8"\u2009" },
		{ "thorn", u8"\u00FE" },
		{ "tilde", u8"\u02DC" },
		{ "times", u8"\u00D7" },
		{ "trade", u8"\u2122" },
		{ "uArr", u8"\u21D1" },
		{ "uacute", u8"\u00FA" },
		{ "uarr", u8"\u2191" },
		{ "ucirc", u8"\u00FB" },
		{ "ugrave", u8"\u00F9" },
		{ "uml", u8"\u00A8" },
		{ "upsih", u8"\u03D2" },
		{ "upsilon", u8"\u03C5" },
		{ "uuml", u8"\u00FC" },
		{ "verbar", "|" },
		{ "weierp", u8"\u2118" },
		{ "xi", u8"\u03BE" },
		{ "yacute", u8"\u00FD" },
		{ "yen", u8"\u00A5" },
		{ "yuml", u8"\u00FF" },
		{ "zeta", u8"\u03B6" },
		{ "zwj", u8"\u200D" },
		{ "zwnj", u8"\u200C" },
		{ "ngE", u8"\u2267\u0338" },
	};
}

void md::MapEntityTable::insert(std::string name, std::string replacement) {
	entries_.insert_or_assign(std::move(name), std::move(replacement));
}

size_t md::MapEntityTable::size() const noexcept {
	return entries_.size();
}

auto md::MapEntityTable::lookup(std::string_view name) const noexcept -> std::optional<std::string_view> {
	const auto found = entries_.find(name);
	if (found == entries_.end()) {
		return std::nullopt;
	}
	return std::string_view{ found->second };
}

auto md::builtinEntityTable() noexcept -> const EntityTable& {
	static const MapEntityTable table = [] {
		MapEntityTable t;
		for (const auto& e : builtinEntities) {
			t.insert(e.name, e.text);
		}
		return t;
	}();
	return table;
}
