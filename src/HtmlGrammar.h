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

#ifndef MD_HTML_GRAMMAR_H
#define MD_HTML_GRAMMAR_H
#include <tao/pegtl.hpp>

// HTML constructs shared by the block classifier and inline raw HTML.
namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct html_ws : one<' ', '\t', '\n'> {};
	struct tag_name : seq<alpha, star<sor<alnum, one<'-'>>>> {};
	struct attribute_name : seq<sor<alpha, one<'_', ':'>>, star<sor<alnum, one<'_', '.', ':', '-'>>>> {};
	struct unquoted_value : plus<not_one<' ', '\t', '\n', '\r', '"', '\'', '=', '<', '>', '`'>> {};
	struct single_quoted_value : seq<one<'\''>, star<not_one<'\''>>, one<'\''>> {};
	struct double_quoted_value : seq<one<'"'>, star<not_one<'"'>>, one<'"'>> {};
	struct attribute_value : sor<unquoted_value, single_quoted_value, double_quoted_value> {};
	struct attribute_value_spec : seq<star<html_ws>, one<'='>, star<html_ws>, attribute_value> {};
	struct attribute : seq<plus<html_ws>, attribute_name, opt<attribute_value_spec>> {};

	struct open_tag : seq<one<'<'>, tag_name, star<attribute>, star<html_ws>, opt<one<'/'>>, one<'>'>> {};
	struct closing_tag : seq<TAO_PEGTL_STRING("</"), tag_name, star<html_ws>, one<'>'>> {};

	struct comment_open : TAO_PEGTL_STRING("<!--") {};
	struct comment_close : TAO_PEGTL_STRING("-->") {};
	struct html_comment : sor<TAO_PEGTL_STRING("<!-->"), TAO_PEGTL_STRING("<!--->"), seq<comment_open, until<comment_close>>> {};

	struct processing_instruction : seq<TAO_PEGTL_STRING("<?"), until<TAO_PEGTL_STRING("?>")>> {};
	struct declaration : seq<TAO_PEGTL_STRING("<!"), alpha, until<one<'>'>>> {};
	struct cdata_open : TAO_PEGTL_STRING("<![CDATA[") {};
	struct cdata_section : seq<cdata_open, until<TAO_PEGTL_STRING("]]>")>> {};

	struct raw_html : sor<open_tag, closing_tag, html_comment, processing_instruction, declaration, cdata_section> {};
}

#endif
