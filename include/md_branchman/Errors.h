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

#ifndef MD_BRANCH_ERRORS_H
#define MD_BRANCH_ERRORS_H
#include <string>
#include <stdexcept>
#include "IntegralTypes.h"
#include "mdbranchman_export.h"

namespace md_branchman {
	/**
	Raised when a merge point ends with zero or several surviving branches, or
	when the open-block stack is asked to hold a child under a leaf. Neither can
	happen for well-formed grammar logic; malformed markdown never raises.
	*/
	class GrammarInvariantError : public std::logic_error {
	public:
		MDBRANCHMAN_EXPORT GrammarInvariantError(std::string site, UInt line, const std::string& detail);

		const std::string& site() const noexcept { return site_; }
		UInt line() const noexcept { return line_; }
	private:
		std::string site_;
		UInt line_;
	};
}

#endif
