//
// BoundRX: a bounded backtracking matcher for compiled regex programs.
// Copyright (C) 2023, 2024 Michael J. Haertel.
//
// This file is part of BoundRX.
//
// BoundRX is free software; you can redistribute it and/or modify it
// under the terms of the GNU Lesser General Public License as published
// by the Free Software Foundation; either version 3 of the License, or
// (at your option) any later version.
//
// BoundRX is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
// See the GNU Lesser General Public License for more details.
//
// You should have received a copy of the GNU Lesser General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//


#ifndef _BOUNDRX_CONTEXT_H
#define _BOUNDRX_CONTEXT_H

#include <cstddef>
#include <optional>
#include <vector>
#include "literal.h"
#include "program.h"

namespace BoundRX {

// Positional view of the input being searched.  Positions are byte offsets
// in [0, len()]; every element is decoded once up front so the engine can
// look both ways from any position it reaches.
class Context final {
public:
	enum { End = -1 };
	enum class Encoding { Byte, MBtoWC, UTF8 };
private:
	const char *const bp;
	const std::size_t n;
	const Encoding enc;
	std::vector<WChar> cur;			// element beginning at each offset
	std::vector<WChar> before;		// element ending at each offset
	std::vector<unsigned char> width;	// byte length of the element at each offset
public:
	Context(Encoding e, const char *bp, const char *ep);
	Context(Encoding e, const char *bp);
	static Encoding locale_encoding(bool native1b);

	Encoding encoding() const { return enc; }
	std::size_t len() const { return n; }
	const char *data() const { return bp; }
	WChar operator[](std::size_t at) const { return at < n ? cur[at] : (WChar) End; }
	// Offsets inside a multibyte element advance one byte at a time.
	std::size_t next(std::size_t at) const { return at < n && width[at] != 0 ? at + width[at] : at + 1; }
	WChar prev(std::size_t at) const { return at <= n ? before[at] : (WChar) End; }
	bool is_word(WChar wc) const;
	bool is_empty_match(std::size_t at, Look look) const;
	std::optional<std::size_t> prefix_at(const LiteralSearcher &prefixes, std::size_t at) const;
};

}

#endif /* _BOUNDRX_CONTEXT_H */
