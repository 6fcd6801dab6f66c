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

#ifndef _BOUNDRX_LITERAL_H
#define _BOUNDRX_LITERAL_H

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace BoundRX {

// A possibly empty set of literals, one of which must begin every match.
// Used to skip over text that cannot start a match.
class LiteralSearcher final {
	std::vector<std::string> lits;
public:
	LiteralSearcher() = default;
	bool empty() const { return lits.empty(); }
	std::size_t size() const { return lits.size(); }
	const std::string &operator[](std::size_t i) const { return lits[i]; }
	// Empty literals are ignored: they would match everywhere.
	LiteralSearcher &add(std::string lit);
	// Leftmost occurrence of any literal in [bp, ep), as offsets from bp.
	// On a tie the literal added first wins.
	std::optional<std::pair<std::size_t, std::size_t>> find(const char *bp, const char *ep) const;
	std::size_t approximate_size() const;
};

}

#endif /* _BOUNDRX_LITERAL_H */
