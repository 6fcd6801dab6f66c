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

#ifndef _BOUNDRX_PROGRAM_H
#define _BOUNDRX_PROGRAM_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "boundrx.h"
#include "literal.h"

namespace BoundRX {

typedef int32_t WChar;			// because wchar_t may not be 32 bits
constexpr int32_t WCharMax = 0x10FFFF;	// maximum code point

typedef std::size_t InstPtr;		// index of an instruction in a Program

enum class Look {
	Any = BOUNDRX_LOOK_ANY,				// placeholder, never executed
	StartLine = BOUNDRX_LOOK_START_LINE,		// ^ with newline sensitivity
	EndLine = BOUNDRX_LOOK_END_LINE,		// $ with newline sensitivity
	StartText = BOUNDRX_LOOK_START_TEXT,		// beginning of input
	EndText = BOUNDRX_LOOK_END_TEXT,		// end of input
	WordBoundary = BOUNDRX_LOOK_WORD_BOUNDARY,
	NotWordBoundary = BOUNDRX_LOOK_NOT_WORD_BOUNDARY,
	WordBoundaryAscii = BOUNDRX_LOOK_WORD_BOUNDARY_ASCII,
	NotWordBoundaryAscii = BOUNDRX_LOOK_NOT_WORD_BOUNDARY_ASCII
};

const char *look_name(Look look);

struct Inst {
	enum Type {
		Match,		// args = slot of the matching alternative
		Split,		// args = goto1 (preferred), goto2
		Zero,		// args = goto; look = assertion
		One,		// args = goto; lo = hi = element
		Interval	// args = goto; [lo, hi] inclusive
	};
	Type type;
	InstPtr args[2];
	Look look;
	WChar lo, hi;

	static Inst match(std::size_t slot) { return {Match, {slot, 0}, Look::Any, 0, 0}; }
	static Inst split(InstPtr goto1, InstPtr goto2) { return {Split, {goto1, goto2}, Look::Any, 0, 0}; }
	static Inst zero(InstPtr next, Look look) { return {Zero, {next, 0}, look, 0, 0}; }
	static Inst one(InstPtr next, WChar wc) { return {One, {next, 0}, Look::Any, wc, wc}; }
	static Inst interval(InstPtr next, WChar lo, WChar hi) { return {Interval, {next, 0}, Look::Any, lo, hi}; }

	bool is_match() const { return type == Match; }
	std::size_t slot() const { return args[0]; }
	InstPtr goto1() const { return args[0]; }
	InstPtr goto2() const { return args[1]; }
	// Tests an input element against a One or Interval instruction.
	// Absent (End) and undecodable elements are negative and never match.
	bool matches(WChar wc) const {
		if (wc < lo)
			return false;
		return wc <= hi;
	}
	// Number of distinct elements a One or Interval instruction accepts.
	std::size_t num_chars() const { return (std::size_t) ((int64_t) hi - lo + 1); }
};

// A sequence of instructions representing an NFA, plus facts about it.
// Built once by a compiler, then shared read-only by any number of searches.
struct Program {
	std::vector<Inst> insts;
	// Index of every Match instruction; length 1 unless this is a regex set.
	std::vector<InstPtr> matches;
	InstPtr start = 0;
	// Compiled for the DFA engine (byte instructions, leading .*? when unanchored).
	bool is_dfa = false;
	// Matches text in reverse (DFA only).
	bool is_reverse = false;
	bool is_anchored_start = false;
	bool is_anchored_end = false;
	bool has_unicode_word_boundary = false;
	// Possibly empty set of literals every match begins with.
	LiteralSearcher prefixes;
	// Approximate per-thread state cache budget for the DFA engine.
	std::size_t dfa_size_limit = 2 * (1 << 20);

	std::size_t size() const { return insts.size(); }
	bool empty() const { return insts.empty(); }
	const Inst &operator[](InstPtr pc) const { return insts[pc]; }
	auto begin() const { return insts.begin(); }
	auto end() const { return insts.end(); }

	InstPtr push(const Inst &inst);
	bool leads_to_match(InstPtr pc) const;
	bool needs_dotstar() const { return is_dfa && !is_reverse && !is_anchored_start; }
	bool uses_bytes() const { return is_dfa; }
	std::size_t approximate_size() const;
	std::string dump() const;
	boundrx_result_t validate() const;
};

}

#endif /* _BOUNDRX_PROGRAM_H */
