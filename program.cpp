//
// BoundRX: a bounded backtracking matcher for compiled regex programs.
// Copyright (C) 2023, 2024, 2025 Michael J. Haertel.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions
// are met:
//
// 1. Redistributions of source code must retain the above copyright
//    notice, this list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright
//    notice, this list of conditions and the following disclaimer in the
//    documentation and/or other materials provided with the distribution.
//
// THIS SOFTWARE IS PROVIDED BY THE AUTHOR AND CONTRIBUTORS “AS IS” AND
// ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
// ARE DISCLAIMED. IN NO EVENT SHALL THE AUTHOR OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS
// OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION)
// HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT
// LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY
// OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF
// SUCH DAMAGE.
//

#include <cstdio>
#include <cstdlib>
#include <set>
#include "program.h"

namespace BoundRX {

const char *
look_name(Look look)
{
	switch (look) {
	case Look::Any:			return "Any";
	case Look::StartLine:		return "StartLine";
	case Look::EndLine:		return "EndLine";
	case Look::StartText:		return "StartText";
	case Look::EndText:		return "EndText";
	case Look::WordBoundary:	return "WordBoundary";
	case Look::NotWordBoundary:	return "NotWordBoundary";
	case Look::WordBoundaryAscii:	return "WordBoundaryAscii";
	case Look::NotWordBoundaryAscii: return "NotWordBoundaryAscii";
	}
	return "?";
}

InstPtr
Program::push(const Inst &inst)
{
	InstPtr pc = insts.size();
	insts.push_back(inst);
	if (inst.type == Inst::Match)
		matches.push_back(pc);
	else if (inst.type == Inst::Zero && (inst.look == Look::WordBoundary || inst.look == Look::NotWordBoundary))
		has_unicode_word_boundary = true;
	return pc;
}

// True iff execution at pc always leads to a match.
bool
Program::leads_to_match(InstPtr pc) const
{
	// with several Match states, reaching one of them says little
	if (matches.size() > 1)
		return false;
	return insts[pc].is_match();
}

// Instructions hold no heap storage, so this stays constant time.
std::size_t
Program::approximate_size() const
{
	return insts.size() * sizeof (Inst)
	       + matches.size() * sizeof (InstPtr)
	       + 256
	       + prefixes.approximate_size();
}

static std::string
visible(WChar wc)
{
	char buf[16];
	if (wc >= 0x20 && wc < 0x7F && wc != '\\' && wc != '\'')
		std::snprintf(buf, sizeof buf, "'%c'", (char) wc);
	else if (wc == '\n')
		std::snprintf(buf, sizeof buf, "'\\n'");
	else if (wc == '\t')
		std::snprintf(buf, sizeof buf, "'\\t'");
	else if (wc >= 0 && wc < 0x80)
		std::snprintf(buf, sizeof buf, "'\\x%02x'", (unsigned) wc);
	else
		std::snprintf(buf, sizeof buf, "U+%04X", (unsigned) wc);
	return buf;
}

std::string
Program::dump() const
{
	std::string out;
	char buf[64];
	for (InstPtr pc = 0; pc < insts.size(); ++pc) {
		const auto &inst = insts[pc];
		std::string text;
		InstPtr next = pc + 1;
		switch (inst.type) {
		case Inst::Match:
			std::snprintf(buf, sizeof buf, "Match(%zu)", inst.slot());
			text = buf;
			break;
		case Inst::Split:
			std::snprintf(buf, sizeof buf, "Split(%zu, %zu)", inst.goto1(), inst.goto2());
			text = buf;
			break;
		case Inst::Zero:
			text = look_name(inst.look);
			next = inst.args[0];
			break;
		case Inst::One:
			text = visible(inst.lo);
			next = inst.args[0];
			break;
		case Inst::Interval:
			text = visible(inst.lo) + "-" + visible(inst.hi);
			next = inst.args[0];
			break;
		}
		std::snprintf(buf, sizeof buf, "%04zu ", pc);
		out += buf;
		out += text;
		if (next != pc + 1) {
			std::snprintf(buf, sizeof buf, " (goto: %zu)", next);
			out += buf;
		}
		if (pc == start)
			out += " (start)";
		out += '\n';
	}
	return out;
}

boundrx_result_t
Program::validate() const
{
	if (start >= insts.size())
		return BOUNDRX_EBADSTART;
	if (matches.empty())
		return BOUNDRX_ENOMATCH;
	std::set<std::size_t> slots;
	for (const auto &inst : insts) {
		switch (inst.type) {
		case Inst::Match:
			if (!slots.insert(inst.slot()).second)
				return BOUNDRX_EBADSLOT;
			break;
		case Inst::Split:
			if (inst.goto1() >= insts.size() || inst.goto2() >= insts.size())
				return BOUNDRX_EBADGOTO;
			break;
		case Inst::Zero:
			if (inst.args[0] >= insts.size())
				return BOUNDRX_EBADGOTO;
			if (inst.look == Look::Any)
				return BOUNDRX_ELOOK;
			break;
		case Inst::One:
		case Inst::Interval:
			if (inst.args[0] >= insts.size())
				return BOUNDRX_EBADGOTO;
			if (inst.lo < 0 || inst.lo > inst.hi)
				return BOUNDRX_ERANGE;
			break;
		default:
			abort();
		}
	}
	return BOUNDRX_SUCCESS;
}

}
