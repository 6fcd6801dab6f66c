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

#include <cctype>
#include <clocale>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cwchar>
#include <cwctype>
#include <limits>
#include "context.h"

namespace BoundRX {

namespace {

class Decoder final {
	const Context::Encoding enc;
	const char *const ep;
	const char *cp;
	std::mbstate_t mbs;
	WChar invalid() { return std::numeric_limits<WChar>::min() + (unsigned char) *cp++; }
public:
	Decoder(Context::Encoding e, const char *bp, const char *ep): enc(e), ep(ep), cp(bp) {
		std::memset(&mbs, 0, sizeof mbs);
	}
	const char *ptr() const { return cp; }
	WChar nextchr() {
		if (cp == ep)
			return Context::End;
		switch (enc) {
		case Context::Encoding::Byte:
			return (unsigned char) *cp++;
		case Context::Encoding::MBtoWC:
			return nextmbtowc();
		case Context::Encoding::UTF8:
			return nextutf8();
		}
		abort();
	}
	// An embedded NUL is element 0, as in the other encodings.
	WChar nextmbtowc() {
		wchar_t wct = L'\0';
		auto n = std::mbrtowc(&wct, cp, ep - cp, &mbs);
		if (n == 0)
			return cp += 1, 0;
		if (n == (std::size_t) -1 || n == (std::size_t) -2) {
			std::memset(&mbs, 0, sizeof mbs);
			return invalid();
		}
		cp += n;
		return wct;
	}
	// Undecodable bytes come back one at a time as INT32_MIN + byte.
	// Overlong forms and values above WCharMax are undecodable.
	WChar nextutf8() {
		static const WChar mins[] = { 0, 0, 0x80, 0x800, 0x10000 };
		WChar u = (unsigned char) cp[0];
		if (u < 0x80)
			return cp += 1, u;
		std::size_t len;
		WChar r;
		if ((u & 0xE0) == 0xC0)
			len = 2, r = u & 0x1F;
		else if ((u & 0xF0) == 0xE0)
			len = 3, r = u & 0x0F;
		else if ((u & 0xF8) == 0xF0)
			len = 4, r = u & 0x07;
		else
			return invalid();
		if ((std::size_t) (ep - cp) < len)
			return invalid();
		for (std::size_t i = 1; i < len; ++i) {
			WChar c = (unsigned char) cp[i];
			if ((c & 0xC0) != 0x80)
				return invalid();
			r = (r << 6) | (c & 0x3F);
		}
		if (r < mins[len] || r > WCharMax)
			return invalid();
		return cp += len, r;
	}
};

bool
is_ascii_word(WChar wc)
{
	return wc >= 0 && wc <= 0x7F && (wc == '_' || std::isalnum(wc));
}

}

Context::Context(Encoding e, const char *bp, const char *ep)
: bp(bp), n(ep - bp), enc(e), cur(n + 1, End), before(n + 1, End), width(n + 1, 0)
{
	Decoder dec(e, bp, ep);
	WChar wcprev = End;
	for (;;) {
		std::size_t off = dec.ptr() - bp;
		before[off] = wcprev;
		auto wc = dec.nextchr();
		if (wc == End)
			break;
		cur[off] = wc;
		width[off] = dec.ptr() - bp - off;
		wcprev = wc;
	}
}

Context::Context(Encoding e, const char *bp): Context(e, bp, bp + std::strlen(bp)) { }

Context::Encoding
Context::locale_encoding(bool native1b)
{
	auto loc = std::setlocale(LC_CTYPE, nullptr);
	if ((loc != nullptr && loc[0] == 'C' && loc[1] == '\0') || (native1b && MB_CUR_MAX == 1))
		return Encoding::Byte;
	if (auto utf = std::strchr(loc ? loc : "", '.');
	    utf != nullptr && (utf[1] == 'U' || utf[1] == 'u')
			   && (utf[2] == 'T' || utf[2] == 't')
			   && (utf[3] == 'F' || utf[3] == 'f')
			   && (   (utf[4] == '8' && utf[5] == '\0')
			       || (utf[4] == '-' && utf[5] == '8' && utf[6] == '\0')))
		return Encoding::UTF8;
	return Encoding::MBtoWC;
}

bool
Context::is_word(WChar wc) const
{
	if (wc < 0)
		return false;
	if (enc == Encoding::Byte)
		return wc <= 0xFF && (wc == '_' || std::isalnum(wc));
	return wc == L'_' || std::iswalnum(wc);
}

bool
Context::is_empty_match(std::size_t at, Look look) const
{
	switch (look) {
	case Look::StartLine:
		return at == 0 || prev(at) == L'\n';
	case Look::EndLine:
		return at == n || (*this)[at] == L'\n';
	case Look::StartText:
		return at == 0;
	case Look::EndText:
		return at == n;
	case Look::WordBoundary:
		return is_word(prev(at)) != is_word((*this)[at]);
	case Look::NotWordBoundary:
		return is_word(prev(at)) == is_word((*this)[at]);
	case Look::WordBoundaryAscii:
		return is_ascii_word(prev(at)) != is_ascii_word((*this)[at]);
	case Look::NotWordBoundaryAscii:
		return is_ascii_word(prev(at)) == is_ascii_word((*this)[at]);
	case Look::Any:
		break;
	}
	std::fprintf(stderr, "BUG: zero-width assertion %s reached the matcher\n", look_name(look));
	abort();
}

std::optional<std::size_t>
Context::prefix_at(const LiteralSearcher &prefixes, std::size_t at) const
{
	if (at > n)
		return std::nullopt;
	if (auto found = prefixes.find(bp + at, bp + n); found.has_value())
		return at + found->first;
	return std::nullopt;
}

}
