#ifndef MARK_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define MARK_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"

namespace YTree
{
	// Mark
	// . A position in the (UTF-8) input: byte offset, zero-based line,
	//   and zero-based column counted in characters.
	struct YTREE_API Mark {
		Mark(): pos(0), line(0), column(0) {}

		static const Mark null_mark() { return Mark(-1, -1, -1); }
		bool is_null() const { return pos == -1 && line == -1 && column == -1; }

		bool operator == (const Mark& rhs) const { return pos == rhs.pos && line == rhs.line && column == rhs.column; }
		bool operator != (const Mark& rhs) const { return !(*this == rhs); }

		int pos;
		int line, column;

	private:
		Mark(int pos_, int line_, int column_): pos(pos_), line(line_), column(column_) {}
	};
}

#endif // MARK_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
