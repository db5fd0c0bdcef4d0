#ifndef INDENTATION_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define INDENTATION_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/ostream_wrapper.h"

namespace YTree
{
	struct Indentation {
		Indentation(unsigned n_): n(n_) {}
		unsigned n;
	};

	inline ostream_wrapper& operator << (ostream_wrapper& out, const Indentation& indent) {
		for(unsigned i=0;i<indent.n;i++)
			out << ' ';
		return out;
	}

	struct IndentTo {
		IndentTo(unsigned n_): n(n_) {}
		unsigned n;
	};

	inline ostream_wrapper& operator << (ostream_wrapper& out, const IndentTo& indent) {
		while(out.col() < indent.n)
			out << ' ';
		return out;
	}
}

#endif // INDENTATION_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
