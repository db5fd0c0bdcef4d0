#ifndef TOKEN_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define TOKEN_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"
#include "ytree/mark.h"
#include "ytree/style.h"
#include <iosfwd>
#include <string>
#include <vector>

namespace YTree
{
	YTREE_API extern const char * const TokenNames[];

	struct YTREE_API Token {
		// enums
		enum STATUS { VALID, INVALID, UNVERIFIED };
		enum TYPE {
			STREAM_START,
			STREAM_END,
			DIRECTIVE,
			DOC_START,
			DOC_END,
			BLOCK_SEQ_START,
			BLOCK_MAP_START,
			BLOCK_SEQ_END,
			BLOCK_MAP_END,
			BLOCK_ENTRY,
			FLOW_SEQ_START,
			FLOW_MAP_START,
			FLOW_SEQ_END,
			FLOW_MAP_END,
			FLOW_ENTRY,
			KEY,
			VALUE,
			ANCHOR,
			ALIAS,
			TAG,
			SCALAR,
			COMMENT
		};

		// data
		Token(TYPE type_, const Mark& mark_)
			: status(VALID), type(type_), mark(mark_), endMark(mark_), style(ScalarStyle::Any), data(0) {}

		// For a TAG token, 'value' is the handle ("!", "!!", "!name!", or empty
		// for a verbatim tag) and params[0] is the suffix.
		// For a COMMENT token, 'data' is non-zero when the comment trails content on its line.
		STATUS status;
		TYPE type;
		Mark mark, endMark;
		std::string value;
		std::vector <std::string> params;
		ScalarStyle::value style;
		int data;
	};

	YTREE_API std::ostream& operator << (std::ostream& out, const Token& token);
}

#endif // TOKEN_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
