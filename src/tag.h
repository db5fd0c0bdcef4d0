#ifndef TAG_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define TAG_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/mark.h"
#include <string>

namespace YTree
{
	struct Token;
	struct Directives;

	struct Tag {
		enum TYPE {
			VERBATIM, PRIMARY_HANDLE, SECONDARY_HANDLE, NAMED_HANDLE, NON_SPECIFIC
		};

		Tag(const Token& token);
		const std::string Translate(const Directives& directives) const;

		TYPE type;
		std::string handle, value;
		Mark mark;
	};
}

#endif // TAG_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
