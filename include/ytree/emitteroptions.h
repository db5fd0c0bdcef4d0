#ifndef EMITTEROPTIONS_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define EMITTEROPTIONS_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"
#include "ytree/style.h"

namespace YTree
{
	// how scalars without a style of their own are quoted
	struct QuoteStyle { enum value { PreferPlain, PreferSingle, PreferDouble }; };

	struct YTREE_API EmitterOptions {
		EmitterOptions(): indentWidth(2), defaultStyle(CollectionStyle::Block), lineWidth(0), quoteStyle(QuoteStyle::PreferPlain) {}

		// Validate
		// . Throws EmitError for settings that can't be honored.
		void Validate() const;

		unsigned indentWidth;
		CollectionStyle::value defaultStyle;    // for collections without a style of their own
		unsigned lineWidth;                     // wrap column for quoted and folded scalars, 0 = unbounded
		QuoteStyle::value quoteStyle;
	};
}

#endif // EMITTEROPTIONS_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
