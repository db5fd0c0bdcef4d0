#ifndef NONCOPYABLE_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define NONCOPYABLE_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"

namespace YTree
{
	// this is basically boost::noncopyable
	class YTREE_API noncopyable
	{
	protected:
		noncopyable() {}
		~noncopyable() {}

	private:
		noncopyable(const noncopyable&);
		const noncopyable& operator = (const noncopyable&);
	};
}

#endif // NONCOPYABLE_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
