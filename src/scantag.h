#ifndef SCANTAG_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define SCANTAG_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include <string>
#include "stream.h"

namespace YTree
{
	const std::string ScanVerbatimTag(Stream& INPUT);
	const std::string ScanTagHandle(Stream& INPUT, bool& canBeHandle);
	const std::string ScanTagSuffix(Stream& INPUT, bool allowEmpty);
}

#endif // SCANTAG_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
