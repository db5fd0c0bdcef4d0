#ifndef DIRECTIVES_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define DIRECTIVES_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"
#include <string>
#include <map>

namespace YTree
{
	struct YTREE_API Version {
		bool isDefault;
		int major, minor;
	};

	// Directives
	// . What the %YAML and %TAG lines in front of a document declared.
	struct YTREE_API Directives {
		Directives();

		// TranslateTagHandle
		// . Returns the prefix a handle stands for: a declared one, or the
		//   default for "!" and "!!". An undeclared named handle yields "".
		const std::string TranslateTagHandle(const std::string& handle) const;
		bool IsHandleDefined(const std::string& handle) const;

		bool empty() const { return version.isDefault && tags.empty(); }

		Version version;
		std::map<std::string, std::string> tags;
	};

	bool operator == (const Directives& lhs, const Directives& rhs);
}

#endif // DIRECTIVES_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
