#ifndef SCHEMA_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define SCHEMA_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"
#include <string>

namespace YTree
{
	namespace Tags
	{
		const char * const Null  = "tag:yaml.org,2002:null";
		const char * const Bool  = "tag:yaml.org,2002:bool";
		const char * const Int   = "tag:yaml.org,2002:int";
		const char * const Float = "tag:yaml.org,2002:float";
		const char * const Str   = "tag:yaml.org,2002:str";
		const char * const Seq   = "tag:yaml.org,2002:seq";
		const char * const Map   = "tag:yaml.org,2002:map";
	}

	// ResolvePlainScalar
	// . The core schema tag an untagged plain scalar with this text resolves to.
	YTREE_API const std::string ResolvePlainScalar(const std::string& value);

	YTREE_API bool IsNullScalar(const std::string& value);
	YTREE_API bool ConvertBool(const std::string& value, bool& b);
	YTREE_API bool IsIntScalar(const std::string& value);
	YTREE_API bool IsFloatScalar(const std::string& value);
}

#endif // SCHEMA_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
