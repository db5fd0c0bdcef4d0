#ifndef EVENTHANDLER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define EVENTHANDLER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/style.h"
#include <string>

namespace YTree
{
	struct Mark;
	struct Directives;

	class EventHandler
	{
	public:
		virtual ~EventHandler() {}

		virtual void OnDocumentStart(const Mark& mark, const Directives& directives, bool isExplicit) = 0;
		virtual void OnDocumentEnd(const Mark& mark, bool isExplicit) = 0;

		virtual void OnAlias(const Mark& mark, const std::string& name) = 0;
		virtual void OnScalar(const Mark& mark, const std::string& tag, const std::string& anchor, const std::string& value, ScalarStyle::value style) = 0;

		virtual void OnSequenceStart(const Mark& mark, const std::string& tag, const std::string& anchor, CollectionStyle::value style) = 0;
		virtual void OnSequenceEnd(const Mark& mark) = 0;

		virtual void OnMapStart(const Mark& mark, const std::string& tag, const std::string& anchor, CollectionStyle::value style) = 0;
		virtual void OnMapEnd(const Mark& mark) = 0;
	};
}

#endif // EVENTHANDLER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
