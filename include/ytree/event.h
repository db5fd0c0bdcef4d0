#ifndef EVENT_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define EVENT_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"
#include "ytree/directives.h"
#include "ytree/mark.h"
#include "ytree/style.h"
#include <iosfwd>
#include <string>

namespace YTree
{
	class EventHandler;

	YTREE_API extern const char * const EventNames[];

	// Event
	// . One structural signal of the parsed stream. Starts and ends nest strictly.
	// . 'tag' is "?" when no tag was written and "!" for the non-specific tag;
	//   otherwise it's the resolved tag.
	struct YTREE_API Event {
		enum TYPE {
			STREAM_START,
			STREAM_END,
			DOC_START,
			DOC_END,
			SEQ_START,
			SEQ_END,
			MAP_START,
			MAP_END,
			SCALAR,
			ALIAS
		};

		Event(): type(STREAM_START), scalarStyle(ScalarStyle::Any), collectionStyle(CollectionStyle::Any), isExplicit(false) {}
		Event(TYPE type_, const Mark& mark_)
			: type(type_), mark(mark_), scalarStyle(ScalarStyle::Any), collectionStyle(CollectionStyle::Any), isExplicit(false) {}

		static Event Scalar(const Mark& mark, const std::string& tag, const std::string& anchor, const std::string& value, ScalarStyle::value style);
		static Event Alias(const Mark& mark, const std::string& name);
		static Event SequenceStart(const Mark& mark, const std::string& tag, const std::string& anchor, CollectionStyle::value style);
		static Event MapStart(const Mark& mark, const std::string& tag, const std::string& anchor, CollectionStyle::value style);

		TYPE type;
		Mark mark;
		std::string anchor;             // for an ALIAS, the name it refers to
		std::string tag;
		std::string value;
		ScalarStyle::value scalarStyle;
		CollectionStyle::value collectionStyle;
		bool isExplicit;                // DOC_START: "---" was written; DOC_END: "..." was written
		Directives directives;          // DOC_START only
	};

	// HandleEvent
	// . Forwards one event to the matching EventHandler callback.
	//   Stream events have no callback and are ignored.
	YTREE_API void HandleEvent(const Event& event, EventHandler& handler);

	YTREE_API bool operator == (const Event& lhs, const Event& rhs);
	YTREE_API std::ostream& operator << (std::ostream& out, const Event& event);
}

#endif // EVENT_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
