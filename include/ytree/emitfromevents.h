#ifndef EMITFROMEVENTS_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define EMITFROMEVENTS_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"
#include "ytree/emittermanip.h"
#include "ytree/emitteroptions.h"
#include "ytree/eventhandler.h"
#include <vector>

namespace YTree
{
	class Emitter;

	// EmitFromEvents
	// . Re-streams events into an Emitter, picking for every node a style
	//   that reads back as the same value.
	class YTREE_API EmitFromEvents: public EventHandler
	{
	public:
		EmitFromEvents(Emitter& emitter, const EmitterOptions& options = EmitterOptions());

		virtual void OnDocumentStart(const Mark& mark, const Directives& directives, bool isExplicit);
		virtual void OnDocumentEnd(const Mark& mark, bool isExplicit);

		virtual void OnAlias(const Mark& mark, const std::string& name);
		virtual void OnScalar(const Mark& mark, const std::string& tag, const std::string& anchor, const std::string& value, ScalarStyle::value style);

		virtual void OnSequenceStart(const Mark& mark, const std::string& tag, const std::string& anchor, CollectionStyle::value style);
		virtual void OnSequenceEnd(const Mark& mark);

		virtual void OnMapStart(const Mark& mark, const std::string& tag, const std::string& anchor, CollectionStyle::value style);
		virtual void OnMapEnd(const Mark& mark);

		// every collection that was started has ended
		bool IsFinished() const { return m_stack.empty(); }

	private:
		void BeginNode();
		void EmitProps(const std::string& tag, const std::string& anchor);
		bool IsFlow(CollectionStyle::value style) const;
		EMITTER_MANIP ChooseFormat(const std::string& tag, const std::string& value, ScalarStyle::value style, std::string& writtenTag) const;

	private:
		Emitter& m_emitter;
		EmitterOptions m_options;
		std::size_t m_documentCount;

		struct State { enum value { WaitingForSequenceEntry, WaitingForKey, WaitingForValue }; };
		struct Frame {
			Frame(State::value state_, bool flow_): state(state_), flow(flow_) {}
			State::value state;
			bool flow;
		};
		std::vector<Frame> m_stack;
	};
}

#endif // EMITFROMEVENTS_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
