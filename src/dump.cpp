#include "ytree/dump.h"
#include "ytree/emitfromevents.h"
#include "ytree/emitter.h"
#include "ytree/log.h"
#include "nodeevents.h"

namespace YTree
{
	namespace
	{
		void Configure(Emitter& emitter, const EmitterOptions& options)
		{
			options.Validate();

			const EMITTER_MANIP format = (options.defaultStyle == CollectionStyle::Flow ? Flow : Block);
			emitter.SetIndent(options.indentWidth);
			emitter.SetSeqFormat(format);
			emitter.SetMapFormat(format);
			emitter.SetLineWidth(options.lineWidth);
		}

		std::string Finish(const Emitter& emitter)
		{
			if(!emitter.good())
				throw EmitError(emitter.GetLastErrorKind(), emitter.GetLastError());

			std::string output(emitter.c_str(), emitter.size());
			if(!output.empty() && output[output.size() - 1] != '\n')
				output += '\n';
			return output;
		}
	}

	std::string Dump(const std::vector<Document>& documents, const EmitterOptions& options)
	{
		Emitter emitter;
		Configure(emitter, options);

		EmitFromEvents handler(emitter, options);
		for(std::size_t i=0;i<documents.size();i++) {
			ytree_log.trace("dumping document {}", i);
			NodeEvents events(documents[i]);
			events.Emit(handler, i > 0);
			if(!emitter.good())
				break;
		}

		return Finish(emitter);
	}

	std::string Dump(const Document& document, const EmitterOptions& options)
	{
		Emitter emitter;
		Configure(emitter, options);

		EmitFromEvents handler(emitter, options);
		NodeEvents events(document);
		events.Emit(handler);

		return Finish(emitter);
	}

	// EmitEvents
	// . A collection whose end follows right after its start is written
	//   in flow style, and an empty document gets its "---".
	std::string EmitEvents(const std::vector<Event>& events, const EmitterOptions& options)
	{
		Emitter emitter;
		Configure(emitter, options);

		EmitFromEvents handler(emitter, options);
		for(std::size_t i=0;i<events.size();i++) {
			const Event& event = events[i];
			const Event::TYPE next = (i + 1 < events.size() ? events[i + 1].type : Event::STREAM_END);

			if((event.type == Event::SEQ_START && next == Event::SEQ_END) || (event.type == Event::MAP_START && next == Event::MAP_END)) {
				Event empty = event;
				empty.collectionStyle = CollectionStyle::Flow;
				HandleEvent(empty, handler);
			} else if(event.type == Event::DOC_START && next == Event::DOC_END && !event.isExplicit) {
				Event empty = event;
				empty.isExplicit = true;
				HandleEvent(empty, handler);
			} else {
				HandleEvent(event, handler);
			}

			if(!emitter.good())
				break;
		}

		if(emitter.good() && !handler.IsFinished())
			throw EmitError(EmitError::InvalidState, ErrorMsg::INCOMPLETE_OUTPUT);

		return Finish(emitter);
	}
}
