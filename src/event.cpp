#include "ytree/event.h"
#include "ytree/eventhandler.h"
#include <ostream>

namespace YTree
{
	const char * const EventNames[] = {
		"STREAM_START",
		"STREAM_END",
		"DOC_START",
		"DOC_END",
		"SEQ_START",
		"SEQ_END",
		"MAP_START",
		"MAP_END",
		"SCALAR",
		"ALIAS"
	};

	Event Event::Scalar(const Mark& mark, const std::string& tag, const std::string& anchor, const std::string& value, ScalarStyle::value style)
	{
		Event event(SCALAR, mark);
		event.tag = tag;
		event.anchor = anchor;
		event.value = value;
		event.scalarStyle = style;
		return event;
	}

	Event Event::Alias(const Mark& mark, const std::string& name)
	{
		Event event(ALIAS, mark);
		event.anchor = name;
		return event;
	}

	Event Event::SequenceStart(const Mark& mark, const std::string& tag, const std::string& anchor, CollectionStyle::value style)
	{
		Event event(SEQ_START, mark);
		event.tag = tag;
		event.anchor = anchor;
		event.collectionStyle = style;
		return event;
	}

	Event Event::MapStart(const Mark& mark, const std::string& tag, const std::string& anchor, CollectionStyle::value style)
	{
		Event event(MAP_START, mark);
		event.tag = tag;
		event.anchor = anchor;
		event.collectionStyle = style;
		return event;
	}

	void HandleEvent(const Event& event, EventHandler& handler)
	{
		switch(event.type) {
			case Event::STREAM_START:
			case Event::STREAM_END:
				break;
			case Event::DOC_START:
				handler.OnDocumentStart(event.mark, event.directives, event.isExplicit);
				break;
			case Event::DOC_END:
				handler.OnDocumentEnd(event.mark, event.isExplicit);
				break;
			case Event::SEQ_START:
				handler.OnSequenceStart(event.mark, event.tag, event.anchor, event.collectionStyle);
				break;
			case Event::SEQ_END:
				handler.OnSequenceEnd(event.mark);
				break;
			case Event::MAP_START:
				handler.OnMapStart(event.mark, event.tag, event.anchor, event.collectionStyle);
				break;
			case Event::MAP_END:
				handler.OnMapEnd(event.mark);
				break;
			case Event::SCALAR:
				handler.OnScalar(event.mark, event.tag, event.anchor, event.value, event.scalarStyle);
				break;
			case Event::ALIAS:
				handler.OnAlias(event.mark, event.anchor);
				break;
		}
	}

	// operator ==
	// . Positions are not compared.
	bool operator == (const Event& lhs, const Event& rhs)
	{
		return lhs.type == rhs.type && lhs.anchor == rhs.anchor && lhs.tag == rhs.tag && lhs.value == rhs.value &&
			lhs.scalarStyle == rhs.scalarStyle && lhs.collectionStyle == rhs.collectionStyle &&
			lhs.isExplicit == rhs.isExplicit && lhs.directives == rhs.directives;
	}

	std::ostream& operator << (std::ostream& out, const Event& event)
	{
		out << EventNames[event.type];
		if(!event.anchor.empty())
			out << (event.type == Event::ALIAS ? " *" : " &") << event.anchor;
		if(!event.tag.empty() && event.tag != "?")
			out << " <" << event.tag << ">";
		switch(event.type) {
			case Event::SCALAR:
				out << " \"" << event.value << "\" (" << ScalarStyleName(event.scalarStyle) << ")";
				break;
			case Event::SEQ_START:
			case Event::MAP_START:
				out << " (" << CollectionStyleName(event.collectionStyle) << ")";
				break;
			case Event::DOC_START:
			case Event::DOC_END:
				if(event.isExplicit)
					out << " (explicit)";
				break;
			default:
				break;
		}
		return out;
	}
}
