#include "ytree/emitfromevents.h"
#include "ytree/emitter.h"
#include "ytree/log.h"
#include "ytree/schema.h"
#include "emitterutils.h"

namespace YTree
{
	namespace
	{
		// longest key we still write in the simple form, properties included
		const std::size_t MAX_SIMPLE_KEY_LENGTH = 1024;

		bool IsNonSpecific(const std::string& tag)
		{
			return tag.empty() || tag == "?" || tag == "!";
		}

		StringFormat::value ToStringFormat(EMITTER_MANIP format)
		{
			switch(format) {
				case Plain: return StringFormat::Plain;
				case SingleQuoted: return StringFormat::SingleQuoted;
				case Literal: return StringFormat::Literal;
				case Folded: return StringFormat::Folded;
				default: return StringFormat::DoubleQuoted;
			}
		}
	}

	EmitFromEvents::EmitFromEvents(Emitter& emitter, const EmitterOptions& options)
		: m_emitter(emitter), m_options(options), m_documentCount(0)
	{
	}

	void EmitFromEvents::OnDocumentStart(const Mark&, const Directives& directives, bool isExplicit)
	{
		if(!directives.empty())
			m_emitter << directives;
		else if(isExplicit || m_documentCount > 0)
			m_emitter << BeginDoc;

		m_documentCount++;
	}

	void EmitFromEvents::OnDocumentEnd(const Mark&, bool isExplicit)
	{
		if(isExplicit)
			m_emitter << EndDoc;
	}

	void EmitFromEvents::OnAlias(const Mark&, const std::string& name)
	{
		BeginNode();
		m_emitter << Alias(name);
	}

	void EmitFromEvents::OnScalar(const Mark&, const std::string& tag, const std::string& anchor, const std::string& value, ScalarStyle::value style)
	{
		std::string writtenTag;
		const EMITTER_MANIP format = ChooseFormat(tag, value, style, writtenTag);

		const bool isKey = !m_stack.empty() && m_stack.back().state == State::WaitingForKey;
		if(isKey) {
			const std::size_t length = Utils::WrittenLength(value, ToStringFormat(format), false) + writtenTag.size() + anchor.size() + 8;
			if(length > MAX_SIMPLE_KEY_LENGTH)
				m_emitter << LongKey;
		}

		BeginNode();
		EmitProps(writtenTag, anchor);
		m_emitter << format << value;
	}

	void EmitFromEvents::OnSequenceStart(const Mark&, const std::string& tag, const std::string& anchor, CollectionStyle::value style)
	{
		const bool flow = IsFlow(style);

		BeginNode();
		EmitProps(IsNonSpecific(tag) ? std::string() : tag, anchor);
		m_emitter << (flow ? Flow : Block) << BeginSeq;
		m_stack.push_back(Frame(State::WaitingForSequenceEntry, flow));
	}

	void EmitFromEvents::OnSequenceEnd(const Mark&)
	{
		m_emitter << EndSeq;
		if(!m_stack.empty() && m_stack.back().state == State::WaitingForSequenceEntry)
			m_stack.pop_back();
	}

	void EmitFromEvents::OnMapStart(const Mark&, const std::string& tag, const std::string& anchor, CollectionStyle::value style)
	{
		const bool flow = IsFlow(style);

		BeginNode();
		EmitProps(IsNonSpecific(tag) ? std::string() : tag, anchor);
		m_emitter << (flow ? Flow : Block) << BeginMap;
		m_stack.push_back(Frame(State::WaitingForKey, flow));
	}

	void EmitFromEvents::OnMapEnd(const Mark&)
	{
		m_emitter << EndMap;
		if(!m_stack.empty() && m_stack.back().state == State::WaitingForKey)
			m_stack.pop_back();
	}

	void EmitFromEvents::BeginNode()
	{
		if(m_stack.empty())
			return;

		switch(m_stack.back().state) {
			case State::WaitingForKey:
				m_stack.back().state = State::WaitingForValue;
				break;
			case State::WaitingForValue:
				m_stack.back().state = State::WaitingForKey;
				break;
			default:
				break;
		}
	}

	void EmitFromEvents::EmitProps(const std::string& tag, const std::string& anchor)
	{
		if(!tag.empty())
			m_emitter << Tag(tag);
		if(!anchor.empty())
			m_emitter << Anchor(anchor);
	}

	// IsFlow
	// . Inside a flow collection everything is flow.
	bool EmitFromEvents::IsFlow(CollectionStyle::value style) const
	{
		if(!m_stack.empty() && m_stack.back().flow)
			return true;

		switch(style) {
			case CollectionStyle::Flow:
				return true;
			case CollectionStyle::Block:
				return false;
			default:
				return m_options.defaultStyle == CollectionStyle::Flow;
		}
	}

	// ChooseFormat
	// . Keeps the scalar's own style when that reads back as the same value
	//   of the same type, and falls back to double quotes otherwise.
	// . 'writtenTag' gets the tag to write in front of the scalar, if any.
	EMITTER_MANIP EmitFromEvents::ChooseFormat(const std::string& tag, const std::string& value, ScalarStyle::value style, std::string& writtenTag) const
	{
		ScalarContext context;
		if(!m_stack.empty()) {
			const Frame& frame = m_stack.back();
			context.inFlow = frame.flow;
			context.isKey = frame.state == State::WaitingForKey;
			context.allowEmptyPlain = !frame.flow && !context.isKey;
		}

		const bool untagged = (tag.empty() || tag == "?");
		const bool plainStyle = (style == ScalarStyle::Plain || style == ScalarStyle::Any);
		const std::string resolved = ResolvePlainScalar(value);
		writtenTag = IsNonSpecific(tag) ? std::string() : tag;

		// an untagged plain null, bool, int or float has to stay plain
		if(untagged && plainStyle && resolved != Tags::Str) {
			if(Utils::IsValidPlainScalar(value, context))
				return Plain;

			// the empty null, where it can't be left blank
			writtenTag = resolved;
			return Utils::IsValidSingleQuotedScalar(value, context) ? SingleQuoted : DoubleQuoted;
		}

		// plain text must resolve to the type the node already has
		const bool plainKeepsType = !IsNonSpecific(tag) || (untagged && plainStyle) || resolved == Tags::Str;

		EMITTER_MANIP requested = DoubleQuoted;
		switch(style) {
			case ScalarStyle::Any:
				switch(m_options.quoteStyle) {
					case QuoteStyle::PreferPlain: requested = Plain; break;
					case QuoteStyle::PreferSingle: requested = SingleQuoted; break;
					case QuoteStyle::PreferDouble: requested = DoubleQuoted; break;
				}
				break;
			case ScalarStyle::Plain: requested = Plain; break;
			case ScalarStyle::SingleQuoted: requested = SingleQuoted; break;
			case ScalarStyle::DoubleQuoted: requested = DoubleQuoted; break;
			case ScalarStyle::Literal: requested = Literal; break;
			case ScalarStyle::Folded: requested = Folded; break;
		}

		bool representable = true;
		switch(requested) {
			case Plain:
				representable = plainKeepsType && Utils::IsValidPlainScalar(value, context);
				break;
			case SingleQuoted:
				representable = Utils::IsValidSingleQuotedScalar(value, context);
				break;
			case Literal:
				representable = Utils::IsValidLiteralScalar(value, context);
				break;
			case Folded:
				representable = Utils::IsValidFoldedScalar(value, context);
				break;
			default:
				break;
		}

		if(representable)
			return requested;

		if(style != ScalarStyle::Any)
			ytree_log.trace("{} scalar can't keep its style, writing it double-quoted", ScalarStyleName(style));
		return DoubleQuoted;
	}
}
