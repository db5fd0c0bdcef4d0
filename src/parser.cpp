#include "ytree/parser.h"
#include "ytree/eventhandler.h"
#include "ytree/exceptions.h"
#include "ytree/log.h"
#include "ytree/token.h"
#include "scanner.h"
#include "tag.h"
#include <sstream>
#include <cstdio>

namespace YTree
{
	Parser::Parser(): m_state(END), m_needResync(false)
	{
	}

	Parser::Parser(std::istream& in, const ParserOptions& options): m_state(END), m_needResync(false)
	{
		Load(in, options);
	}

	Parser::~Parser()
	{
	}

	Parser::operator bool() const
	{
		return m_pScanner.get() && m_state != END;
	}

	void Parser::Load(std::istream& in, const ParserOptions& options)
	{
		m_pScanner.reset(new Scanner(in));
		m_options = options;
		m_directives = Directives();
		m_state = STREAM_START;
		m_states.clear();
		m_marks.clear();
		m_needResync = false;
	}

	// GetNextEvent
	// . On error the stream is finished (strict), or the next call skips
	//   ahead to the next document boundary first.
	bool Parser::GetNextEvent(Event& event)
	{
		if(!m_pScanner.get())
			return false;

		if(m_needResync)
			Resynchronize();

		if(m_state == END)
			return false;

		try {
			event = NextEvent();
		} catch(const Exception& e) {
			if(m_options.strict) {
				m_state = END;
			} else {
				m_needResync = true;
				m_errorMark = e.mark;
			}
			throw;
		}

		if(event.type == Event::DOC_START || event.type == Event::DOC_END)
			ytree_log.trace("{} at line {}", EventNames[event.type], event.mark.line + 1);
		return true;
	}

	bool Parser::HandleNextDocument(EventHandler& handler)
	{
		Event event;
		do {
			if(!GetNextEvent(event))
				return false;
		} while(event.type != Event::DOC_START);

		HandleEvent(event, handler);
		while(GetNextEvent(event)) {
			HandleEvent(event, handler);
			if(event.type == Event::DOC_END)
				break;
		}
		return true;
	}

	// Resynchronize
	// . Throws away the state of the failed document. If even that fails
	//   (the input can't be decoded), the stream is over.
	void Parser::Resynchronize()
	{
		m_needResync = false;
		try {
			m_pScanner->Resynchronize(m_errorMark);
		} catch(const Exception&) {
			m_state = END;
			throw;
		}

		m_states.clear();
		m_marks.clear();
		m_directives = Directives();
		m_state = IMPLICIT_DOCUMENT_START;
	}

	Event Parser::NextEvent()
	{
		switch(m_state) {
			case STREAM_START: return ParseStreamStart();
			case IMPLICIT_DOCUMENT_START: return ParseDocumentStart(true);
			case DOCUMENT_START: return ParseDocumentStart(false);
			case DOCUMENT_CONTENT: return ParseDocumentContent();
			case DOCUMENT_END: return ParseDocumentEnd();
			case BLOCK_NODE: return ParseNode(true);
			case FLOW_NODE: return ParseNode(false);
			case BLOCK_SEQUENCE_FIRST_ENTRY: return ParseBlockSequenceEntry(true);
			case BLOCK_SEQUENCE_ENTRY: return ParseBlockSequenceEntry(false);
			case BLOCK_MAPPING_FIRST_KEY: return ParseBlockMappingKey(true);
			case BLOCK_MAPPING_KEY: return ParseBlockMappingKey(false);
			case BLOCK_MAPPING_VALUE: return ParseBlockMappingValue();
			case FLOW_SEQUENCE_FIRST_ENTRY: return ParseFlowSequenceEntry(true);
			case FLOW_SEQUENCE_ENTRY: return ParseFlowSequenceEntry(false);
			case FLOW_SEQUENCE_ENTRY_MAPPING_KEY: return ParseFlowSequenceEntryMappingKey();
			case FLOW_SEQUENCE_ENTRY_MAPPING_VALUE: return ParseFlowSequenceEntryMappingValue();
			case FLOW_SEQUENCE_ENTRY_MAPPING_END: return ParseFlowSequenceEntryMappingEnd();
			case FLOW_MAPPING_FIRST_KEY: return ParseFlowMappingKey(true);
			case FLOW_MAPPING_KEY: return ParseFlowMappingKey(false);
			case FLOW_MAPPING_VALUE: return ParseFlowMappingValue(false);
			case FLOW_MAPPING_EMPTY_VALUE: return ParseFlowMappingValue(true);
			case END: break;
		}

		throw ParseError(m_pScanner->mark(), ParseError::UnexpectedToken, ErrorMsg::UNEXPECTED_END);
	}

	// PeekToken
	// . Comments carry no structure, so the grammar never sees them.
	Token& Parser::PeekToken()
	{
		while(!m_pScanner->empty() && m_pScanner->peek().type == Token::COMMENT)
			m_pScanner->pop();

		if(m_pScanner->empty())
			throw ParseError(m_pScanner->mark(), ParseError::UnexpectedToken, ErrorMsg::UNEXPECTED_END);

		return m_pScanner->peek();
	}

	Parser::STATE Parser::PopState()
	{
		STATE state = m_states.back();
		m_states.pop_back();
		return state;
	}

	// CheckFlowToken
	// . Inside a flow collection, the other closing bracket or a document
	//   boundary means this collection was never closed.
	void Parser::CheckFlowToken(const Token& token, int endType) const
	{
		bool unclosed = false;
		switch(token.type) {
			case Token::DOC_START:
			case Token::DOC_END:
			case Token::STREAM_END:
			case Token::DIRECTIVE:
				unclosed = true;
				break;
			case Token::FLOW_SEQ_END:
			case Token::FLOW_MAP_END:
				unclosed = token.type != endType;
				break;
			default:
				break;
		}

		if(unclosed)
			throw ParseError(m_marks.back(), ParseError::UnclosedFlowCollection,
				endType == Token::FLOW_SEQ_END ? ErrorMsg::END_OF_SEQ_FLOW : ErrorMsg::END_OF_MAP_FLOW);
	}

	Event Parser::EmptyScalar(const Mark& mark) const
	{
		return Event::Scalar(mark, "?", "", "", ScalarStyle::Plain);
	}

	Event Parser::ParseStreamStart()
	{
		Token& token = PeekToken();
		if(token.type != Token::STREAM_START)
			throw ParseError(token.mark, ParseError::UnexpectedToken, ErrorMsg::UNEXPECTED_TOKEN + std::string(TokenNames[token.type]));

		Event event(Event::STREAM_START, token.mark);
		m_pScanner->pop();
		m_state = IMPLICIT_DOCUMENT_START;
		return event;
	}

	// ParseDocumentStart
	// . 'implicit' is set at the start of the stream and after "...",
	//   where a document may begin without "---".
	Event Parser::ParseDocumentStart(bool implicit)
	{
		Token *pToken = &PeekToken();
		while(pToken->type == Token::DOC_END) {
			m_pScanner->pop();
			pToken = &PeekToken();
			implicit = true;
		}

		if(pToken->type == Token::STREAM_END) {
			Event event(Event::STREAM_END, pToken->mark);
			m_pScanner->pop();
			m_state = END;
			return event;
		}

		if(implicit && pToken->type != Token::DIRECTIVE && pToken->type != Token::DOC_START) {
			m_directives = Directives();
			Event event(Event::DOC_START, pToken->mark);
			event.directives = m_directives;
			m_states.push_back(DOCUMENT_END);
			m_state = BLOCK_NODE;
			return event;
		}

		// an explicit document
		bool hasDirectives = pToken->type == Token::DIRECTIVE;
		ParseDirectives();

		Token& token = PeekToken();
		if(token.type != Token::DOC_START)
			throw ParseError(token.mark, ParseError::UnexpectedToken, hasDirectives ? ErrorMsg::DIRECTIVE_WITHOUT_DOC : ErrorMsg::EXPECTED_DOC_START);

		Event event(Event::DOC_START, token.mark);
		event.isExplicit = true;
		event.directives = m_directives;
		m_pScanner->pop();
		m_states.push_back(DOCUMENT_END);
		m_state = DOCUMENT_CONTENT;
		return event;
	}

	// ParseDocumentContent
	// . Nothing between the markers means the document has no root at all.
	Event Parser::ParseDocumentContent()
	{
		Token& token = PeekToken();
		switch(token.type) {
			case Token::DIRECTIVE:
			case Token::DOC_START:
			case Token::DOC_END:
			case Token::STREAM_END:
				m_state = PopState();
				return ParseDocumentEnd();
			default:
				return ParseNode(true);
		}
	}

	Event Parser::ParseDocumentEnd()
	{
		Token& token = PeekToken();
		Event event(Event::DOC_END, token.mark);

		switch(token.type) {
			case Token::DOC_END:
				event.isExplicit = true;
				m_pScanner->pop();
				m_state = IMPLICIT_DOCUMENT_START;
				break;
			case Token::DOC_START:
			case Token::DIRECTIVE:
			case Token::STREAM_END:
				m_state = DOCUMENT_START;
				break;
			default:
				throw ParseError(token.mark, ParseError::UnexpectedToken, ErrorMsg::UNEXPECTED_TOKEN + std::string(TokenNames[token.type]));
		}

		return event;
	}

	// ParseNode
	// . Reads the properties (anchor, tag) and then the node itself.
	Event Parser::ParseNode(bool block)
	{
		Token *pToken = &PeekToken();

		if(pToken->type == Token::ALIAS) {
			Event event = Event::Alias(pToken->mark, pToken->value);
			int line = pToken->endMark.line;
			m_pScanner->pop();
			m_state = PopState();

			// nothing else may follow on the alias' line
			const Token& next = PeekToken();
			if(next.mark.line == line) {
				switch(next.type) {
					case Token::SCALAR:
					case Token::ANCHOR:
					case Token::TAG:
					case Token::ALIAS:
					case Token::FLOW_SEQ_START:
					case Token::FLOW_MAP_START:
						throw ParseError(next.mark, ParseError::AliasWithProperty, ErrorMsg::ALIAS_CONTENT);
					default:
						break;
				}
			}
			return event;
		}

		Mark mark = pToken->mark;
		std::string anchor, tag;
		bool hasAnchor = false, hasTag = false;
		while(pToken->type == Token::ANCHOR || pToken->type == Token::TAG) {
			if(pToken->type == Token::ANCHOR) {
				if(hasAnchor)
					throw ParseError(pToken->mark, ParseError::DuplicateProperty, ErrorMsg::MULTIPLE_ANCHORS);
				hasAnchor = true;
				anchor = pToken->value;
			} else {
				if(hasTag)
					throw ParseError(pToken->mark, ParseError::DuplicateProperty, ErrorMsg::MULTIPLE_TAGS);
				hasTag = true;
				tag = Tag(*pToken).Translate(m_directives);
			}

			m_pScanner->pop();
			pToken = &PeekToken();
		}

		if(pToken->type == Token::ALIAS)
			throw ParseError(pToken->mark, ParseError::AliasWithProperty, ErrorMsg::ALIAS_CONTENT);

		switch(pToken->type) {
			case Token::SCALAR: {
				if(!hasTag)
					tag = pToken->style == ScalarStyle::Plain ? "?" : "!";
				Event event = Event::Scalar(mark, tag, anchor, pToken->value, pToken->style);
				m_pScanner->pop();
				m_state = PopState();
				return event;
			}
			case Token::FLOW_SEQ_START:
			case Token::FLOW_MAP_START:
			case Token::BLOCK_SEQ_START:
			case Token::BLOCK_MAP_START: {
				bool isBlockToken = pToken->type == Token::BLOCK_SEQ_START || pToken->type == Token::BLOCK_MAP_START;
				if(isBlockToken && !block)
					break;

				if(m_marks.size() >= m_options.maxDepth)
					throw ParseError(pToken->mark, ParseError::NestingTooDeep, ErrorMsg::NESTING_TOO_DEEP);
				m_marks.push_back(pToken->mark);

				if(!hasTag)
					tag = "?";
				CollectionStyle::value style = isBlockToken ? CollectionStyle::Block : CollectionStyle::Flow;
				switch(pToken->type) {
					case Token::FLOW_SEQ_START:
						m_state = FLOW_SEQUENCE_FIRST_ENTRY;
						return Event::SequenceStart(mark, tag, anchor, style);
					case Token::FLOW_MAP_START:
						m_state = FLOW_MAPPING_FIRST_KEY;
						return Event::MapStart(mark, tag, anchor, style);
					case Token::BLOCK_SEQ_START:
						m_state = BLOCK_SEQUENCE_FIRST_ENTRY;
						return Event::SequenceStart(mark, tag, anchor, style);
					default:
						m_state = BLOCK_MAPPING_FIRST_KEY;
						return Event::MapStart(mark, tag, anchor, style);
				}
			}
			default:
				break;
		}

		if(!hasAnchor && !hasTag)
			throw ParseError(pToken->mark, ParseError::UnexpectedToken, ErrorMsg::UNEXPECTED_TOKEN + std::string(TokenNames[pToken->type]));

		switch(pToken->type) {
			case Token::DIRECTIVE:
			case Token::DOC_START:
			case Token::DOC_END:
			case Token::STREAM_END:
				throw ParseError(mark, ParseError::DanglingProperty, ErrorMsg::DANGLING_PROPERTY);
			default:
				break;
		}

		// properties on an empty node
		if(!hasTag)
			tag = "?";
		m_state = PopState();
		return Event::Scalar(mark, tag, anchor, "", ScalarStyle::Plain);
	}

	Event Parser::ParseBlockSequenceEntry(bool first)
	{
		if(first)
			m_pScanner->pop();

		Token& token = PeekToken();
		if(token.type == Token::BLOCK_ENTRY) {
			Mark mark = token.endMark;
			m_pScanner->pop();

			Token& next = PeekToken();
			if(next.type != Token::BLOCK_ENTRY && next.type != Token::BLOCK_SEQ_END) {
				m_states.push_back(BLOCK_SEQUENCE_ENTRY);
				return ParseNode(true);
			}

			m_state = BLOCK_SEQUENCE_ENTRY;
			return EmptyScalar(mark);
		}

		if(token.type == Token::BLOCK_SEQ_END) {
			Event event(Event::SEQ_END, token.mark);
			m_pScanner->pop();
			m_marks.pop_back();
			m_state = PopState();
			return event;
		}

		throw ParseError(token.mark, ParseError::UnexpectedToken, ErrorMsg::END_OF_SEQ);
	}

	Event Parser::ParseBlockMappingKey(bool first)
	{
		if(first)
			m_pScanner->pop();

		Token& token = PeekToken();
		switch(token.type) {
			case Token::KEY: {
				Mark mark = token.endMark;
				m_pScanner->pop();

				Token& next = PeekToken();
				if(next.type != Token::KEY && next.type != Token::VALUE && next.type != Token::BLOCK_MAP_END) {
					m_states.push_back(BLOCK_MAPPING_VALUE);
					return ParseNode(true);
				}

				m_state = BLOCK_MAPPING_VALUE;
				return EmptyScalar(mark);
			}
			case Token::VALUE:
				m_state = BLOCK_MAPPING_VALUE;
				return EmptyScalar(token.mark);
			case Token::BLOCK_MAP_END: {
				Event event(Event::MAP_END, token.mark);
				m_pScanner->pop();
				m_marks.pop_back();
				m_state = PopState();
				return event;
			}
			case Token::BLOCK_SEQ_START:
			case Token::BLOCK_ENTRY:
				throw ParseError(token.mark, ParseError::UnexpectedToken, ErrorMsg::SEQ_ENTRY_IN_MAP);
			default:
				throw ParseError(token.mark, ParseError::UnexpectedToken, ErrorMsg::END_OF_MAP);
		}
	}

	Event Parser::ParseBlockMappingValue()
	{
		Token& token = PeekToken();
		if(token.type == Token::VALUE) {
			Mark mark = token.endMark;
			m_pScanner->pop();

			Token& next = PeekToken();
			if(next.type != Token::KEY && next.type != Token::VALUE && next.type != Token::BLOCK_MAP_END) {
				m_states.push_back(BLOCK_MAPPING_KEY);
				return ParseNode(true);
			}

			m_state = BLOCK_MAPPING_KEY;
			return EmptyScalar(mark);
		}

		m_state = BLOCK_MAPPING_KEY;
		return EmptyScalar(token.mark);
	}

	Event Parser::ParseFlowSequenceEntry(bool first)
	{
		if(first)
			m_pScanner->pop();

		Token *pToken = &PeekToken();
		CheckFlowToken(*pToken, Token::FLOW_SEQ_END);

		if(pToken->type != Token::FLOW_SEQ_END) {
			if(!first) {
				if(pToken->type != Token::FLOW_ENTRY)
					throw ParseError(pToken->mark, ParseError::UnexpectedToken, ErrorMsg::END_OF_SEQ_FLOW);

				m_pScanner->pop();
				pToken = &PeekToken();
				CheckFlowToken(*pToken, Token::FLOW_SEQ_END);
			}

			if(pToken->type == Token::KEY) {
				// a single pair mapping: [a: b]
				Event event = Event::MapStart(pToken->mark, "?", "", CollectionStyle::Flow);
				m_pScanner->pop();
				m_state = FLOW_SEQUENCE_ENTRY_MAPPING_KEY;
				return event;
			}

			if(pToken->type != Token::FLOW_SEQ_END) {
				m_states.push_back(FLOW_SEQUENCE_ENTRY);
				return ParseNode(false);
			}
		}

		Event event(Event::SEQ_END, pToken->mark);
		m_pScanner->pop();
		m_marks.pop_back();
		m_state = PopState();
		return event;
	}

	Event Parser::ParseFlowSequenceEntryMappingKey()
	{
		Token& token = PeekToken();
		CheckFlowToken(token, Token::FLOW_SEQ_END);

		if(token.type != Token::VALUE && token.type != Token::FLOW_ENTRY && token.type != Token::FLOW_SEQ_END) {
			m_states.push_back(FLOW_SEQUENCE_ENTRY_MAPPING_VALUE);
			return ParseNode(false);
		}

		m_state = FLOW_SEQUENCE_ENTRY_MAPPING_VALUE;
		return EmptyScalar(token.mark);
	}

	Event Parser::ParseFlowSequenceEntryMappingValue()
	{
		Token *pToken = &PeekToken();
		CheckFlowToken(*pToken, Token::FLOW_SEQ_END);

		if(pToken->type == Token::VALUE) {
			m_pScanner->pop();
			pToken = &PeekToken();
			CheckFlowToken(*pToken, Token::FLOW_SEQ_END);

			if(pToken->type != Token::FLOW_ENTRY && pToken->type != Token::FLOW_SEQ_END) {
				m_states.push_back(FLOW_SEQUENCE_ENTRY_MAPPING_END);
				return ParseNode(false);
			}
		}

		m_state = FLOW_SEQUENCE_ENTRY_MAPPING_END;
		return EmptyScalar(pToken->mark);
	}

	Event Parser::ParseFlowSequenceEntryMappingEnd()
	{
		m_state = FLOW_SEQUENCE_ENTRY;
		return Event(Event::MAP_END, PeekToken().mark);
	}

	Event Parser::ParseFlowMappingKey(bool first)
	{
		if(first)
			m_pScanner->pop();

		Token *pToken = &PeekToken();
		CheckFlowToken(*pToken, Token::FLOW_MAP_END);

		if(pToken->type != Token::FLOW_MAP_END) {
			if(!first) {
				if(pToken->type != Token::FLOW_ENTRY)
					throw ParseError(pToken->mark, ParseError::UnexpectedToken, ErrorMsg::END_OF_MAP_FLOW);

				m_pScanner->pop();
				pToken = &PeekToken();
				CheckFlowToken(*pToken, Token::FLOW_MAP_END);
			}

			if(pToken->type == Token::KEY) {
				m_pScanner->pop();
				pToken = &PeekToken();
				CheckFlowToken(*pToken, Token::FLOW_MAP_END);

				if(pToken->type != Token::VALUE && pToken->type != Token::FLOW_ENTRY && pToken->type != Token::FLOW_MAP_END) {
					m_states.push_back(FLOW_MAPPING_VALUE);
					return ParseNode(false);
				}

				m_state = FLOW_MAPPING_VALUE;
				return EmptyScalar(pToken->mark);
			}

			if(pToken->type == Token::VALUE) {
				m_state = FLOW_MAPPING_VALUE;
				return EmptyScalar(pToken->mark);
			}

			if(pToken->type != Token::FLOW_MAP_END) {
				m_states.push_back(FLOW_MAPPING_EMPTY_VALUE);
				return ParseNode(false);
			}
		}

		Event event(Event::MAP_END, pToken->mark);
		m_pScanner->pop();
		m_marks.pop_back();
		m_state = PopState();
		return event;
	}

	Event Parser::ParseFlowMappingValue(bool empty)
	{
		Token *pToken = &PeekToken();
		CheckFlowToken(*pToken, Token::FLOW_MAP_END);

		if(empty) {
			m_state = FLOW_MAPPING_KEY;
			return EmptyScalar(pToken->mark);
		}

		if(pToken->type == Token::VALUE) {
			m_pScanner->pop();
			pToken = &PeekToken();
			CheckFlowToken(*pToken, Token::FLOW_MAP_END);

			if(pToken->type != Token::FLOW_ENTRY && pToken->type != Token::FLOW_MAP_END) {
				m_states.push_back(FLOW_MAPPING_KEY);
				return ParseNode(false);
			}
		}

		m_state = FLOW_MAPPING_KEY;
		return EmptyScalar(pToken->mark);
	}

	// ParseDirectives
	// . Reads any directives that are next in the queue. Directives
	//   only ever apply to the document that follows them.
	void Parser::ParseDirectives()
	{
		m_directives = Directives();

		while(1) {
			Token& token = PeekToken();
			if(token.type != Token::DIRECTIVE)
				break;

			HandleDirective(token);
			m_pScanner->pop();
		}
	}

	void Parser::HandleDirective(const Token& token)
	{
		if(token.value == "YAML")
			HandleYamlDirective(token);
		else if(token.value == "TAG")
			HandleTagDirective(token);
		else
			ytree_log.warning("ignoring unknown directive %{} at line {}", token.value, token.mark.line + 1);
	}

	// HandleYamlDirective
	// . Should be of the form 'major.minor' (like a version number)
	void Parser::HandleYamlDirective(const Token& token)
	{
		if(token.params.size() != 1)
			throw ParseError(token.mark, ParseError::InvalidDirective, ErrorMsg::YAML_DIRECTIVE_ARGS);

		if(!m_directives.version.isDefault)
			throw ParseError(token.mark, ParseError::DirectiveConflict, ErrorMsg::REPEATED_YAML_DIRECTIVE);

		std::stringstream str(token.params[0]);
		int major = 0, minor = 0;
		str >> major;
		if(str.get() != '.')
			throw ParseError(token.mark, ParseError::InvalidDirective, ErrorMsg::YAML_VERSION + token.params[0]);
		str >> minor;
		if(!str || str.peek() != EOF)
			throw ParseError(token.mark, ParseError::InvalidDirective, ErrorMsg::YAML_VERSION + token.params[0]);

		if(major != 1)
			throw ParseError(token.mark, ParseError::InvalidDirective, ErrorMsg::YAML_MAJOR_VERSION);

		if(minor > 2)
			ytree_log.warning("document declares YAML {}.{}; reading it as YAML 1.2", major, minor);

		m_directives.version.isDefault = false;
		m_directives.version.major = major;
		m_directives.version.minor = minor;
	}

	// HandleTagDirective
	// . Should be of the form 'handle prefix', where 'handle' is converted to 'prefix' in the file.
	void Parser::HandleTagDirective(const Token& token)
	{
		if(token.params.size() != 2)
			throw ParseError(token.mark, ParseError::InvalidDirective, ErrorMsg::TAG_DIRECTIVE_ARGS);

		const std::string& handle = token.params[0];
		const std::string& prefix = token.params[1];
		if(m_directives.tags.find(handle) != m_directives.tags.end())
			throw ParseError(token.mark, ParseError::DirectiveConflict, ErrorMsg::REPEATED_TAG_DIRECTIVE);

		m_directives.tags[handle] = prefix;
	}

	std::vector<Event> ParseEvents(std::istream& in, const ParserOptions& options)
	{
		std::vector<Event> events;
		Parser parser(in, options);
		Event event;
		while(parser.GetNextEvent(event))
			events.push_back(event);
		return events;
	}

	std::vector<Event> ParseEvents(const std::string& input, const ParserOptions& options)
	{
		std::stringstream stream(input);
		return ParseEvents(stream, options);
	}
}
