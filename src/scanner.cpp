#include "scanner.h"
#include "exp.h"
#include "ytree/exceptions.h"
#include "ytree/log.h"
#include <cassert>

namespace YTree
{
	Scanner::Scanner(std::istream& in)
		: INPUT(in), m_startedStream(false), m_endedStream(false), m_simpleKeyAllowed(false), m_canBeJSONFlow(false), m_lastContentLine(-1)
	{
	}

	Scanner::~Scanner()
	{
	}

	// empty
	// . Returns true if there are no more tokens to be read
	bool Scanner::empty()
	{
		EnsureTokensInQueue();
		return m_tokens.empty();
	}

	// pop
	// . Simply removes the next token on the queue.
	void Scanner::pop()
	{
		EnsureTokensInQueue();
		if(!m_tokens.empty())
			m_tokens.pop();
	}

	// peek
	// . Returns (but does not remove) the next token on the queue.
	Token& Scanner::peek()
	{
		EnsureTokensInQueue();
		assert(!m_tokens.empty());  // callers check empty() first
		return m_tokens.front();
	}

	// mark
	// . Returns the current input position.
	Mark Scanner::mark() const
	{
		return INPUT.mark();
	}

	// EnsureTokensInQueue
	// . Scan until there's a valid token at the front of the queue,
	//   or we're sure the queue is empty.
	void Scanner::EnsureTokensInQueue()
	{
		while(1) {
			if(!m_tokens.empty()) {
				Token& token = m_tokens.front();

				// if this guy's valid, then we're done
				if(token.status == Token::VALID)
					return;

				// here's where we clean up the impossible tokens
				if(token.status == Token::INVALID) {
					m_tokens.pop();
					continue;
				}

				// note: what's left are the unverified tokens
			}

			// no token? maybe we've actually finished
			if(m_endedStream)
				return;

			// no? then scan...
			ScanNextToken();
		}
	}

	// ScanNextToken
	// . The main scanning function; here we branch out and
	//   scan whatever the next token should be.
	void Scanner::ScanNextToken()
	{
		if(m_endedStream)
			return;

		if(!m_startedStream)
			return StartStream();

		// get rid of whitespace, etc. (in between tokens it should be irrelevent)
		ScanToNextToken();

		// maybe need to end some blocks
		PopIndentToHere();

		// *****
		// And now branch based on the next few characters!
		// *****

		// end of stream
		if(!INPUT)
			return EndStream();

		if(INPUT.column() == 0 && INPUT.peek() == Keys::Directive)
			return ScanDirective();

		// document token
		if(INPUT.column() == 0 && Exp::DocStart().Matches(INPUT))
			return ScanDocStart();

		if(INPUT.column() == 0 && Exp::DocEnd().Matches(INPUT))
			return ScanDocEnd();

		// flow start/end/entry
		if(INPUT.peek() == Keys::FlowSeqStart || INPUT.peek() == Keys::FlowMapStart)
			return ScanFlowStart();

		if(INPUT.peek() == Keys::FlowSeqEnd || INPUT.peek() == Keys::FlowMapEnd)
			return ScanFlowEnd();

		if(INPUT.peek() == Keys::FlowEntry)
			return ScanFlowEntry();

		// block/map stuff
		if(Exp::BlockEntry().Matches(INPUT))
			return ScanBlockEntry();

		if((InBlockContext() ? Exp::Key() : Exp::KeyInFlow()).Matches(INPUT))
			return ScanKey();

		if(InBlockContext() ? Exp::Value().Matches(INPUT) : (m_canBeJSONFlow ? Exp::ValueInJSONFlow() : Exp::ValueInFlow()).Matches(INPUT))
			return ScanValue();

		// alias/anchor
		if(INPUT.peek() == Keys::Alias || INPUT.peek() == Keys::Anchor)
			return ScanAnchorOrAlias();

		// tag
		if(INPUT.peek() == Keys::Tag)
			return ScanTag();

		// special scalars
		if(InBlockContext() && (INPUT.peek() == Keys::LiteralScalar || INPUT.peek() == Keys::FoldedScalar))
			return ScanBlockScalar();

		if(INPUT.peek() == '\'' || INPUT.peek() == '\"')
			return ScanQuotedScalar();

		// plain scalars
		if((InBlockContext() ? Exp::PlainScalar() : Exp::PlainScalarInFlow()).Matches(INPUT))
			return ScanPlainScalar();

		// don't know what it is!
		throw LexError(INPUT.mark(), LexError::InvalidCharacter, ErrorMsg::UNKNOWN_TOKEN);
	}

	// ScanToNextToken
	// . Eats input until we reach the next token-like thing.
	void Scanner::ScanToNextToken()
	{
		bool atLineStart = (INPUT.column() == 0);
		while(1) {
			// first eat whitespace
			while(INPUT && Exp::Blank().Matches(INPUT)) {
				CheckTabInIndentation(atLineStart);
				INPUT.eat(1);
			}

			// then eat a comment
			if(Exp::Comment().Matches(INPUT))
				ScanComment();

			// if it's NOT a line break, then we're done!
			if(!Exp::Break().Matches(INPUT))
				break;

			// otherwise, let's eat the line break and keep going
			int n = Exp::Break().Match(INPUT);
			INPUT.eat(n);
			atLineStart = true;

			// oh yeah, and let's get rid of that simple key
			InvalidateSimpleKey();

			// new line - we may be able to accept a simple key now
			if(InBlockContext())
				m_simpleKeyAllowed = true;
		}
	}

	///////////////////////////////////////////////////////////////////////
	// Misc. helpers

	// IsRestOfLineBlank
	// . True if nothing but blanks (and maybe a comment) remain on this line.
	bool Scanner::IsRestOfLineBlank() const
	{
		for(std::size_t i=0;;i++) {
			char ch = INPUT.peekAt(i);
			if(ch == ' ' || ch == '\t')
				continue;
			return ch == '\n' || ch == '\r' || ch == '#' || ch == Stream::eof();
		}
	}

	// CheckTabInIndentation
	// . Indentation is made of spaces only; a tab among the leading blanks of a
	//   block context line that carries content is an error.
	void Scanner::CheckTabInIndentation(bool atLineStart) const
	{
		if(!atLineStart || InFlowContext() || INPUT.peek() != '\t')
			return;

		if(!IsRestOfLineBlank())
			throw LexError(INPUT.mark(), LexError::TabInIndentation, ErrorMsg::TAB_IN_INDENTATION);
	}

	// StartStream
	// . Set the initial conditions for starting a stream.
	void Scanner::StartStream()
	{
		m_startedStream = true;
		m_simpleKeyAllowed = true;
		std::unique_ptr<IndentMarker> pIndent(new IndentMarker(-1, IndentMarker::NONE));
		m_indents.push(pIndent.get());
		m_indentRefs.push_back(std::move(pIndent));

		Token token(Token::STREAM_START, INPUT.mark());
		m_tokens.push(token);
		ytree_log.trace("stream start (encoding {})", static_cast<int>(INPUT.charset()));
	}

	// EndStream
	// . Close out the stream, finish up, etc.
	void Scanner::EndStream()
	{
		// force newline
		if(INPUT.column() > 0)
			INPUT.ResetColumn();

		PopAllIndents();
		PopAllSimpleKeys();

		m_simpleKeyAllowed = false;
		m_endedStream = true;

		m_tokens.push(Token(Token::STREAM_END, INPUT.mark()));
	}

	Token *Scanner::PushToken(Token::TYPE type)
	{
		m_tokens.push(Token(type, INPUT.mark()));
		return &m_tokens.back();
	}

	// EnqueueToken
	// . Queues a finished content token and remembers the line it ended on.
	void Scanner::EnqueueToken(const Token& token)
	{
		m_tokens.push(token);
		m_lastContentLine = token.endMark.line;
	}

	Token::TYPE Scanner::GetStartTokenFor(IndentMarker::INDENT_TYPE type) const
	{
		switch(type) {
			case IndentMarker::SEQ: return Token::BLOCK_SEQ_START;
			case IndentMarker::MAP: return Token::BLOCK_MAP_START;
			case IndentMarker::NONE: break;
		}
		throw ParseError(INPUT.mark(), ParseError::UnexpectedToken, ErrorMsg::UNKNOWN_TOKEN);
	}

	// PushIndentTo
	// . Pushes an indentation onto the stack, and enqueues the
	//   proper token (sequence start or mapping start).
	// . Returns the indent marker it generates (if any).
	Scanner::IndentMarker *Scanner::PushIndentTo(int column, IndentMarker::INDENT_TYPE type)
	{
		// are we in flow?
		if(InFlowContext())
			return 0;

		std::unique_ptr<IndentMarker> pIndent(new IndentMarker(column, type));
		IndentMarker& indent = *pIndent;
		const IndentMarker& lastIndent = *m_indents.top();

		// is this actually an indentation?
		if(indent.column < lastIndent.column)
			return 0;
		if(indent.column == lastIndent.column && !(indent.type == IndentMarker::SEQ && lastIndent.type == IndentMarker::MAP))
			return 0;

		// push a start token
		indent.pStartToken = PushToken(GetStartTokenFor(type));

		// and then the indent
		m_indents.push(&indent);
		m_indentRefs.push_back(std::move(pIndent));
		return m_indentRefs.back().get();
	}

	// PopIndentToHere
	// . Pops indentations off the stack until we reach the current indentation level,
	//   and enqueues the proper token each time.
	// . Landing strictly between two open levels is an error.
	void Scanner::PopIndentToHere()
	{
		// are we in flow?
		if(InFlowContext())
			return;

		// now pop away
		bool popped = false;
		while(!m_indents.empty()) {
			const IndentMarker& indent = *m_indents.top();
			if(indent.column < INPUT.column())
				break;
			if(indent.column == INPUT.column() && !(indent.type == IndentMarker::SEQ && !Exp::BlockEntry().Matches(INPUT)))
				break;

			if(indent.status == IndentMarker::VALID)
				popped = true;
			PopIndent();
		}

		while(!m_indents.empty() && m_indents.top()->status == IndentMarker::INVALID)
			PopIndent();

		if(popped && INPUT && !m_indents.empty()) {
			const IndentMarker& indent = *m_indents.top();
			if(indent.type != IndentMarker::NONE && INPUT.column() > indent.column)
				throw LexError(INPUT.mark(), LexError::InconsistentIndentation, ErrorMsg::INCONSISTENT_INDENT);
		}
	}

	// PopAllIndents
	// . Pops all indentations (except for the base empty one) off the stack,
	//   and enqueues the proper token each time.
	void Scanner::PopAllIndents()
	{
		// are we in flow?
		if(InFlowContext())
			return;

		// now pop away
		while(!m_indents.empty()) {
			const IndentMarker& indent = *m_indents.top();
			if(indent.type == IndentMarker::NONE)
				break;

			PopIndent();
		}
	}

	// PopIndent
	// . Pops a single indent, pushing the proper token
	void Scanner::PopIndent()
	{
		const IndentMarker& indent = *m_indents.top();
		m_indents.pop();

		if(indent.status != IndentMarker::VALID) {
			InvalidateSimpleKey();
			return;
		}

		if(indent.type == IndentMarker::SEQ)
			m_tokens.push(Token(Token::BLOCK_SEQ_END, INPUT.mark()));
		else if(indent.type == IndentMarker::MAP)
			m_tokens.push(Token(Token::BLOCK_MAP_END, INPUT.mark()));
	}

	// GetTopIndent
	int Scanner::GetTopIndent() const
	{
		if(m_indents.empty())
			return 0;
		return m_indents.top()->column;
	}

	// Resynchronize
	// . Used after an error when the caller wants to go on with the next
	//   document: anything already scanned past a document boundary is kept,
	//   otherwise the input is skipped up to the next "---" or "..." line.
	void Scanner::Resynchronize(const Mark& errorMark)
	{
		bool atBoundary = false;
		while(!m_tokens.empty()) {
			const Token& token = m_tokens.front();
			if(token.status == Token::VALID && token.mark.pos >= errorMark.pos &&
				(token.type == Token::DOC_START || token.type == Token::DOC_END || token.type == Token::STREAM_END)) {
				atBoundary = true;
				break;
			}
			m_tokens.pop();
		}

		while(!m_simpleKeys.empty())
			m_simpleKeys.pop();
		while(!m_flows.empty())
			m_flows.pop();
		while(m_indents.size() > 1)
			m_indents.pop();
		m_simpleKeyAllowed = true;
		m_canBeJSONFlow = false;

		if(atBoundary) {
			ytree_log.notice("resuming at line {} after an error", m_tokens.front().mark.line + 1);
			return;
		}

		if(m_endedStream) {
			m_tokens.push(Token(Token::STREAM_END, INPUT.mark()));
			return;
		}

		while(INPUT) {
			if(INPUT.column() == 0 && INPUT.pos() >= errorMark.pos && Exp::DocIndicator().Matches(INPUT))
				break;
			INPUT.eat(1);
		}

		ytree_log.notice("resuming at line {} after an error", INPUT.line() + 1);
	}
}
