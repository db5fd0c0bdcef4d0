#include "scanner.h"
#include "exp.h"
#include "scanscalar.h"
#include "scantag.h"
#include "tag.h"
#include "ytree/exceptions.h"
#include "ytree/log.h"

namespace YTree
{
	///////////////////////////////////////////////////////////////////////
	// Specialization for scanning specific tokens

	// Comment
	// . The text runs from after the '#' to the end of the line, trimmed.
	void Scanner::ScanComment()
	{
		Token token(Token::COMMENT, INPUT.mark());
		token.data = (INPUT.line() == m_lastContentLine ? 1 : 0);

		// eat the indicator
		INPUT.eat(1);

		std::string text;
		while(INPUT && !Exp::Break().Matches(INPUT))
			text += INPUT.get();

		std::size_t first = text.find_first_not_of(" \t");
		if(first == std::string::npos)
			text.clear();
		else
			text = text.substr(first, text.find_last_not_of(" \t") - first + 1);

		token.value = text;
		token.endMark = INPUT.mark();
		m_tokens.push(token);
	}

	// Directive
	// . Note: no semantic checking is done here (that's for the parser to do)
	void Scanner::ScanDirective()
	{
		// pop indents and simple keys
		PopAllIndents();
		PopAllSimpleKeys();

		m_simpleKeyAllowed = false;
		m_canBeJSONFlow = false;

		// store pos and eat indicator
		Token token(Token::DIRECTIVE, INPUT.mark());
		INPUT.eat(1);

		// read name
		while(INPUT && !Exp::BlankOrBreak().Matches(INPUT))
			token.value += INPUT.get();

		// read parameters
		while(1) {
			// first get rid of whitespace
			while(Exp::Blank().Matches(INPUT))
				INPUT.eat(1);

			// break on newline or comment
			if(!INPUT || Exp::Break().Matches(INPUT) || Exp::Comment().Matches(INPUT))
				break;

			// now read parameter
			std::string param;
			while(INPUT && !Exp::BlankOrBreak().Matches(INPUT))
				param += INPUT.get();

			token.params.push_back(param);
		}

		token.endMark = INPUT.mark();
		EnqueueToken(token);
	}

	// DocStart
	void Scanner::ScanDocStart()
	{
		while(!m_flows.empty())
			m_flows.pop();
		PopAllIndents();
		PopAllSimpleKeys();
		m_simpleKeyAllowed = false;
		m_canBeJSONFlow = false;

		// eat
		Token token(Token::DOC_START, INPUT.mark());
		INPUT.eat(3);
		token.endMark = INPUT.mark();
		EnqueueToken(token);
	}

	// DocEnd
	void Scanner::ScanDocEnd()
	{
		while(!m_flows.empty())
			m_flows.pop();
		PopAllIndents();
		PopAllSimpleKeys();
		m_simpleKeyAllowed = false;
		m_canBeJSONFlow = false;

		// eat
		Token token(Token::DOC_END, INPUT.mark());
		INPUT.eat(3);
		token.endMark = INPUT.mark();
		EnqueueToken(token);
	}

	// FlowStart
	void Scanner::ScanFlowStart()
	{
		// flows can be simple keys
		InsertPotentialSimpleKey();
		m_simpleKeyAllowed = true;
		m_canBeJSONFlow = false;

		// eat
		Mark mark = INPUT.mark();
		char ch = INPUT.get();
		FLOW_MARKER flowType = (ch == Keys::FlowSeqStart ? FLOW_SEQ : FLOW_MAP);
		m_flows.push(flowType);

		Token token(flowType == FLOW_SEQ ? Token::FLOW_SEQ_START : Token::FLOW_MAP_START, mark);
		token.endMark = INPUT.mark();
		EnqueueToken(token);
	}

	// FlowEnd
	// . A close bracket that doesn't match its opener is still queued;
	//   the parser reports it against the unclosed collection.
	void Scanner::ScanFlowEnd()
	{
		// we might have a solo entry in the flow context
		if(InFlowContext()) {
			if(m_flows.top() == FLOW_MAP && VerifySimpleKey())
				PushToken(Token::VALUE);
			else if(m_flows.top() == FLOW_SEQ)
				InvalidateSimpleKey();
		}

		m_simpleKeyAllowed = false;
		m_canBeJSONFlow = true;

		// eat
		Mark mark = INPUT.mark();
		char ch = INPUT.get();
		if(InFlowContext())
			m_flows.pop();

		Token token(ch == Keys::FlowSeqEnd ? Token::FLOW_SEQ_END : Token::FLOW_MAP_END, mark);
		token.endMark = INPUT.mark();
		EnqueueToken(token);
	}

	// FlowEntry
	void Scanner::ScanFlowEntry()
	{
		// we might have a solo entry in the flow context
		if(InFlowContext()) {
			if(m_flows.top() == FLOW_MAP && VerifySimpleKey())
				PushToken(Token::VALUE);
			else if(m_flows.top() == FLOW_SEQ)
				InvalidateSimpleKey();
		}

		m_simpleKeyAllowed = true;
		m_canBeJSONFlow = false;

		// eat
		Token token(Token::FLOW_ENTRY, INPUT.mark());
		INPUT.eat(1);
		token.endMark = INPUT.mark();
		EnqueueToken(token);
	}

	// BlockEntry
	void Scanner::ScanBlockEntry()
	{
		// we better be in the block context!
		if(InFlowContext())
			throw ParseError(INPUT.mark(), ParseError::UnexpectedToken, ErrorMsg::BLOCK_ENTRY);

		// can we put it here?
		if(!m_simpleKeyAllowed)
			throw ParseError(INPUT.mark(), ParseError::UnexpectedToken, ErrorMsg::BLOCK_ENTRY);

		PushIndentTo(INPUT.column(), IndentMarker::SEQ);
		m_simpleKeyAllowed = true;
		m_canBeJSONFlow = false;

		// eat
		Token token(Token::BLOCK_ENTRY, INPUT.mark());
		INPUT.eat(1);
		token.endMark = INPUT.mark();
		EnqueueToken(token);
	}

	// Key
	void Scanner::ScanKey()
	{
		// handle keys diffently in the block context (and manage indents)
		if(InBlockContext()) {
			if(!m_simpleKeyAllowed)
				throw ParseError(INPUT.mark(), ParseError::UnexpectedToken, ErrorMsg::MAP_KEY);

			PushIndentTo(INPUT.column(), IndentMarker::MAP);
		}

		// can only put a simple key here if we're in block context
		m_simpleKeyAllowed = InBlockContext();

		// eat
		Token token(Token::KEY, INPUT.mark());
		INPUT.eat(1);
		token.endMark = INPUT.mark();
		EnqueueToken(token);
	}

	// Value
	void Scanner::ScanValue()
	{
		// and check that simple key
		bool isSimpleKey = VerifySimpleKey();
		m_canBeJSONFlow = false;

		if(isSimpleKey) {
			// can't follow a simple key with another simple key (dunno why, though - it seems fine)
			m_simpleKeyAllowed = false;
		} else {
			// handle values diffently in the block context (and manage indents)
			if(InBlockContext()) {
				if(!m_simpleKeyAllowed)
					throw ParseError(INPUT.mark(), ParseError::UnexpectedToken, ErrorMsg::MAP_VALUE);

				PushIndentTo(INPUT.column(), IndentMarker::MAP);
			}

			// can only put a simple key here if we're in block context
			m_simpleKeyAllowed = InBlockContext();
		}

		// eat
		Token token(Token::VALUE, INPUT.mark());
		INPUT.eat(1);
		token.endMark = INPUT.mark();
		EnqueueToken(token);
	}

	// AnchorOrAlias
	void Scanner::ScanAnchorOrAlias()
	{
		bool alias;
		std::string name;

		// insert a potential simple key
		InsertPotentialSimpleKey();
		m_simpleKeyAllowed = false;
		m_canBeJSONFlow = false;

		// eat the indicator
		Mark mark = INPUT.mark();
		char indicator = INPUT.get();
		alias = (indicator == Keys::Alias);

		// now eat the content
		while(INPUT && Exp::Anchor().Matches(INPUT))
			name += INPUT.get();

		// we need to have read SOMETHING!
		if(name.empty())
			throw LexError(INPUT.mark(), LexError::InvalidCharacter, alias ? ErrorMsg::ALIAS_NOT_FOUND : ErrorMsg::ANCHOR_NOT_FOUND);

		// and needs to end correctly
		if(INPUT && !Exp::AnchorEnd().Matches(INPUT))
			throw LexError(INPUT.mark(), LexError::InvalidCharacter, alias ? ErrorMsg::CHAR_IN_ALIAS : ErrorMsg::CHAR_IN_ANCHOR);

		// and we're done
		Token token(alias ? Token::ALIAS : Token::ANCHOR, mark);
		token.value = name;
		token.endMark = INPUT.mark();
		EnqueueToken(token);
	}

	// Tag
	// . The token keeps the handle as written ("!", "!!" or "!name!") in 'value'
	//   and the suffix in params[0]; a verbatim tag has an empty handle.
	void Scanner::ScanTag()
	{
		// insert a potential simple key
		InsertPotentialSimpleKey();
		m_simpleKeyAllowed = false;
		m_canBeJSONFlow = false;

		Token token(Token::TAG, INPUT.mark());

		// eat the indicator
		INPUT.get();

		if(INPUT && INPUT.peek() == Keys::VerbatimTagStart) {
			token.params.push_back(ScanVerbatimTag(INPUT));
			token.data = Tag::VERBATIM;
		} else {
			bool canBeHandle;
			std::string name = ScanTagHandle(INPUT, canBeHandle);

			if(canBeHandle && INPUT.peek() == Keys::Tag) {
				// eat the closing indicator
				INPUT.get();
				token.value = "!" + name + "!";
				token.params.push_back(ScanTagSuffix(INPUT, false));
				token.data = (name.empty() ? Tag::SECONDARY_HANDLE : Tag::NAMED_HANDLE);
			} else {
				// what we read (and anything after it) is the suffix of the primary handle
				token.value = "!";
				token.params.push_back(name + ScanTagSuffix(INPUT, true));
				token.data = (token.params[0].empty() ? Tag::NON_SPECIFIC : Tag::PRIMARY_HANDLE);
			}
		}

		token.endMark = INPUT.mark();
		EnqueueToken(token);
	}

	// PlainScalar
	void Scanner::ScanPlainScalar()
	{
		std::string scalar;

		// set up the scanning parameters
		ScanScalarParams params;
		params.end = (InFlowContext() ? &Exp::ScanScalarEndInFlow() : &Exp::ScanScalarEnd());
		params.eatEnd = false;
		params.indent = (InFlowContext() ? 0 : GetTopIndent() + 1);
		params.fold = FOLD_FLOW;
		params.eatLeadingWhitespace = true;
		params.trimTrailingSpaces = true;
		params.chomp = STRIP;
		params.onDocIndicator = BREAK;
		params.onTabInIndentation = THROW;

		// insert a potential simple key
		InsertPotentialSimpleKey();

		Mark mark = INPUT.mark();
		params.startMark = mark;
		scalar = ScanScalar(INPUT, params);

		// can have a simple key only if we ended the scalar by starting a new line
		m_simpleKeyAllowed = params.leadingSpaces;
		m_canBeJSONFlow = false;

		Token token(Token::SCALAR, mark);
		token.value = scalar;
		token.style = ScalarStyle::Plain;
		token.endMark = params.endMark;
		EnqueueToken(token);
	}

	// QuotedScalar
	void Scanner::ScanQuotedScalar()
	{
		std::string scalar;

		// peek at single or double quote (don't eat because we need to preserve (for the time being) the input position)
		char quote = INPUT.peek();
		bool single = (quote == '\'');

		// setup the scanning parameters
		ScanScalarParams params;
		RegEx end = (single ? RegEx(quote) && !Exp::EscSingleQuote() : RegEx(quote));
		params.end = &end;
		params.eatEnd = true;
		params.escape = (single ? '\'' : '\\');
		params.indent = 0;
		params.fold = FOLD_FLOW;
		params.eatLeadingWhitespace = true;
		params.trimTrailingSpaces = false;
		params.chomp = CLIP;
		params.onDocIndicator = THROW;

		// insert a potential simple key
		InsertPotentialSimpleKey();

		Mark mark = INPUT.mark();
		params.startMark = mark;

		// now eat that opening quote
		INPUT.get();

		// and scan
		scalar = ScanScalar(INPUT, params);
		m_simpleKeyAllowed = false;
		m_canBeJSONFlow = true;

		Token token(Token::SCALAR, mark);
		token.value = scalar;
		token.style = (single ? ScalarStyle::SingleQuoted : ScalarStyle::DoubleQuoted);
		token.endMark = params.endMark;
		EnqueueToken(token);
	}

	// BlockScalarToken
	// . These need a little extra processing beforehand.
	// . We need to scan the line where the indicator is (this doesn't count as part of the scalar),
	//   and then we need to figure out what level of indentation we'll be using.
	void Scanner::ScanBlockScalar()
	{
		std::string scalar;

		ScanScalarParams params;
		params.indent = 1;
		params.detectIndent = true;

		// eat block indicator ('|' or '>')
		Mark mark = INPUT.mark();
		char indicator = INPUT.get();
		params.fold = (indicator == Keys::FoldedScalar ? FOLD_BLOCK : DONT_FOLD);

		// eat chomping/indentation indicators
		params.chomp = CLIP;
		int n = Exp::Chomp().Match(INPUT);
		for(int i=0;i<n;i++) {
			char ch = INPUT.get();
			if(ch == '+')
				params.chomp = KEEP;
			else if(ch == '-')
				params.chomp = STRIP;
			else if(Exp::Digit().Matches(ch)) {
				if(ch == '0')
					throw LexError(INPUT.mark(), LexError::InvalidCharacter, ErrorMsg::ZERO_INDENT_IN_BLOCK);

				params.indent = ch - '0';
				params.detectIndent = false;
			}
		}

		// now eat whitespace
		while(Exp::Blank().Matches(INPUT))
			INPUT.eat(1);

		// and comments to the end of the line
		if(Exp::Comment().Matches(INPUT))
			ScanComment();

		// if it's not a line break, then we ran into a bad character inline
		if(INPUT && !Exp::Break().Matches(INPUT))
			throw LexError(INPUT.mark(), LexError::InvalidCharacter, ErrorMsg::CHAR_IN_BLOCK);

		// set the initial indentation
		if(GetTopIndent() >= 0)
			params.indent += GetTopIndent();
		else if(params.detectIndent)
			params.indent = 0;

		params.eatLeadingWhitespace = false;
		params.onDocIndicator = BREAK;
		params.trimTrailingSpaces = false;
		params.onTabInIndentation = THROW;
		params.startMark = mark;

		scalar = ScanScalar(INPUT, params);

		// simple keys always ok after block scalars (since we're gonna start a new line anyways)
		m_simpleKeyAllowed = true;
		m_canBeJSONFlow = false;

		Token token(Token::SCALAR, mark);
		token.value = scalar;
		token.style = (params.fold == FOLD_BLOCK ? ScalarStyle::Folded : ScalarStyle::Literal);
		token.endMark = params.endMark;
		EnqueueToken(token);

		ytree_log.trace("block scalar at line {} (indent {})", mark.line + 1, params.indent);
	}
}
