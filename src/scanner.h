#ifndef SCANNER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define SCANNER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include <ios>
#include <memory>
#include <string>
#include <queue>
#include <stack>
#include <vector>
#include "ytree/noncopyable.h"
#include "ytree/token.h"
#include "stream.h"

namespace YTree
{
	// Scanner
	// . Turns the character stream into tokens. Tokens whose validity depends
	//   on input not yet read (a possible simple key and the block mapping it
	//   would open) are queued as UNVERIFIED and held back until they're decided.
	class Scanner: private noncopyable
	{
	public:
		Scanner(std::istream& in);
		~Scanner();

		// token queue management (hopefully this looks kinda stl-ish)
		bool empty();
		void pop();
		Token& peek();
		Mark mark() const;

		// Resynchronize
		// . Drops all scanning state and skips the input to the next line
		//   at or after 'errorMark' that starts with a document marker.
		void Resynchronize(const Mark& errorMark);

	private:
		struct IndentMarker {
			enum INDENT_TYPE { MAP, SEQ, NONE };
			enum STATUS { VALID, INVALID, UNKNOWN };
			IndentMarker(int column_, INDENT_TYPE type_): column(column_), type(type_), status(VALID), pStartToken(0) {}

			int column;
			INDENT_TYPE type;
			STATUS status;
			Token *pStartToken;
		};

		enum FLOW_MARKER { FLOW_MAP, FLOW_SEQ };

	private:
		// scanning
		void EnsureTokensInQueue();
		void ScanNextToken();
		void ScanToNextToken();
		void StartStream();
		void EndStream();
		Token *PushToken(Token::TYPE type);
		void EnqueueToken(const Token& token);

		bool InFlowContext() const { return !m_flows.empty(); }
		bool InBlockContext() const { return m_flows.empty(); }
		int GetFlowLevel() const { return static_cast<int>(m_flows.size()); }

		Token::TYPE GetStartTokenFor(IndentMarker::INDENT_TYPE type) const;
		IndentMarker *PushIndentTo(int column, IndentMarker::INDENT_TYPE type);
		void PopIndentToHere();
		void PopAllIndents();
		void PopIndent();
		int GetTopIndent() const;

		// checking input
		bool CanInsertPotentialSimpleKey() const;
		bool ExistsActiveSimpleKey() const;
		void InsertPotentialSimpleKey();
		void InvalidateSimpleKey();
		bool VerifySimpleKey();
		void PopAllSimpleKeys();

		bool IsRestOfLineBlank() const;
		void CheckTabInIndentation(bool atLineStart) const;

		struct SimpleKey {
			SimpleKey(const Mark& mark_, int flowLevel_);

			void Validate();
			void Invalidate();

			Mark mark;
			int flowLevel;
			IndentMarker *pIndent;
			Token *pMapStart, *pKey;
		};

		// and the tokens
		void ScanComment();
		void ScanDirective();
		void ScanDocStart();
		void ScanDocEnd();
		void ScanBlockSeqStart();
		void ScanBlockMapSTart();
		void ScanBlockEnd();
		void ScanBlockEntry();
		void ScanFlowStart();
		void ScanFlowEnd();
		void ScanFlowEntry();
		void ScanKey();
		void ScanValue();
		void ScanAnchorOrAlias();
		void ScanTag();
		void ScanPlainScalar();
		void ScanQuotedScalar();
		void ScanBlockScalar();

	private:
		// the stream
		Stream INPUT;

		// the output (tokens)
		std::queue <Token> m_tokens;

		// state info
		bool m_startedStream, m_endedStream;
		bool m_simpleKeyAllowed;
		bool m_canBeJSONFlow;
		int m_lastContentLine;          // line on which the last non-comment token ended
		std::stack <SimpleKey> m_simpleKeys;
		std::stack <IndentMarker *> m_indents;
		std::vector <std::unique_ptr<IndentMarker> > m_indentRefs; // for "garbage collection"
		std::stack <FLOW_MARKER> m_flows;
	};
}

#endif // SCANNER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
