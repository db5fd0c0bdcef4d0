#ifndef PARSER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define PARSER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"
#include "ytree/directives.h"
#include "ytree/event.h"
#include "ytree/mark.h"
#include "ytree/noncopyable.h"
#include <cstddef>
#include <ios>
#include <memory>
#include <string>
#include <vector>

namespace YTree
{
	class Scanner;
	class EventHandler;
	struct Token;

	struct YTREE_API ParserOptions {
		ParserOptions(): strict(true), maxDepth(512) {}

		// when false, a failed document is skipped and parsing resumes
		// at the next "---" or "..." line on the following pull
		bool strict;
		std::size_t maxDepth;
	};

	// Parser
	// . Drives the grammar over the scanner's tokens and hands out events.
	class YTREE_API Parser: private noncopyable
	{
	public:
		Parser();
		Parser(std::istream& in, const ParserOptions& options = ParserOptions());
		~Parser();

		operator bool() const;

		void Load(std::istream& in, const ParserOptions& options = ParserOptions());

		// GetNextEvent
		// . Returns false once STREAM_END has been handed out
		//   (or, in strict mode, after an error).
		bool GetNextEvent(Event& event);

		// HandleNextDocument
		// . Feeds the events of the next document to 'handler'.
		// . Returns false when there are no more documents.
		bool HandleNextDocument(EventHandler& handler);

	private:
		enum STATE {
			STREAM_START,
			IMPLICIT_DOCUMENT_START,
			DOCUMENT_START,
			DOCUMENT_CONTENT,
			DOCUMENT_END,
			BLOCK_NODE,
			FLOW_NODE,
			BLOCK_SEQUENCE_FIRST_ENTRY,
			BLOCK_SEQUENCE_ENTRY,
			BLOCK_MAPPING_FIRST_KEY,
			BLOCK_MAPPING_KEY,
			BLOCK_MAPPING_VALUE,
			FLOW_SEQUENCE_FIRST_ENTRY,
			FLOW_SEQUENCE_ENTRY,
			FLOW_SEQUENCE_ENTRY_MAPPING_KEY,
			FLOW_SEQUENCE_ENTRY_MAPPING_VALUE,
			FLOW_SEQUENCE_ENTRY_MAPPING_END,
			FLOW_MAPPING_FIRST_KEY,
			FLOW_MAPPING_KEY,
			FLOW_MAPPING_VALUE,
			FLOW_MAPPING_EMPTY_VALUE,
			END
		};

		Event NextEvent();
		void Resynchronize();

		Token& PeekToken();
		STATE PopState();
		void CheckFlowToken(const Token& token, int endType) const;

		Event ParseStreamStart();
		Event ParseDocumentStart(bool implicit);
		Event ParseDocumentContent();
		Event ParseDocumentEnd();
		Event ParseNode(bool block);
		Event ParseBlockSequenceEntry(bool first);
		Event ParseBlockMappingKey(bool first);
		Event ParseBlockMappingValue();
		Event ParseFlowSequenceEntry(bool first);
		Event ParseFlowSequenceEntryMappingKey();
		Event ParseFlowSequenceEntryMappingValue();
		Event ParseFlowSequenceEntryMappingEnd();
		Event ParseFlowMappingKey(bool first);
		Event ParseFlowMappingValue(bool empty);
		Event EmptyScalar(const Mark& mark) const;

		void ParseDirectives();
		void HandleDirective(const Token& token);
		void HandleYamlDirective(const Token& token);
		void HandleTagDirective(const Token& token);

	private:
		std::unique_ptr<Scanner> m_pScanner;
		ParserOptions m_options;
		Directives m_directives;
		STATE m_state;
		std::vector<STATE> m_states;
		std::vector<Mark> m_marks;      // where each open collection started
		bool m_needResync;
		Mark m_errorMark;
	};

	YTREE_API std::vector<Event> ParseEvents(std::istream& in, const ParserOptions& options = ParserOptions());
	YTREE_API std::vector<Event> ParseEvents(const std::string& input, const ParserOptions& options = ParserOptions());
}

#endif // PARSER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
