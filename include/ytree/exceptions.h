#ifndef EXCEPTIONS_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define EXCEPTIONS_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"
#include "ytree/mark.h"
#include <exception>
#include <string>

namespace YTree
{
	// error messages
	namespace ErrorMsg
	{
		// lexical
		const char * const INVALID_HEX             = "bad character found while scanning hex number";
		const char * const INVALID_UNICODE         = "invalid unicode: ";
		const char * const INVALID_ESCAPE          = "unknown escape character: ";
		const char * const INVALID_ENCODING        = "invalid byte sequence for the detected encoding";
		const char * const UNKNOWN_TOKEN           = "unknown token";
		const char * const DOC_IN_SCALAR           = "illegal document indicator in scalar";
		const char * const EOF_IN_SCALAR           = "illegal EOF in scalar";
		const char * const CHAR_IN_SCALAR          = "illegal character in scalar";
		const char * const TAB_IN_INDENTATION      = "illegal tab when looking for indentation";
		const char * const INCONSISTENT_INDENT     = "indentation does not match any open block";
		const char * const FLOW_END                = "illegal flow end";
		const char * const BLOCK_ENTRY             = "illegal block entry";
		const char * const MAP_KEY                 = "illegal map key";
		const char * const MAP_VALUE               = "illegal map value";
		const char * const ALIAS_NOT_FOUND         = "alias not found after *";
		const char * const ANCHOR_NOT_FOUND        = "anchor not found after &";
		const char * const CHAR_IN_ALIAS           = "illegal character found while scanning alias";
		const char * const CHAR_IN_ANCHOR          = "illegal character found while scanning anchor";
		const char * const ZERO_INDENT_IN_BLOCK    = "cannot set zero indentation for a block scalar";
		const char * const CHAR_IN_BLOCK           = "unexpected character in block scalar";
		const char * const CHAR_IN_TAG_HANDLE      = "illegal character found while scanning tag handle";
		const char * const TAG_WITH_NO_SUFFIX      = "tag handle with no suffix";
		const char * const END_OF_VERBATIM_TAG     = "end of verbatim tag not found";
		const char * const NON_PRINTABLE_CHAR      = "non-printable character in input";

		// grammar
		const char * const YAML_DIRECTIVE_ARGS     = "YAML directives must have exactly one argument";
		const char * const YAML_VERSION            = "bad YAML version: ";
		const char * const YAML_MAJOR_VERSION      = "unsupported YAML major version";
		const char * const REPEATED_YAML_DIRECTIVE = "repeated YAML directive";
		const char * const TAG_DIRECTIVE_ARGS      = "TAG directives must have exactly two arguments";
		const char * const REPEATED_TAG_DIRECTIVE  = "repeated TAG directive";
		const char * const DIRECTIVE_WITHOUT_DOC   = "directives must be followed by a document start marker";
		const char * const EXPECTED_DOC_START      = "expected a document start marker";
		const char * const UNEXPECTED_END          = "unexpected end of stream";
		const char * const UNDEFINED_TAG_HANDLE    = "undefined tag handle: ";
		const char * const END_OF_MAP              = "end of map not found";
		const char * const END_OF_MAP_FLOW         = "end of map flow not found";
		const char * const END_OF_SEQ              = "end of sequence not found";
		const char * const END_OF_SEQ_FLOW         = "end of sequence flow not found";
		const char * const MULTIPLE_TAGS           = "cannot assign multiple tags to the same node";
		const char * const MULTIPLE_ANCHORS        = "cannot assign multiple anchors to the same node";
		const char * const ALIAS_CONTENT           = "aliases can't have any content, *including* tags";
		const char * const DANGLING_PROPERTY       = "anchor or tag is not followed by a node";
		const char * const UNEXPECTED_TOKEN        = "unexpected token: ";
		const char * const SEQ_ENTRY_IN_MAP        = "sequence entry found where a mapping value was expected";
		const char * const NESTING_TOO_DEEP        = "collections are nested too deeply";

		// composition
		const char * const UNKNOWN_ANCHOR          = "the referenced anchor is not defined: ";
		const char * const ALIAS_CYCLE             = "alias refers to a node that contains it: ";
		const char * const DUPLICATE_KEY           = "duplicate mapping key";
		const char * const DUPLICATE_KEY_ALIASED   = "duplicate mapping key would replace a node an alias refers to";
		const char * const TOO_MANY_NODES          = "document exceeds the maximum node count";
		const char * const EXPANSION_LIMIT         = "alias expansion exceeds the configured limit";

		// emitting
		const char * const UNMATCHED_GROUP_TAG     = "unmatched group tag";
		const char * const UNEXPECTED_END_SEQ      = "unexpected end sequence token";
		const char * const UNEXPECTED_END_MAP      = "unexpected end map token";
		const char * const UNEXPECTED_DOC          = "unexpected document marker";
		const char * const INVALID_ANCHOR          = "invalid anchor";
		const char * const INVALID_ALIAS           = "invalid alias";
		const char * const INVALID_TAG             = "invalid tag";
		const char * const INVALID_UTF8            = "scalar is not valid UTF-8";
		const char * const UNREPRESENTABLE_STYLE   = "scalar cannot be written in the requested style";
		const char * const ANCHOR_COLLISION        = "anchor name is already bound to a different node: ";
		const char * const ALIAS_NOT_WRITTEN       = "alias refers to a node that has not been written: ";
		const char * const INVALID_INDENT          = "indentation width must be at least 1";
		const char * const INCOMPLETE_OUTPUT       = "not all groups were closed";
	}

	class YTREE_API Exception: public std::exception {
	public:
		Exception(const Mark& mark_, const std::string& msg_);
		virtual ~Exception() throw();
		virtual const char *what() const throw() { return what_.c_str(); }

		Mark mark;
		std::string msg;

	private:
		std::string what_;
	};

	// LexError
	// . Thrown by the scanner (and the input stream) for malformed characters.
	class YTREE_API LexError: public Exception {
	public:
		enum Kind {
			InvalidEscape,
			TabInIndentation,
			UnterminatedScalar,
			InvalidEncoding,
			InvalidCharacter,
			InconsistentIndentation
		};

		LexError(const Mark& mark_, Kind kind_, const std::string& msg_)
			: Exception(mark_, msg_), kind(kind_) {}

		Kind kind;
	};

	// ParseError
	// . Thrown by the parser when the token sequence fits no production.
	class YTREE_API ParseError: public Exception {
	public:
		enum Kind {
			UnexpectedToken,
			UnclosedFlowCollection,
			DanglingProperty,
			AliasWithProperty,
			DuplicateProperty,
			DirectiveConflict,
			InvalidDirective,
			UndefinedTagHandle,
			NestingTooDeep
		};

		ParseError(const Mark& mark_, Kind kind_, const std::string& msg_)
			: Exception(mark_, msg_), kind(kind_) {}

		Kind kind;
	};

	class YTREE_API ComposeError: public Exception {
	public:
		enum Kind {
			UndefinedAlias,
			AliasCycle,
			DuplicateKey,
			ExpansionLimitExceeded
		};

		ComposeError(const Mark& mark_, Kind kind_, const std::string& msg_)
			: Exception(mark_, msg_), kind(kind_) {}

		Kind kind;
	};

	class YTREE_API EmitError: public Exception {
	public:
		enum Kind {
			UnrepresentableScalar,
			AnchorCollision,
			InvalidAlias,
			InvalidState
		};

		EmitError(Kind kind_, const std::string& msg_)
			: Exception(Mark::null_mark(), msg_), kind(kind_) {}

		Kind kind;
	};
}

#endif // EXCEPTIONS_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
