#ifndef EMITTERUTILS_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define EMITTERUTILS_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/emittermanip.h"
#include "ytree/ostream_wrapper.h"
#include <cstddef>
#include <string>

namespace YTree
{
	struct StringFormat { enum value { Plain, SingleQuoted, DoubleQuoted, Literal, Folded }; };

	// where a scalar is about to be written
	struct ScalarContext {
		ScalarContext(): inFlow(false), isKey(false), allowEmptyPlain(false), escapeNonAscii(false) {}

		bool inFlow;
		bool isKey;
		bool allowEmptyPlain;   // an empty plain scalar can be left blank here
		bool escapeNonAscii;
	};

	namespace Utils
	{
		bool IsValidUtf8(const std::string& str);

		bool IsValidPlainScalar(const std::string& str, const ScalarContext& context);
		bool IsValidSingleQuotedScalar(const std::string& str, const ScalarContext& context);
		bool IsValidLiteralScalar(const std::string& str, const ScalarContext& context);
		bool IsValidFoldedScalar(const std::string& str, const ScalarContext& context);

		// ComputeStringFormat
		// . Auto writes the text as a string: plain when that reads back as
		//   the same string, double-quoted otherwise. Any other request is
		//   honored or refused (returns false).
		bool ComputeStringFormat(const std::string& str, EMITTER_MANIP strFormat, const ScalarContext& context, StringFormat::value& format);

		// WrittenLength
		// . Columns the scalar takes when written on one line.
		std::size_t WrittenLength(const std::string& str, StringFormat::value format, bool escapeNonAscii);

		bool WriteSingleQuotedString(ostream_wrapper& out, const std::string& str, unsigned lineWidth, unsigned indent);
		bool WriteDoubleQuotedString(ostream_wrapper& out, const std::string& str, bool escapeNonAscii, unsigned lineWidth, unsigned indent);
		bool WriteLiteralString(ostream_wrapper& out, const std::string& str, unsigned indent);
		bool WriteFoldedString(ostream_wrapper& out, const std::string& str, unsigned lineWidth, unsigned indent);
		bool WriteComment(ostream_wrapper& out, const std::string& str, int postCommentIndent);
		bool WriteAlias(ostream_wrapper& out, const std::string& str);
		bool WriteAnchor(ostream_wrapper& out, const std::string& str);
		bool WriteTag(ostream_wrapper& out, const std::string& str, bool verbatim);
		bool WriteTagWithPrefix(ostream_wrapper& out, const std::string& prefix, const std::string& tag);

		bool IsValidTagSuffix(const std::string& str);
	}
}

#endif // EMITTERUTILS_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
