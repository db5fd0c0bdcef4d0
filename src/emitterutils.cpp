#include "emitterutils.h"
#include "exp.h"
#include "indentation.h"
#include "stringsource.h"
#include "ytree/schema.h"

namespace YTree
{
	namespace Utils
	{
		namespace {
			enum {REPLACEMENT_CHARACTER = 0xFFFD};

			bool IsAnchorChar(int ch) { // test for ns-anchor-char
				switch (ch) {
					case ',': case '[': case ']': case '{': case '}': // c-flow-indicator
					case ' ': case '\t': // s-white
					case 0xFEFF: // c-byte-order-mark
					case 0xA: case 0xD: // b-char
						return false;
					case 0x85:
						return true;
				}

				if (ch < 0x20)
					return false;

				if (ch < 0x7E)
					return true;

				if (ch < 0xA0)
					return false;
				if (ch >= 0xD800 && ch <= 0xDFFF)
					return false;
				if ((ch & 0xFFFE) == 0xFFFE)
					return false;
				if ((ch >= 0xFDD0) && (ch <= 0xFDEF))
					return false;
				if (ch > 0x10FFFF)
					return false;

				return true;
			}

			// c-printable (YAML 1.2, sec. 5.1)
			bool IsPrintable(int ch) {
				if (ch == '\t' || ch == '\n' || ch == '\r')
					return true;
				if (ch >= 0x20 && ch <= 0x7E)
					return true;
				if (ch == 0x85)
					return true;
				if (ch >= 0xA0 && ch <= 0xD7FF)
					return true;
				if (ch >= 0xE000 && ch <= 0xFFFD)
					return true;
				return ch >= 0x10000 && ch <= 0x10FFFF;
			}

			int Utf8BytesIndicated(char ch) {
				int byteVal = static_cast<unsigned char>(ch);
				switch (byteVal >> 4) {
					case 0: case 1: case 2: case 3: case 4: case 5: case 6: case 7:
						return 1;
					case 12: case 13:
						return 2;
					case 14:
						return 3;
					case 15:
						return 4;
					default:
						return -1;
				}
			}

			bool IsTrailingByte(char ch) {
				return (ch & 0xC0) == 0x80;
			}

			bool GetNextCodePointAndAdvance(int& codePoint, std::string::const_iterator& first, std::string::const_iterator last) {
				if (first == last)
					return false;

				int nBytes = Utf8BytesIndicated(*first);
				if (nBytes < 1) {
					// Bad lead byte
					++first;
					codePoint = REPLACEMENT_CHARACTER;
					return true;
				}

				if (nBytes == 1) {
					codePoint = *first++;
					return true;
				}

				// Gather bits from trailing bytes
				codePoint = static_cast<unsigned char>(*first) & ~(0xFF << (7 - nBytes));
				++first;
				--nBytes;
				for (; nBytes > 0; ++first, --nBytes) {
					if ((first == last) || !IsTrailingByte(*first)) {
						codePoint = REPLACEMENT_CHARACTER;
						break;
					}
					codePoint <<= 6;
					codePoint |= *first & 0x3F;
				}

				// Check for illegal code points
				if (codePoint > 0x10FFFF)
					codePoint = REPLACEMENT_CHARACTER;
				else if (codePoint >= 0xD800 && codePoint <= 0xDFFF)
					codePoint = REPLACEMENT_CHARACTER;
				return true;
			}

			int PeekCodePoint(std::string::const_iterator first, std::string::const_iterator last) {
				int codePoint = 0;
				if (!GetNextCodePointAndAdvance(codePoint, first, last))
					return 0;
				return codePoint;
			}

			void WriteCodePoint(ostream_wrapper& out, int codePoint) {
				if (codePoint < 0 || codePoint > 0x10FFFF) {
					codePoint = REPLACEMENT_CHARACTER;
				}
				if (codePoint < 0x80) {
					out << static_cast<char>(codePoint);
				} else if (codePoint < 0x800) {
					out << static_cast<char>(0xC0 | (codePoint >> 6))
					    << static_cast<char>(0x80 | (codePoint & 0x3F));
				} else if (codePoint < 0x10000) {
					out << static_cast<char>(0xE0 | (codePoint >> 12))
					    << static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F))
					    << static_cast<char>(0x80 | (codePoint & 0x3F));
				} else {
					out << static_cast<char>(0xF0 | (codePoint >> 18))
					    << static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F))
					    << static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F))
					    << static_cast<char>(0x80 | (codePoint & 0x3F));
				}
			}

			// IsPrintableText
			// . Every code point is printable and, where asked, ASCII. A line
			//   feed is only accepted when the style can carry one.
			bool IsPrintableText(const std::string& str, bool allowOnlyAscii, bool allowLineFeed) {
				int codePoint;
				for(std::string::const_iterator i = str.begin();
					GetNextCodePointAndAdvance(codePoint, i, str.end());
					)
				{
					if (!IsPrintable(codePoint) || codePoint == '\r' || codePoint == 0xFEFF)
						return false;
					if (codePoint == '\n' && !allowLineFeed)
						return false;
					if (allowOnlyAscii && codePoint > 0x7E)
						return false;
				}
				return true;
			}

			bool IsBlank(int ch) {
				return ch == ' ' || ch == '\t';
			}

			// CanBreakAt
			// . A single space between two non-blank characters can become a
			//   line break that folds back into the same space.
			bool CanBreakAt(ostream_wrapper& out, unsigned lineWidth, int prev, int next) {
				if (lineWidth == 0 || out.col() < lineWidth)
					return false;
				if (prev == 0 || IsBlank(prev) || prev == '\n')
					return false;
				return next != 0 && !IsBlank(next) && next != '\n';
			}

			bool IsValidBlockScalar(const std::string& str, const ScalarContext& context, bool folded) {
				if (context.inFlow || context.isKey)
					return false;
				if (str.find_first_not_of('\n') == std::string::npos)
					return false;
				if (!IsPrintableText(str, context.escapeNonAscii, true))
					return false;

				// we can only write clipped or stripped scalars
				std::string body = str;
				if (*body.rbegin() == '\n')
					body.erase(body.size() - 1);
				if (!body.empty() && *body.rbegin() == '\n')
					return false;

				if (folded && body[0] == '\n')
					return false;

				bool seenContent = false;
				std::size_t start = 0;
				while (start <= body.size()) {
					std::size_t end = body.find('\n', start);
					if (end == std::string::npos)
						end = body.size();

					const std::string line = body.substr(start, end - start);
					if (!line.empty()) {
						if (line.find_first_not_of(" \t") == std::string::npos)
							return false;
						if (line[0] == '\t')
							return false;
						// the first line sets the indentation; folding needs every line flush
						if (line[0] == ' ' && (folded || !seenContent))
							return false;
						seenContent = true;
					}
					start = end + 1;
				}
				return true;
			}

			void WriteDoubleQuoteEscapeSequence(ostream_wrapper& out, int codePoint) {
				static const char hexDigits[] = "0123456789abcdef";

				char escSeq[] = "\\U00000000";
				int digits = 8;
				if (codePoint <= 0xFF) {
					escSeq[1] = 'x';
					digits = 2;
				} else if (codePoint <= 0xFFFF) {
					escSeq[1] = 'u';
					digits = 4;
				}

				// Write digits into the escape sequence
				int i = 2;
				for (; digits > 0; --digits, ++i) {
					escSeq[i] = hexDigits[(codePoint >> (4 * (digits - 1))) & 0xF];
				}

				escSeq[i] = 0; // terminate with NUL character
				out << escSeq;
			}

			bool WriteAliasName(ostream_wrapper& out, const std::string& str) {
				if (str.empty() || !IsValidUtf8(str))
					return false;

				// a trailing ':' would read as a mapping value indicator
				if (*str.rbegin() == ':')
					return false;

				int codePoint;
				for(std::string::const_iterator i = str.begin();
					GetNextCodePointAndAdvance(codePoint, i, str.end());
					)
				{
					if (!IsAnchorChar(codePoint))
						return false;

					WriteCodePoint(out, codePoint);
				}
				return true;
			}
		}

		bool IsValidUtf8(const std::string& str)
		{
			std::size_t i = 0;
			while(i < str.size()) {
				const int nBytes = Utf8BytesIndicated(str[i]);
				if(nBytes < 1 || i + nBytes > str.size())
					return false;

				int codePoint = static_cast<unsigned char>(str[i]) & (nBytes == 1 ? 0x7F : ~(0xFF << (7 - nBytes)));
				for(int k=1;k<nBytes;k++) {
					if(!IsTrailingByte(str[i + k]))
						return false;
					codePoint = (codePoint << 6) | (str[i + k] & 0x3F);
				}

				// overlong forms
				if((nBytes == 2 && codePoint < 0x80) || (nBytes == 3 && codePoint < 0x800) || (nBytes == 4 && codePoint < 0x10000))
					return false;
				if(codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF))
					return false;

				i += nBytes;
			}
			return true;
		}

		bool IsValidPlainScalar(const std::string& str, const ScalarContext& context)
		{
			if(str.empty())
				return context.allowEmptyPlain;

			// first check the start
			const RegEx& start = (context.inFlow ? Exp::PlainScalarInFlow() : Exp::PlainScalar());
			if(!start.Matches(str))
				return false;

			// and check the end for plain whitespace (which can't be faithfully kept in a plain scalar)
			if(IsBlank(*str.rbegin()))
				return false;

			// "---" or "..." would end the document
			if(Exp::DocIndicator().Matches(str))
				return false;

			// then check until something is disallowed
			const RegEx& disallowed = (context.inFlow ? Exp::EndScalarInFlow() : Exp::EndScalar())
			                          || (Exp::BlankOrBreak() + Exp::Comment())
			                          || Exp::NotPrintable()
			                          || Exp::Utf8_ByteOrderMark()
			                          || Exp::Break()
			                          || Exp::Tab();
			StringCharSource buffer(str.c_str(), str.size());
			while(buffer) {
				if(disallowed.Matches(buffer))
					return false;
				++buffer;
			}

			return IsPrintableText(str, context.escapeNonAscii, false);
		}

		bool IsValidSingleQuotedScalar(const std::string& str, const ScalarContext& context)
		{
			return IsPrintableText(str, context.escapeNonAscii, false);
		}

		bool IsValidLiteralScalar(const std::string& str, const ScalarContext& context)
		{
			return IsValidBlockScalar(str, context, false);
		}

		bool IsValidFoldedScalar(const std::string& str, const ScalarContext& context)
		{
			return IsValidBlockScalar(str, context, true);
		}

		bool ComputeStringFormat(const std::string& str, EMITTER_MANIP strFormat, const ScalarContext& context, StringFormat::value& format)
		{
			switch(strFormat) {
				case Auto:
					if(!str.empty() && IsValidPlainScalar(str, context) && ResolvePlainScalar(str) == Tags::Str)
						format = StringFormat::Plain;
					else
						format = StringFormat::DoubleQuoted;
					return true;
				case Plain:
					format = StringFormat::Plain;
					return IsValidPlainScalar(str, context);
				case SingleQuoted:
					format = StringFormat::SingleQuoted;
					return IsValidSingleQuotedScalar(str, context);
				case DoubleQuoted:
					format = StringFormat::DoubleQuoted;
					return true;
				case Literal:
					format = StringFormat::Literal;
					return IsValidLiteralScalar(str, context);
				case Folded:
					format = StringFormat::Folded;
					return IsValidFoldedScalar(str, context);
				default:
					break;
			}
			return false;
		}

		std::size_t WrittenLength(const std::string& str, StringFormat::value format, bool escapeNonAscii)
		{
			switch(format) {
				case StringFormat::Plain:
					return str.size();
				case StringFormat::SingleQuoted: {
					ostream_wrapper out;
					WriteSingleQuotedString(out, str, 0, 0);
					return out.pos();
				}
				case StringFormat::DoubleQuoted: {
					ostream_wrapper out;
					WriteDoubleQuotedString(out, str, escapeNonAscii, 0, 0);
					return out.pos();
				}
				default:
					return str.size();
			}
		}

		bool WriteSingleQuotedString(ostream_wrapper& out, const std::string& str, unsigned lineWidth, unsigned indent)
		{
			out << "'";
			int codePoint, prev = 0;
			for(std::string::const_iterator i = str.begin();
				GetNextCodePointAndAdvance(codePoint, i, str.end());
				)
			{
				if (codePoint == '\n')
					return false;  // We can't handle a new line and the attendant indentation yet

				if (codePoint == ' ' && CanBreakAt(out, lineWidth, prev, PeekCodePoint(i, str.end())))
					out << "\n" << IndentTo(indent);
				else if (codePoint == '\'')
					out << "''";
				else
					WriteCodePoint(out, codePoint);
				prev = codePoint;
			}
			out << "'";
			return true;
		}

		bool WriteDoubleQuotedString(ostream_wrapper& out, const std::string& str, bool escapeNonAscii, unsigned lineWidth, unsigned indent)
		{
			out << "\"";
			int codePoint, prev = 0;
			for(std::string::const_iterator i = str.begin();
				GetNextCodePointAndAdvance(codePoint, i, str.end());
				)
			{
				switch (codePoint) {
					case '\"': out << "\\\""; break;
					case '\\': out << "\\\\"; break;
					case '\n': out << "\\n"; break;
					case '\t': out << "\\t"; break;
					case '\r': out << "\\r"; break;
					case '\b': out << "\\b"; break;
					case 0: out << "\\0"; break;
					case ' ':
						if (CanBreakAt(out, lineWidth, prev, PeekCodePoint(i, str.end())))
							out << "\n" << IndentTo(indent);
						else
							out << ' ';
						break;
					default:
						if (codePoint < 0x20 || (codePoint >= 0x7F && codePoint <= 0xA0)) // Control characters and non-breaking space
							WriteDoubleQuoteEscapeSequence(out, codePoint);
						else if (codePoint == 0xFEFF) // Byte order marks (ZWNS) should be escaped (YAML 1.2, sec. 5.2)
							WriteDoubleQuoteEscapeSequence(out, codePoint);
						else if (!IsPrintable(codePoint))
							WriteDoubleQuoteEscapeSequence(out, codePoint);
						else if (escapeNonAscii && codePoint > 0x7E)
							WriteDoubleQuoteEscapeSequence(out, codePoint);
						else
							WriteCodePoint(out, codePoint);
						break;
				}
				prev = codePoint;
			}
			out << "\"";
			return true;
		}

		bool WriteLiteralString(ostream_wrapper& out, const std::string& str, unsigned indent)
		{
			std::string body = str;
			const bool clip = !body.empty() && *body.rbegin() == '\n';
			if(clip)
				body.erase(body.size() - 1);

			out << (clip ? "|\n" : "|-\n");
			bool lineStart = true;
			int codePoint;
			for(std::string::const_iterator i = body.begin();
				GetNextCodePointAndAdvance(codePoint, i, body.end());
				)
			{
				if (codePoint == '\n') {
					out << "\n";
					lineStart = true;
					continue;
				}

				if (lineStart) {
					out << IndentTo(indent);
					lineStart = false;
				}
				WriteCodePoint(out, codePoint);
			}
			return true;
		}

		// WriteFoldedString
		// . A run of n line breaks is written as n + 1 so that folding gives
		//   the same breaks back.
		bool WriteFoldedString(ostream_wrapper& out, const std::string& str, unsigned lineWidth, unsigned indent)
		{
			std::string body = str;
			const bool clip = !body.empty() && *body.rbegin() == '\n';
			if(clip)
				body.erase(body.size() - 1);

			out << (clip ? ">\n" : ">-\n");
			bool lineStart = true;
			int codePoint, prev = 0;
			for(std::string::const_iterator i = body.begin();
				GetNextCodePointAndAdvance(codePoint, i, body.end());
				)
			{
				if (codePoint == '\n') {
					if (prev != '\n')
						out << "\n";
					out << "\n";
					lineStart = true;
				} else if (codePoint == ' ' && CanBreakAt(out, lineWidth, prev, PeekCodePoint(i, body.end()))) {
					out << "\n";
					lineStart = true;
				} else {
					if (lineStart) {
						out << IndentTo(indent);
						lineStart = false;
					}
					WriteCodePoint(out, codePoint);
				}
				prev = codePoint;
			}
			return true;
		}

		bool WriteComment(ostream_wrapper& out, const std::string& str, int postCommentIndent)
		{
			const unsigned curIndent = out.col();
			out << "#" << Indentation(postCommentIndent);
			out.set_comment();
			int codePoint;
			for(std::string::const_iterator i = str.begin();
				GetNextCodePointAndAdvance(codePoint, i, str.end());
				)
			{
				if(codePoint == '\n') {
					out << "\n" << IndentTo(curIndent) << "#" << Indentation(postCommentIndent);
					out.set_comment();
				} else {
					WriteCodePoint(out, codePoint);
				}
			}
			return true;
		}

		bool WriteAlias(ostream_wrapper& out, const std::string& str)
		{
			out << "*";
			return WriteAliasName(out, str);
		}

		bool WriteAnchor(ostream_wrapper& out, const std::string& str)
		{
			out << "&";
			return WriteAliasName(out, str);
		}

		bool WriteTag(ostream_wrapper& out, const std::string& str, bool verbatim)
		{
			if(verbatim && str.empty())
				return false;

			out << (verbatim ? "!<" : "!");
			StringCharSource buffer(str.c_str(), str.size());
			const RegEx& reValid = verbatim ? Exp::URI() : Exp::Tag();
			while(buffer) {
				int n = reValid.Match(buffer);
				if(n <= 0)
					return false;

				while(--n >= 0) {
					out << buffer[0];
					++buffer;
				}
			}
			if (verbatim)
				out << ">";
			return true;
		}

		bool WriteTagWithPrefix(ostream_wrapper& out, const std::string& prefix, const std::string& tag)
		{
			out << "!";
			StringCharSource prefixBuffer(prefix.c_str(), prefix.size());
			while(prefixBuffer) {
				int n = Exp::Word().Match(prefixBuffer);
				if(n <= 0)
					return false;

				while(--n >= 0) {
					out << prefixBuffer[0];
					++prefixBuffer;
				}
			}

			out << "!";
			StringCharSource tagBuffer(tag.c_str(), tag.size());
			while(tagBuffer) {
				int n = Exp::Tag().Match(tagBuffer);
				if(n <= 0)
					return false;

				while(--n >= 0) {
					out << tagBuffer[0];
					++tagBuffer;
				}
			}
			return true;
		}

		bool IsValidTagSuffix(const std::string& str)
		{
			if(str.empty())
				return false;

			StringCharSource buffer(str.c_str(), str.size());
			while(buffer) {
				const int n = Exp::Tag().Match(buffer);
				if(n <= 0)
					return false;
				buffer += n;
			}
			return true;
		}
	}
}
