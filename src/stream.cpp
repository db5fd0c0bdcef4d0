#include "stream.h"
#include <fmt/format.h>

namespace YTree
{
	namespace
	{
		bool IsPrintable(unsigned long ch)
		{
			switch(ch) {
				case 0x09: case 0x0A: case 0x0D: case 0x85:
					return true;
			}
			if(ch < 0x20 || ch == 0x7F)
				return false;
			if(ch >= 0x80 && ch <= 0x9F)
				return false;
			if(ch == 0xFFFE || ch == 0xFFFF)
				return false;
			return true;
		}
	}

	Stream::Stream(std::istream& input)
		: m_input(input), m_charSet(utf8), m_nPushedBack(0), m_exhausted(false), m_failed(false), m_failPos(-1), m_failKind(LexError::InvalidEncoding)
	{
		// sniff the first code unit
		unsigned char bytes[4];
		std::size_t n = 0;
		while(n < 4 && GetNextByte(bytes[n]))
			n++;

		std::size_t skip = 0;
		if(n >= 3 && bytes[0] == 0xEF && bytes[1] == 0xBB && bytes[2] == 0xBF) {
			m_charSet = utf8;
			skip = 3;
		} else if(n >= 4 && bytes[0] == 0xFF && bytes[1] == 0xFE && bytes[2] == 0 && bytes[3] == 0) {
			m_charSet = utf32le;
			skip = 4;
		} else if(n >= 4 && bytes[0] == 0 && bytes[1] == 0 && bytes[2] == 0xFE && bytes[3] == 0xFF) {
			m_charSet = utf32be;
			skip = 4;
		} else if(n >= 2 && bytes[0] == 0xFF && bytes[1] == 0xFE) {
			m_charSet = utf16le;
			skip = 2;
		} else if(n >= 2 && bytes[0] == 0xFE && bytes[1] == 0xFF) {
			m_charSet = utf16be;
			skip = 2;
		} else if(n >= 4 && bytes[0] == 0 && bytes[1] == 0 && bytes[2] == 0 && bytes[3] != 0) {
			m_charSet = utf32be;
		} else if(n >= 4 && bytes[0] != 0 && bytes[1] == 0 && bytes[2] == 0 && bytes[3] == 0) {
			m_charSet = utf32le;
		} else if(n >= 2 && bytes[0] == 0 && bytes[1] != 0) {
			m_charSet = utf16be;
		} else if(n >= 2 && bytes[0] != 0 && bytes[1] == 0) {
			m_charSet = utf16le;
		}

		// the pushback buffer is a stack
		for(std::size_t i = n; i > skip; i--)
			m_bufPushback[m_nPushedBack++] = bytes[i - 1];
	}

	Stream::~Stream()
	{
	}

	Stream::operator bool() const
	{
		CheckFailure();
		return m_readahead[0] != Stream::eof();
	}

	char Stream::peek() const
	{
		CheckFailure();
		return m_readahead[0];
	}

	// get
	// . Extracts a character from the stream and updates our position
	char Stream::get()
	{
		CheckFailure();

		char ch = m_readahead[0];
		if(ch == Stream::eof())
			return ch;

		AdvanceCurrent();

		if(ch == '\n' || (ch == '\r' && m_readahead[0] != '\n')) {
			m_mark.column = 0;
			m_mark.line++;
		} else if((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
			// continuation bytes don't start a new column
			m_mark.column++;
		}

		return ch;
	}

	// get
	// . Extracts 'n' characters from the stream and updates our position
	std::string Stream::get(int n)
	{
		std::string ret;
		ret.reserve(n);
		for(int i=0;i<n;i++)
			ret += get();
		return ret;
	}

	// eat
	// . Eats 'n' characters and updates our position.
	void Stream::eat(int n)
	{
		for(int i=0;i<n;i++)
			get();
	}

	void Stream::AdvanceCurrent()
	{
		m_readahead.pop_front();
		m_mark.pos++;
		ReadAheadTo(0);
	}

	// CheckFailure
	// . A decoding failure is only reported once the reader reaches it.
	void Stream::CheckFailure() const
	{
		ReadAheadTo(0);
		if(m_failed && m_mark.pos == m_failPos)
			throw LexError(m_mark, m_failKind, m_failMsg);
	}

	// _ReadAheadTo
	// . Decodes until there are more than 'i' characters buffered; past the
	//   end of the input (or a decoding failure) the buffer is padded with eof().
	bool Stream::_ReadAheadTo(std::size_t i) const
	{
		while(!m_exhausted && m_readahead.size() <= i) {
			bool more = false;
			switch(m_charSet) {
				case utf8: more = StreamInUtf8(); break;
				case utf16le: case utf16be: more = StreamInUtf16(); break;
				case utf32le: case utf32be: more = StreamInUtf32(); break;
			}
			if(!more)
				m_exhausted = true;
		}

		while(m_readahead.size() <= i)
			m_readahead.push_back(Stream::eof());

		return true;
	}

	bool Stream::Fail(LexError::Kind kind, const std::string& msg) const
	{
		m_failed = true;
		m_failPos = m_mark.pos + static_cast<int>(m_readahead.size());
		m_failKind = kind;
		m_failMsg = msg;
		return false;
	}

	bool Stream::StreamInUtf8() const
	{
		unsigned char b;
		if(!GetNextByte(b))
			return false;

		int nBytes = 0;
		unsigned long ch = 0;
		if(b < 0x80) {
			nBytes = 1;
			ch = b;
		} else if((b & 0xE0) == 0xC0) {
			nBytes = 2;
			ch = b & 0x1F;
		} else if((b & 0xF0) == 0xE0) {
			nBytes = 3;
			ch = b & 0x0F;
		} else if((b & 0xF8) == 0xF0) {
			nBytes = 4;
			ch = b & 0x07;
		} else {
			return Fail(LexError::InvalidEncoding, fmt::format("{} (lead byte 0x{:02X})", ErrorMsg::INVALID_ENCODING, b));
		}

		for(int i=1;i<nBytes;i++) {
			unsigned char trail;
			if(!GetNextByte(trail) || (trail & 0xC0) != 0x80)
				return Fail(LexError::InvalidEncoding, ErrorMsg::INVALID_ENCODING);
			ch = (ch << 6) | (trail & 0x3F);
		}

		// overlong forms
		static const unsigned long minimum[] = { 0, 0, 0x80, 0x800, 0x10000 };
		if(ch < minimum[nBytes])
			return Fail(LexError::InvalidEncoding, ErrorMsg::INVALID_ENCODING);

		return QueueCodePoint(ch);
	}

	bool Stream::StreamInUtf16() const
	{
		unsigned char bytes[2];
		if(!GetNextByte(bytes[0]))
			return false;
		if(!GetNextByte(bytes[1]))
			return Fail(LexError::InvalidEncoding, ErrorMsg::INVALID_ENCODING);

		const int nBigEnd = (m_charSet == utf16be) ? 0 : 1;
		unsigned long ch = (static_cast<unsigned long>(bytes[nBigEnd]) << 8) | bytes[1 ^ nBigEnd];

		if(ch >= 0xDC00 && ch < 0xE000)
			return Fail(LexError::InvalidEncoding, ErrorMsg::INVALID_ENCODING);

		if(ch >= 0xD800 && ch < 0xDC00) {
			// surrogate pair
			if(!GetNextByte(bytes[0]) || !GetNextByte(bytes[1]))
				return Fail(LexError::InvalidEncoding, ErrorMsg::INVALID_ENCODING);

			unsigned long chLow = (static_cast<unsigned long>(bytes[nBigEnd]) << 8) | bytes[1 ^ nBigEnd];
			if(chLow < 0xDC00 || chLow >= 0xE000)
				return Fail(LexError::InvalidEncoding, ErrorMsg::INVALID_ENCODING);

			ch = 0x10000 + ((ch & 0x3FF) << 10) + (chLow & 0x3FF);
		}

		return QueueCodePoint(ch);
	}

	bool Stream::StreamInUtf32() const
	{
		static const int indexes[2][4] = {
			{3, 2, 1, 0},
			{0, 1, 2, 3}
		};

		unsigned char bytes[4];
		if(!GetNextByte(bytes[0]))
			return false;
		for(int i=1;i<4;i++) {
			if(!GetNextByte(bytes[i]))
				return Fail(LexError::InvalidEncoding, ErrorMsg::INVALID_ENCODING);
		}

		const int* pIndexes = indexes[m_charSet == utf32be ? 1 : 0];
		unsigned long ch = 0;
		for(int i=0;i<4;i++)
			ch = (ch << 8) | bytes[pIndexes[i]];

		return QueueCodePoint(ch);
	}

	// QueueCodePoint
	// . Appends the UTF-8 form of 'ch' to the readahead.
	bool Stream::QueueCodePoint(unsigned long ch) const
	{
		if(ch > 0x10FFFF || (ch >= 0xD800 && ch <= 0xDFFF))
			return Fail(LexError::InvalidEncoding, fmt::format("{}{:X}", ErrorMsg::INVALID_UNICODE, ch));
		if(!IsPrintable(ch))
			return Fail(LexError::InvalidCharacter, fmt::format("{} (U+{:04X})", ErrorMsg::NON_PRINTABLE_CHAR, ch));

		if(ch < 0x80) {
			m_readahead.push_back(static_cast<char>(ch));
		} else if(ch < 0x800) {
			m_readahead.push_back(static_cast<char>(0xC0 | (ch >> 6)));
			m_readahead.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
		} else if(ch < 0x10000) {
			m_readahead.push_back(static_cast<char>(0xE0 | (ch >> 12)));
			m_readahead.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
			m_readahead.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
		} else {
			m_readahead.push_back(static_cast<char>(0xF0 | (ch >> 18)));
			m_readahead.push_back(static_cast<char>(0x80 | ((ch >> 12) & 0x3F)));
			m_readahead.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
			m_readahead.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
		}
		return true;
	}

	bool Stream::GetNextByte(unsigned char& byte) const
	{
		if(m_nPushedBack) {
			byte = m_bufPushback[--m_nPushedBack];
			return true;
		}

		if(!m_input.good())
			return false;

		std::istream::int_type ch = m_input.get();
		if(ch == std::istream::traits_type::eof())
			return false;

		byte = static_cast<unsigned char>(ch);
		return true;
	}
}
