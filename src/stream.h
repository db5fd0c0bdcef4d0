#ifndef STREAM_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define STREAM_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/noncopyable.h"
#include "ytree/mark.h"
#include "ytree/exceptions.h"
#include <cstddef>
#include <deque>
#include <ios>
#include <iostream>
#include <string>

namespace YTree
{
	static const std::size_t MAX_PARSER_PUSHBACK = 8;

	// Stream
	// . Reads bytes from the caller's istream, sniffs the encoding from the
	//   byte order mark (or the null-byte pattern of the first code unit),
	//   and hands out the input as UTF-8 characters.
	class Stream: private noncopyable
	{
	public:
		friend class StreamCharSource;

		enum CharacterSet {utf8, utf16le, utf16be, utf32le, utf32be};

		Stream(std::istream& input);
		~Stream();

		operator bool() const;
		bool operator !() const { return !static_cast <bool>(*this); }

		char peek() const;
		char peekAt(std::size_t i) const { ReadAheadTo(i); return CharAt(i); }
		char get();
		std::string get(int n);
		void eat(int n = 1);

		static char eof() { return 0x04; }

		const Mark mark() const { return m_mark; }
		int pos() const { return m_mark.pos; }
		int line() const { return m_mark.line; }
		int column() const { return m_mark.column; }
		void ResetColumn() { m_mark.column = 0; }

		CharacterSet charset() const { return m_charSet; }

	private:
		std::istream& m_input;
		Mark m_mark;

		CharacterSet m_charSet;
		unsigned char m_bufPushback[MAX_PARSER_PUSHBACK];
		mutable std::size_t m_nPushedBack;
		mutable std::deque<char> m_readahead;

		mutable bool m_exhausted;

		// a decoding failure is reported once the reader reaches it
		mutable bool m_failed;
		mutable int m_failPos;
		mutable LexError::Kind m_failKind;
		mutable std::string m_failMsg;

		void AdvanceCurrent();
		void CheckFailure() const;
		char CharAt(std::size_t i) const;
		bool ReadAheadTo(std::size_t i) const;
		bool _ReadAheadTo(std::size_t i) const;
		bool StreamInUtf8() const;
		bool StreamInUtf16() const;
		bool StreamInUtf32() const;
		bool QueueCodePoint(unsigned long ch) const;
		bool Fail(LexError::Kind kind, const std::string& msg) const;
		bool GetNextByte(unsigned char& byte) const;
	};

	// CharAt
	// . Unchecked access
	inline char Stream::CharAt(std::size_t i) const {
		return m_readahead[i];
	}

	inline bool Stream::ReadAheadTo(std::size_t i) const {
		if(m_readahead.size() > i)
			return true;
		return _ReadAheadTo(i);
	}
}

#endif // STREAM_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
