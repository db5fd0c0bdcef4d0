#ifndef OSTREAM_WRAPPER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define OSTREAM_WRAPPER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace YTree
{
	// ostream_wrapper
	// . Output sink that keeps track of the row and column written to,
	//   either into its own buffer or through to a std::ostream.
	class YTREE_API ostream_wrapper
	{
	public:
		ostream_wrapper();
		explicit ostream_wrapper(std::ostream& stream);
		~ostream_wrapper();

		void write(const std::string& str);
		void write(const char *str, std::size_t size);

		void set_comment() { m_comment = true; }

		const char *str() const {
			if(m_pStream) {
				return 0;
			} else {
				m_buffer[m_pos] = '\0';
				return &m_buffer[0];
			}
		}

		std::size_t row() const { return m_row; }
		std::size_t col() const { return m_col; }
		std::size_t pos() const { return m_pos; }
		bool comment() const { return m_comment; }

	private:
		void update_pos(char ch);

	private:
		mutable std::vector<char> m_buffer;
		std::ostream *m_pStream;

		std::size_t m_pos;
		std::size_t m_row, m_col;
		bool m_comment;
	};

	YTREE_API ostream_wrapper& operator << (ostream_wrapper& out, const char *str);
	YTREE_API ostream_wrapper& operator << (ostream_wrapper& out, const std::string& str);
	YTREE_API ostream_wrapper& operator << (ostream_wrapper& out, char ch);
}

#endif // OSTREAM_WRAPPER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
