#ifndef TOKENIZER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define TOKENIZER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"
#include "ytree/noncopyable.h"
#include "ytree/token.h"
#include <ios>
#include <memory>
#include <string>
#include <vector>

namespace YTree
{
	class Scanner;

	// Tokenizer
	// . Pulls tokens one at a time, comments included.
	class YTREE_API Tokenizer: private noncopyable
	{
	public:
		explicit Tokenizer(std::istream& in);
		~Tokenizer();

		// Next
		// . Fills 'token' and returns true, or returns false once STREAM_END was handed out.
		bool Next(Token& token);

	private:
		std::unique_ptr<Scanner> m_pScanner;
	};

	YTREE_API std::vector<Token> ScanTokens(std::istream& in);
	YTREE_API std::vector<Token> ScanTokens(const std::string& input);
}

#endif // TOKENIZER_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
