#include "ytree/tokenizer.h"
#include "scanner.h"
#include <sstream>

namespace YTree
{
	Tokenizer::Tokenizer(std::istream& in): m_pScanner(new Scanner(in))
	{
	}

	Tokenizer::~Tokenizer()
	{
	}

	bool Tokenizer::Next(Token& token)
	{
		if(m_pScanner->empty())
			return false;

		token = m_pScanner->peek();
		m_pScanner->pop();
		return true;
	}

	std::vector<Token> ScanTokens(std::istream& in)
	{
		std::vector<Token> tokens;
		Tokenizer tokenizer(in);
		Token token(Token::STREAM_START, Mark());
		while(tokenizer.Next(token))
			tokens.push_back(token);
		return tokens;
	}

	std::vector<Token> ScanTokens(const std::string& input)
	{
		std::stringstream stream(input);
		return ScanTokens(stream);
	}
}
