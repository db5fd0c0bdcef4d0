#include "ytree/schema.h"
#include <algorithm>

namespace
{
	// we're not gonna mess with the mess that is all the isupper/etc. functions
	bool IsLower(char ch) { return 'a' <= ch && ch <= 'z'; }
	bool IsUpper(char ch) { return 'A' <= ch && ch <= 'Z'; }
	bool IsDigit(char ch) { return '0' <= ch && ch <= '9'; }
	bool IsOctDigit(char ch) { return '0' <= ch && ch <= '7'; }
	bool IsHexDigit(char ch) { return IsDigit(ch) || ('a' <= ch && ch <= 'f') || ('A' <= ch && ch <= 'F'); }
	char ToLower(char ch) { return IsUpper(ch) ? ch + 'a' - 'A' : ch; }

	std::string tolower(const std::string& str)
	{
		std::string s(str);
		std::transform(s.begin(), s.end(), s.begin(), ToLower);
		return s;
	}

	template <typename T>
	bool IsEntirely(const std::string& str, T func)
	{
		for(std::size_t i=0;i<str.size();i++)
			if(!func(str[i]))
				return false;

		return true;
	}

	// IsFlexibleCase
	// . Returns true if 'str' is:
	//   . UPPERCASE
	//   . lowercase
	//   . Capitalized
	bool IsFlexibleCase(const std::string& str)
	{
		if(str.empty())
			return true;

		if(IsEntirely(str, IsLower))
			return true;

		bool firstcaps = IsUpper(str[0]);
		std::string rest = str.substr(1);
		return firstcaps && (IsEntirely(rest, IsLower) || IsEntirely(rest, IsUpper));
	}

	// SkipSign
	// . Returns the index of the first character after an optional '+' or '-'.
	std::size_t SkipSign(const std::string& str)
	{
		return !str.empty() && (str[0] == '+' || str[0] == '-') ? 1 : 0;
	}

	std::size_t CountDigits(const std::string& str, std::size_t i)
	{
		std::size_t n = 0;
		while(i + n < str.size() && IsDigit(str[i + n]))
			n++;
		return n;
	}
}

namespace YTree
{
	bool IsNullScalar(const std::string& value)
	{
		return value.empty() || value == "~" || value == "null" || value == "Null" || value == "NULL";
	}

	// ConvertBool
	// . Only the YAML 1.2 spellings: true/True/TRUE and false/False/FALSE.
	bool ConvertBool(const std::string& value, bool& b)
	{
		if(!IsFlexibleCase(value))
			return false;

		const std::string lower = tolower(value);
		if(lower == "true") {
			b = true;
			return true;
		}
		if(lower == "false") {
			b = false;
			return true;
		}
		return false;
	}

	// IsIntScalar
	// . [-+]?[0-9]+ | 0o[0-7]+ | 0x[0-9a-fA-F]+
	bool IsIntScalar(const std::string& value)
	{
		if(value.size() > 2 && value[0] == '0' && value[1] == 'o')
			return IsEntirely(value.substr(2), IsOctDigit);
		if(value.size() > 2 && value[0] == '0' && value[1] == 'x')
			return IsEntirely(value.substr(2), IsHexDigit);

		const std::size_t start = SkipSign(value);
		return start < value.size() && IsEntirely(value.substr(start), IsDigit);
	}

	// IsFloatScalar
	// . [-+]? ( \. [0-9]+ | [0-9]+ ( \. [0-9]* )? ) ( [eE] [-+]? [0-9]+ )?
	//   | [-+]? \. (inf|Inf|INF) | \. (nan|NaN|NAN)
	bool IsFloatScalar(const std::string& value)
	{
		if(value == ".nan" || value == ".NaN" || value == ".NAN")
			return true;

		std::size_t i = SkipSign(value);
		const std::string rest = value.substr(i);
		if(rest == ".inf" || rest == ".Inf" || rest == ".INF")
			return true;

		const std::size_t intDigits = CountDigits(value, i);
		i += intDigits;
		std::size_t fracDigits = 0;
		if(i < value.size() && value[i] == '.') {
			i++;
			fracDigits = CountDigits(value, i);
			i += fracDigits;
		}
		if(intDigits == 0 && fracDigits == 0)
			return false;

		if(i < value.size() && (value[i] == 'e' || value[i] == 'E')) {
			i++;
			if(i < value.size() && (value[i] == '+' || value[i] == '-'))
				i++;
			const std::size_t expDigits = CountDigits(value, i);
			if(expDigits == 0)
				return false;
			i += expDigits;
		}

		return i == value.size();
	}

	const std::string ResolvePlainScalar(const std::string& value)
	{
		bool b;
		if(IsNullScalar(value))
			return Tags::Null;
		if(ConvertBool(value, b))
			return Tags::Bool;
		if(IsIntScalar(value))
			return Tags::Int;
		if(IsFloatScalar(value))
			return Tags::Float;
		return Tags::Str;
	}
}
