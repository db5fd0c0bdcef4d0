#include "ytree/token.h"
#include <ostream>

namespace YTree
{
	const char * const TokenNames[] = {
		"STREAM_START",
		"STREAM_END",
		"DIRECTIVE",
		"DOC_START",
		"DOC_END",
		"BLOCK_SEQ_START",
		"BLOCK_MAP_START",
		"BLOCK_SEQ_END",
		"BLOCK_MAP_END",
		"BLOCK_ENTRY",
		"FLOW_SEQ_START",
		"FLOW_MAP_START",
		"FLOW_SEQ_END",
		"FLOW_MAP_END",
		"FLOW_ENTRY",
		"KEY",
		"VALUE",
		"ANCHOR",
		"ALIAS",
		"TAG",
		"SCALAR",
		"COMMENT"
	};

	std::ostream& operator << (std::ostream& out, const Token& token)
	{
		out << TokenNames[token.type] << std::string(": ") << token.value;
		for(std::size_t i=0;i<token.params.size();i++)
			out << std::string(" ") << token.params[i];
		if(token.type == Token::SCALAR)
			out << " (" << ScalarStyleName(token.style) << ")";
		return out;
	}
}
