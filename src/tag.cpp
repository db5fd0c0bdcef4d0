#include "tag.h"
#include "ytree/directives.h"
#include "ytree/exceptions.h"
#include "ytree/token.h"

namespace YTree
{
	Tag::Tag(const Token& token): type(static_cast<TYPE>(token.data)), handle(token.value), mark(token.mark)
	{
		if(!token.params.empty())
			value = token.params[0];
	}

	// Translate
	// . Resolves the shorthand against the document's %TAG directives.
	// . A non-specific tag stays "!".
	const std::string Tag::Translate(const Directives& directives) const
	{
		switch(type) {
			case VERBATIM:
				return value;
			case NON_SPECIFIC:
				return "!";
			case PRIMARY_HANDLE:
			case SECONDARY_HANDLE:
			case NAMED_HANDLE:
				break;
		}

		if(!directives.IsHandleDefined(handle))
			throw ParseError(mark, ParseError::UndefinedTagHandle, ErrorMsg::UNDEFINED_TAG_HANDLE + handle);

		return directives.TranslateTagHandle(handle) + value;
	}
}
