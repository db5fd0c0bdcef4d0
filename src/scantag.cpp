#include "scantag.h"
#include "exp.h"
#include "ytree/exceptions.h"

namespace YTree
{
	const std::string ScanVerbatimTag(Stream& INPUT)
	{
		std::string tag;

		// eat the start character
		INPUT.get();

		while(INPUT) {
			if(INPUT.peek() == Keys::VerbatimTagEnd) {
				// eat the end character
				INPUT.get();
				if(tag.empty())
					throw LexError(INPUT.mark(), LexError::InvalidCharacter, ErrorMsg::TAG_WITH_NO_SUFFIX);
				return tag;
			}

			int n = Exp::URI().Match(INPUT);
			if(n <= 0)
				break;

			tag += INPUT.get(n);
		}

		throw LexError(INPUT.mark(), LexError::InvalidCharacter, ErrorMsg::END_OF_VERBATIM_TAG);
	}

	// ScanTagHandle
	// . Reads the word characters following a '!'. If they're closed by
	//   another '!' they name a handle and 'canBeHandle' stays set.
	const std::string ScanTagHandle(Stream& INPUT, bool& canBeHandle)
	{
		std::string tag;
		canBeHandle = true;
		Mark firstNonWordChar;

		while(INPUT) {
			if(INPUT.peek() == Keys::Tag) {
				if(!canBeHandle)
					throw LexError(firstNonWordChar, LexError::InvalidCharacter, ErrorMsg::CHAR_IN_TAG_HANDLE);
				break;
			}

			int n = 0;
			if(canBeHandle) {
				n = Exp::Word().Match(INPUT);
				if(n <= 0) {
					canBeHandle = false;
					firstNonWordChar = INPUT.mark();
				}
			}

			if(!canBeHandle)
				n = Exp::Tag().Match(INPUT);

			if(n <= 0)
				break;

			tag += INPUT.get(n);
		}

		return tag;
	}

	const std::string ScanTagSuffix(Stream& INPUT, bool allowEmpty)
	{
		std::string tag;

		while(INPUT) {
			int n = Exp::Tag().Match(INPUT);
			if(n <= 0)
				break;

			tag += INPUT.get(n);
		}

		if(tag.empty() && !allowEmpty)
			throw LexError(INPUT.mark(), LexError::InvalidCharacter, ErrorMsg::TAG_WITH_NO_SUFFIX);

		return tag;
	}
}
