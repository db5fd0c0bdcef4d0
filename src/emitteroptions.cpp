#include "ytree/emitteroptions.h"
#include "ytree/exceptions.h"

namespace YTree
{
	void EmitterOptions::Validate() const
	{
		if(indentWidth == 0)
			throw EmitError(EmitError::InvalidState, ErrorMsg::INVALID_INDENT);
	}
}
