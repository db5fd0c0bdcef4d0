#include "ytree/style.h"

namespace YTree
{
	const char *ScalarStyleName(ScalarStyle::value style)
	{
		switch(style) {
			case ScalarStyle::Any: return "any";
			case ScalarStyle::Plain: return "plain";
			case ScalarStyle::SingleQuoted: return "single-quoted";
			case ScalarStyle::DoubleQuoted: return "double-quoted";
			case ScalarStyle::Literal: return "literal";
			case ScalarStyle::Folded: return "folded";
		}
		return "unknown";
	}

	const char *CollectionStyleName(CollectionStyle::value style)
	{
		switch(style) {
			case CollectionStyle::Any: return "any";
			case CollectionStyle::Block: return "block";
			case CollectionStyle::Flow: return "flow";
		}
		return "unknown";
	}
}
