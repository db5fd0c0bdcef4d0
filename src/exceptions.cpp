#include "ytree/exceptions.h"
#include <fmt/format.h>

namespace YTree
{
	Exception::Exception(const Mark& mark_, const std::string& msg_)
		: mark(mark_), msg(msg_)
	{
		if(mark.is_null())
			what_ = fmt::format("ytree: error: {}", msg);
		else
			what_ = fmt::format("ytree: error at line {}, column {}: {}", mark.line + 1, mark.column + 1, msg);
	}

	// keeps the vtable in this translation unit
	Exception::~Exception() throw()
	{
	}
}
