#include "ytree/directives.h"

namespace YTree
{
	Directives::Directives()
	{
		// version
		version.isDefault = true;
		version.major = 1;
		version.minor = 2;
	}

	const std::string Directives::TranslateTagHandle(const std::string& handle) const
	{
		std::map <std::string, std::string>::const_iterator it = tags.find(handle);
		if(it == tags.end()) {
			if(handle == "!!")
				return "tag:yaml.org,2002:";
			if(handle == "!")
				return "!";
			return "";
		}

		return it->second;
	}

	bool Directives::IsHandleDefined(const std::string& handle) const
	{
		return handle == "!" || handle == "!!" || tags.find(handle) != tags.end();
	}

	bool operator == (const Directives& lhs, const Directives& rhs)
	{
		return lhs.version.isDefault == rhs.version.isDefault &&
			lhs.version.major == rhs.version.major &&
			lhs.version.minor == rhs.version.minor &&
			lhs.tags == rhs.tags;
	}
}
