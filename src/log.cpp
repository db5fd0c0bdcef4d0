#include "ytree/log.h"
#include <fmt/format.h>
#include <algorithm>
#include <cstdio>
#include <mutex>
#include <vector>

namespace YTree
{
	logs::channel ytree_log("YAML");

	namespace logs
	{
		namespace
		{
			std::mutex g_mutex;

			std::vector<listener*>& get_listeners()
			{
				static std::vector<listener*> listeners;
				return listeners;
			}
		}

		listener::~listener()
		{
		}

		void listener::add(listener* _new)
		{
			std::lock_guard<std::mutex> lock(g_mutex);
			get_listeners().push_back(_new);
		}

		void listener::remove(listener* _old)
		{
			std::lock_guard<std::mutex> lock(g_mutex);
			std::vector<listener*>& listeners = get_listeners();
			listeners.erase(std::remove(listeners.begin(), listeners.end(), _old), listeners.end());
		}

		// broadcast
		// . Without listeners, anything at warning or above goes to stderr.
		void message::broadcast(const std::string& text) const
		{
			std::lock_guard<std::mutex> lock(g_mutex);
			const std::vector<listener*>& listeners = get_listeners();

			if (listeners.empty())
			{
				if (sev <= level::warning)
					fmt::print(stderr, "{} {}: {}\n", level_name(sev), ch->name, text);
				return;
			}

			for (listener* lis : listeners)
				lis->log(*this, text);
		}

		void reset()
		{
			ytree_log.enabled.store(level::notice, std::memory_order_relaxed);
		}

		void silence()
		{
			ytree_log.enabled.store(level::always, std::memory_order_relaxed);
		}

		void set_level(level value)
		{
			ytree_log.enabled.store(value, std::memory_order_relaxed);
		}

		level get_level()
		{
			return ytree_log.enabled.load(std::memory_order_relaxed);
		}

		const char* level_name(level value)
		{
			switch (value)
			{
			case level::always: return "A";
			case level::fatal: return "F";
			case level::error: return "E";
			case level::warning: return "W";
			case level::notice: return "!";
			case level::trace: return "T";
			}
			return "?";
		}
	}
}
