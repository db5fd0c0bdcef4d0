#ifndef LOG_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
#define LOG_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17

#if defined(_MSC_VER) || (defined(__GNUC__) && (__GNUC__ == 3 && __GNUC_MINOR__ >= 4) || (__GNUC__ >= 4)) // GCC supports "pragma once" correctly since 3.4
#pragma once
#endif

#include "ytree/dll.h"
#include <fmt/format.h>
#include <atomic>
#include <string>
#include <utility>

namespace YTree
{
	namespace logs
	{
		enum class level : unsigned
		{
			always, // Highest log severity (cannot be disabled)
			fatal,
			error,
			warning,
			notice,
			trace, // Lowest severity (usually disabled)
		};

		struct channel;

		// Message information
		struct YTREE_API message
		{
			channel* ch;
			level sev;

		private:
			// Send log message to every registered listener
			void broadcast(const std::string& text) const;

			friend struct channel;
		};

		class YTREE_API listener
		{
		public:
			virtual ~listener();

			// Process log message
			virtual void log(const message& msg, const std::string& text) = 0;

			// Add new listener
			static void add(listener*);

			// Remove a listener added earlier
			static void remove(listener*);
		};

		struct YTREE_API channel
		{
			// Channel prefix (added to every log message)
			const char* const name;

			// The lowest logging level enabled for this channel (used for early filtering)
			std::atomic<level> enabled;

			explicit channel(const char* name_) noexcept
				: name(name_)
				, enabled(level::notice)
			{
			}

#define GEN_LOG_METHOD(_sev)\
			const message msg_##_sev{this, level::_sev};\
			template <typename... Args>\
			void _sev(fmt::format_string<Args...> fmt, Args&&... args)\
			{\
				if (level::_sev <= enabled.load(std::memory_order_relaxed)) [[unlikely]]\
				{\
					msg_##_sev.broadcast(fmt::format(fmt, std::forward<Args>(args)...));\
				}\
			}\

			GEN_LOG_METHOD(fatal)
			GEN_LOG_METHOD(error)
			GEN_LOG_METHOD(warning)
			GEN_LOG_METHOD(notice)
			GEN_LOG_METHOD(trace)

#undef GEN_LOG_METHOD
		};

		// Log level control: set the library channel to level::notice
		YTREE_API void reset();

		// Log level control: set the library channel to level::always
		YTREE_API void silence();

		YTREE_API void set_level(level);
		YTREE_API level get_level();

		YTREE_API const char* level_name(level);
	}

	// The library's log channel
	YTREE_API extern logs::channel ytree_log;
}

#endif // LOG_H_1D9A6E44_7B5E_4C51_9C0B_3F4E8A2D6B17
