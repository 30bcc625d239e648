#pragma once
#include <ease/defines.hpp>
#include <ease/util/enum_array.hpp>
#include <fmt/format.h>
#include <span>
#include <string>
#include <string_view>

namespace ease {
class Logger {
  public:
	///
	/// \brief The level of a log message.
	///
	enum class Level : std::uint8_t { eError, eWarn, eInfo, eDebug, eCOUNT_ };
	static constexpr auto levels_v{EnumArray<Level, char>{'E', 'W', 'I', 'D'}};

	///
	/// \brief The format for a log message.
	///
	inline static std::string s_format{"[{level}] [{context}] {message} [{timestamp}]"};

	///
	/// \brief A log message entry.
	///
	struct Entry {
		std::string formatted_message{};
		Level level{};
	};

	struct Sink;

	///
	/// \brief Maximum number of entries retained in the log buffer.
	///
	static std::size_t buffer_limit();
	///
	/// \brief Set the maximum number of entries retained in the log buffer.
	///
	static void set_buffer_limit(std::size_t limit);
	///
	/// \brief Attach a sink to receive log callbacks.
	///
	/// Sink's destructor will detach itself.
	///
	static void attach(Sink& out_sink);
	///
	/// \brief Format a log message given the level and context.
	///
	static std::string format(Level level, std::string_view context, std::string_view message);

	template <typename... Args>
	static std::string format(Level level, std::string_view const context, fmt::format_string<Args...> fmt, Args const&... args) {
		return format(level, context, fmt::vformat(fmt, fmt::make_format_args(args...)));
	}

	Logger(std::string_view context = "Ease") : context(context) {}

	template <typename... Args>
	void error(fmt::format_string<Args...> fmt, Args const&... args) const {
		if (silent[Level::eError]) { return; }
		print(Entry{format(Level::eError, context, fmt, args...), Level::eError});
	}

	template <typename... Args>
	void warn(fmt::format_string<Args...> fmt, Args const&... args) const {
		if (silent[Level::eWarn]) { return; }
		print(Entry{format(Level::eWarn, context, fmt, args...), Level::eWarn});
	}

	template <typename... Args>
	void info(fmt::format_string<Args...> fmt, Args const&... args) const {
		if (silent[Level::eInfo]) { return; }
		print(Entry{format(Level::eInfo, context, fmt, args...), Level::eInfo});
	}

	///
	/// \brief Log a debug message (no-op unless EASE_DEBUG is defined).
	///
	template <typename... Args>
	void debug(fmt::format_string<Args...> fmt, Args const&... args) const {
		if constexpr (debug_v) {
			if (silent[Level::eDebug]) { return; }
			print(Entry{format(Level::eDebug, context, fmt, args...), Level::eDebug});
		}
	}

	///
	/// \brief Write to stdout (stderr for errors), then forward to sinks and the buffer.
	///
	static void print(Entry entry);

	///
	/// \brief Log context for this instance.
	///
	std::string_view context{};
	///
	/// \brief Levels that should be suppressed from being logged.
	///
	EnumArray<Level, bool> silent{};
};

///
/// \brief Receives every entry logged after attachment, plus the buffered backlog on attach.
///
struct Logger::Sink {
	Sink() = default;
	Sink(Sink const&) = delete;
	Sink& operator=(Sink const&) = delete;

	virtual ~Sink();

	virtual void init(std::span<Entry const> backlog) = 0;
	virtual void on_log(Entry const& entry) = 0;
};

///
/// \brief Default Logger instance.
///
inline auto const g_logger{Logger{}};
} // namespace ease
