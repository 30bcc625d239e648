#include <ease/util/logger.hpp>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <unordered_set>
#include <utility>
#include <vector>

namespace ease {
namespace {
struct Timestamp {
	char buffer[32]{};
	operator char const*() const { return buffer; }
};

Timestamp make_timestamp() {
	auto const now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	auto ret = Timestamp{};
	if (!std::strftime(ret.buffer, sizeof(ret.buffer), "%H:%M:%S", std::localtime(&now))) { return {}; }
	return ret;
}

struct Storage {
	struct Buffer {
		std::size_t limit{256};
		std::vector<Logger::Entry> entries{};

		void push(Logger::Entry entry) {
			entries.push_back(std::move(entry));
			trim();
		}

		void trim() {
			if (entries.size() <= limit) { return; }
			auto const excess = static_cast<std::ptrdiff_t>(entries.size() - limit);
			entries.erase(entries.begin(), entries.begin() + excess);
		}
	};

	Buffer buffer{};
	std::unordered_set<Logger::Sink*> sinks{};
	std::mutex mutex{};
};

Storage g_storage{};
} // namespace

Logger::Sink::~Sink() {
	auto lock = std::scoped_lock{g_storage.mutex};
	g_storage.sinks.erase(this);
}

std::size_t Logger::buffer_limit() {
	auto lock = std::scoped_lock{g_storage.mutex};
	return g_storage.buffer.limit;
}

void Logger::set_buffer_limit(std::size_t const limit) {
	auto lock = std::scoped_lock{g_storage.mutex};
	g_storage.buffer.limit = limit;
	g_storage.buffer.trim();
}

void Logger::attach(Sink& out_sink) {
	auto lock = std::scoped_lock{g_storage.mutex};
	g_storage.sinks.insert(&out_sink);
	out_sink.init(g_storage.buffer.entries);
}

std::string Logger::format(Level level, std::string_view context, std::string_view const message) {
	if (context.empty()) { context = "Unknown"; }
	return fmt::format(fmt::runtime(s_format), fmt::arg("level", levels_v[level]), fmt::arg("context", context), fmt::arg("message", message),
					   fmt::arg("timestamp", static_cast<char const*>(make_timestamp())));
}

void Logger::print(Entry entry) {
	auto* fd = entry.level == Level::eError ? stderr : stdout;
	std::fprintf(fd, "%s\n", entry.formatted_message.c_str());
	auto lock = std::scoped_lock{g_storage.mutex};
	for (auto* sink : g_storage.sinks) { sink->on_log(entry); }
	g_storage.buffer.push(std::move(entry));
}
} // namespace ease
