#include <ease/io/tween_info.hpp>
#include <ease/looper.hpp>
#include <ease/util/logger.hpp>
#include <charconv>
#include <cstdlib>
#include <string_view>

namespace {
template <typename Type>
Type parse_or(char const* arg, Type const fallback) {
	auto const str = std::string_view{arg};
	auto ret = Type{};
	auto const [_, ec] = std::from_chars(str.data(), str.data() + str.size(), ret);
	if (ec != std::errc{}) { return fallback; }
	return ret;
}

template <typename Driver>
void sample(Driver& driver, int const steps, ease::Time const delta) {
	for (int i = 0; i < steps; ++i) {
		auto const value = driver.update(delta);
		if constexpr (ease::DriverT<Driver>) {
			if (!value) {
				ease::g_logger.info("[{}] finished", i);
				return;
			}
			ease::g_logger.info("[{}] {:.3f}", i, *value);
		} else {
			ease::g_logger.info("[{}] {:.3f}", i, value);
		}
	}
}
} // namespace

int main(int argc, char** argv) {
	if (argc < 2) {
		ease::g_logger.error("Usage: {} <chain.json> [steps=60] [delta=0.1]", argc > 0 ? argv[0] : "ease-demo");
		return EXIT_FAILURE;
	}
	try {
		auto const info = ease::load_chain_info(argv[1]);
		if (!info) { return EXIT_FAILURE; }
		auto chain = ease::make_chain(*info);
		if (!chain) { return EXIT_FAILURE; }

		auto const steps = argc > 2 ? parse_or(argv[2], 60) : 60;
		auto const delta = ease::Time{argc > 3 ? parse_or(argv[3], 0.1f) : 0.1f};
		ease::g_logger.info("Sampling [{}] tweens ({:.2f}s) every [{:.3f}s], loop: {}", chain->size(), chain->duration().count(), delta.count(), info->loop);

		if (info->loop) {
			auto looper = ease::Looper{std::move(*chain)};
			sample(looper, steps, delta);
		} else {
			sample(*chain, steps, delta);
		}
	} catch (ease::Error const& error) {
		ease::g_logger.error("Fatal error: {}", error.what());
		return EXIT_FAILURE;
	}
}
