#include <ease/io/tween_info.hpp>
#include <ease/util/logger.hpp>

namespace ease {
namespace {
auto const g_log{Logger{"TweenInfo"}};

EaseType to_ease_type_or_linear(std::string_view const name) {
	if (name.empty()) { return EaseType::eLinear; }
	if (auto const ret = to_ease_type(name)) { return *ret; }
	g_log.warn("Unknown ease [{}], using [{}]", name, to_string(EaseType::eLinear));
	return EaseType::eLinear;
}
} // namespace

void from_json(dj::Json const& json, TweenInfo& out) {
	out.type = to_ease_type_or_linear(json["ease"].as_string());
	out.from = json["from"].as<float>(out.from);
	out.to = json["to"].as<float>(out.to);
	out.duration = Time{json["duration"].as<float>(out.duration.count())};
}

void to_json(dj::Json& out, TweenInfo const& info) {
	out["ease"] = to_string(info.type);
	out["from"] = info.from;
	out["to"] = info.to;
	out["duration"] = info.duration.count();
}

void from_json(dj::Json const& json, ChainInfo& out) {
	out.tweens.clear();
	for (auto const& in_tween : json["tweens"].array_view()) {
		auto& out_tween = out.tweens.emplace_back();
		from_json(in_tween, out_tween);
	}
	out.loop = json["loop"].as<bool>(out.loop);
}

void to_json(dj::Json& out, ChainInfo const& info) {
	auto out_tweens = dj::Json{};
	for (auto const& in_tween : info.tweens) {
		auto out_tween = dj::Json{};
		to_json(out_tween, in_tween);
		out_tweens.push_back(std::move(out_tween));
	}
	out["tweens"] = std::move(out_tweens);
	out["loop"] = dj::Boolean{info.loop};
}

DynamicEased<float> make_tween(TweenInfo const& info) { return make_tween(info.type, info.from, info.to, info.duration); }

std::optional<Chain<float>> make_chain(ChainInfo const& info) {
	if (info.tweens.empty()) {
		g_log.error("Cannot make Chain: no tweens");
		return {};
	}
	auto tweens = std::vector<Chain<float>::tween_type>{};
	tweens.reserve(info.tweens.size());
	for (auto const& tween : info.tweens) { tweens.emplace_back(make_tween(tween)); }
	auto ret = Chain<float>{std::move(tweens)};
	g_log.debug("Chain of [{}] tweens, duration: [{}s]", ret.size(), ret.duration().count());
	return ret;
}

std::optional<ChainInfo> load_chain_info(char const* path) {
	auto const json = dj::Json::from_file(path);
	if (!json) {
		g_log.error("Failed to open [{}]", path);
		return {};
	}
	auto ret = ChainInfo{};
	from_json(json, ret);
	return ret;
}
} // namespace ease
