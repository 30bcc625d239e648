#pragma once
#include <djson/json.hpp>
#include <ease/chain.hpp>
#include <ease/ease_type.hpp>
#include <optional>
#include <vector>

namespace ease {
///
/// \brief Serializable description of a single tween.
///
/// JSON: {"ease": "quad_in", "from": 0.0, "to": 10.0, "duration": 1.5}
///
struct TweenInfo {
	EaseType type{};
	float from{};
	float to{};
	Time duration{};
};

///
/// \brief Serializable description of a chain of tweens.
///
/// JSON: {"tweens": [TweenInfo...], "loop": false}
///
struct ChainInfo {
	std::vector<TweenInfo> tweens{};
	bool loop{};
};

void from_json(dj::Json const& json, TweenInfo& out);
void to_json(dj::Json& out, TweenInfo const& info);

void from_json(dj::Json const& json, ChainInfo& out);
void to_json(dj::Json& out, ChainInfo const& info);

DynamicEased<float> make_tween(TweenInfo const& info);

///
/// \brief Build a Chain from its description.
/// \returns std::nullopt if info has no tweens
///
std::optional<Chain<float>> make_chain(ChainInfo const& info);

///
/// \brief Load a ChainInfo from a JSON file.
/// \returns std::nullopt if the file could not be opened or parsed
///
std::optional<ChainInfo> load_chain_info(char const* path);
} // namespace ease
