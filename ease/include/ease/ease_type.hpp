#pragma once
#include <ease/eased.hpp>
#include <ease/util/enum_array.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ease {
///
/// \brief Runtime identifier for each built-in curve.
///
enum class EaseType : std::uint8_t {
	eLinear,
	eSineIn,
	eSineOut,
	eSineInOut,
	eQuadIn,
	eQuadOut,
	eQuadInOut,
	eCubicIn,
	eCubicOut,
	eCubicInOut,
	eQuartIn,
	eQuartOut,
	eQuartInOut,
	eQuintIn,
	eQuintOut,
	eQuintInOut,
	eExpoIn,
	eExpoOut,
	eExpoInOut,
	eCircIn,
	eCircOut,
	eCircInOut,
	eBackIn,
	eBackOut,
	eBackInOut,
	eElasticIn,
	eElasticOut,
	eElasticInOut,
	eBounceIn,
	eBounceOut,
	eBounceInOut,
	eCOUNT_,
};

inline constexpr auto ease_type_names_v = EnumArray<EaseType, std::string_view>{
	"linear",
	"sine_in", "sine_out", "sine_in_out",
	"quad_in", "quad_out", "quad_in_out",
	"cubic_in", "cubic_out", "cubic_in_out",
	"quart_in", "quart_out", "quart_in_out",
	"quint_in", "quint_out", "quint_in_out",
	"expo_in", "expo_out", "expo_in_out",
	"circ_in", "circ_out", "circ_in_out",
	"back_in", "back_out", "back_in_out",
	"elastic_in", "elastic_out", "elastic_in_out",
	"bounce_in", "bounce_out", "bounce_in_out",
};

constexpr std::string_view to_string(EaseType const type) { return ease_type_names_v[type]; }

///
/// \brief Look up an EaseType by its name (as returned by to_string()).
/// \returns std::nullopt if name is not a known curve
///
std::optional<EaseType> to_ease_type(std::string_view name);

///
/// \brief Evaluate the curve identified by type at percent t.
///
/// Throws Error if type is not a valid enumerator.
///
double evaluate(EaseType type, double t);

namespace curve {
///
/// \brief Curve selected at runtime.
///
struct Dynamic {
	EaseType type{};

	double operator()(double const t) const { return evaluate(type, t); }
};
} // namespace curve

template <TweenValueT Value, TweenTimeT TimeT = Time>
using DynamicEased = Eased<curve::Dynamic, Value, TimeT>;

template <TweenValueT Value, TweenTimeT TimeT>
DynamicEased<Value, TimeT> make_tween(EaseType const type, Value from, Value to, TimeT duration) {
	return DynamicEased<Value, TimeT>{std::move(from), std::move(to), std::move(duration), curve::Dynamic{type}};
}
} // namespace ease
