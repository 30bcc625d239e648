#include <ease/ease_type.hpp>
#include <ease/util/error.hpp>
#include <algorithm>

namespace ease {
static_assert(ease_type_names_v.size() == static_cast<std::size_t>(EaseType::eCOUNT_));

std::optional<EaseType> to_ease_type(std::string_view const name) {
	auto const it = std::find(ease_type_names_v.begin(), ease_type_names_v.end(), name);
	if (it == ease_type_names_v.end()) { return {}; }
	return static_cast<EaseType>(it - ease_type_names_v.begin());
}

double evaluate(EaseType const type, double const t) {
	switch (type) {
	case EaseType::eLinear: return curve::Linear{}(t);
	case EaseType::eSineIn: return curve::SineIn{}(t);
	case EaseType::eSineOut: return curve::SineOut{}(t);
	case EaseType::eSineInOut: return curve::SineInOut{}(t);
	case EaseType::eQuadIn: return curve::QuadIn{}(t);
	case EaseType::eQuadOut: return curve::QuadOut{}(t);
	case EaseType::eQuadInOut: return curve::QuadInOut{}(t);
	case EaseType::eCubicIn: return curve::CubicIn{}(t);
	case EaseType::eCubicOut: return curve::CubicOut{}(t);
	case EaseType::eCubicInOut: return curve::CubicInOut{}(t);
	case EaseType::eQuartIn: return curve::QuartIn{}(t);
	case EaseType::eQuartOut: return curve::QuartOut{}(t);
	case EaseType::eQuartInOut: return curve::QuartInOut{}(t);
	case EaseType::eQuintIn: return curve::QuintIn{}(t);
	case EaseType::eQuintOut: return curve::QuintOut{}(t);
	case EaseType::eQuintInOut: return curve::QuintInOut{}(t);
	case EaseType::eExpoIn: return curve::ExpoIn{}(t);
	case EaseType::eExpoOut: return curve::ExpoOut{}(t);
	case EaseType::eExpoInOut: return curve::ExpoInOut{}(t);
	case EaseType::eCircIn: return curve::CircIn{}(t);
	case EaseType::eCircOut: return curve::CircOut{}(t);
	case EaseType::eCircInOut: return curve::CircInOut{}(t);
	case EaseType::eBackIn: return curve::BackIn{}(t);
	case EaseType::eBackOut: return curve::BackOut{}(t);
	case EaseType::eBackInOut: return curve::BackInOut{}(t);
	case EaseType::eElasticIn: return curve::ElasticIn{}(t);
	case EaseType::eElasticOut: return curve::ElasticOut{}(t);
	case EaseType::eElasticInOut: return curve::ElasticInOut{}(t);
	case EaseType::eBounceIn: return curve::BounceIn{}(t);
	case EaseType::eBounceOut: return curve::BounceOut{}(t);
	case EaseType::eBounceInOut: return curve::BounceInOut{}(t);
	case EaseType::eCOUNT_: break;
	}
	throw Error{"Invalid EaseType"};
}
} // namespace ease
