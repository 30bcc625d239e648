#pragma once
#include <ease/curve.hpp>
#include <ease/tween.hpp>
#include <functional>
#include <type_traits>

namespace ease {
template <typename Type>
concept CurveT = std::is_invocable_r_v<double, Type const&, double>;

///
/// \brief Tween from an initial value to a final value over a duration, shaped by Curve.
///
/// run(elapsed) = initial + scale(final - initial, curve(elapsed / duration)).
/// Any callable double(double) can be used as Curve, including captureless lambdas.
///
template <CurveT Curve, TweenValueT Value, TweenTimeT TimeT = Time>
class Eased {
  public:
	using curve_type = Curve;
	using value_type = Value;
	using time_type = TimeT;

	Eased(Value from, Value to, TimeT duration, Curve curve = {})
		: m_initial(std::move(from)), m_final(std::move(to)), m_delta(m_final - m_initial), m_duration(std::move(duration)), m_curve(std::move(curve)) {}

	TimeT duration() const { return m_duration; }

	Value run(TimeT const elapsed) const {
		auto const percent = TimeTraits<TimeT>::ratio(elapsed, m_duration);
		return static_cast<Value>(m_initial + ValueTraits<Value>::scale(m_delta, std::invoke(m_curve, percent)));
	}

	Value initial_value() const { return m_initial; }
	Value final_value() const { return m_final; }
	Value value_delta() const { return m_delta; }
	Curve const& curve() const { return m_curve; }

  private:
	Value m_initial;
	Value m_final;
	Value m_delta;
	TimeT m_duration;
	[[no_unique_address]] Curve m_curve;
};

template <TweenValueT Value, TweenTimeT TimeT = Time>
using Linear = Eased<curve::Linear, Value, TimeT>;

template <TweenValueT Value, TweenTimeT TimeT = Time>
using SineIn = Eased<curve::SineIn, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using SineOut = Eased<curve::SineOut, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using SineInOut = Eased<curve::SineInOut, Value, TimeT>;

template <TweenValueT Value, TweenTimeT TimeT = Time>
using QuadIn = Eased<curve::QuadIn, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using QuadOut = Eased<curve::QuadOut, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using QuadInOut = Eased<curve::QuadInOut, Value, TimeT>;

template <TweenValueT Value, TweenTimeT TimeT = Time>
using CubicIn = Eased<curve::CubicIn, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using CubicOut = Eased<curve::CubicOut, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using CubicInOut = Eased<curve::CubicInOut, Value, TimeT>;

template <TweenValueT Value, TweenTimeT TimeT = Time>
using QuartIn = Eased<curve::QuartIn, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using QuartOut = Eased<curve::QuartOut, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using QuartInOut = Eased<curve::QuartInOut, Value, TimeT>;

template <TweenValueT Value, TweenTimeT TimeT = Time>
using QuintIn = Eased<curve::QuintIn, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using QuintOut = Eased<curve::QuintOut, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using QuintInOut = Eased<curve::QuintInOut, Value, TimeT>;

template <TweenValueT Value, TweenTimeT TimeT = Time>
using ExpoIn = Eased<curve::ExpoIn, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using ExpoOut = Eased<curve::ExpoOut, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using ExpoInOut = Eased<curve::ExpoInOut, Value, TimeT>;

template <TweenValueT Value, TweenTimeT TimeT = Time>
using CircIn = Eased<curve::CircIn, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using CircOut = Eased<curve::CircOut, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using CircInOut = Eased<curve::CircInOut, Value, TimeT>;

template <TweenValueT Value, TweenTimeT TimeT = Time>
using BackIn = Eased<curve::BackIn, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using BackOut = Eased<curve::BackOut, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using BackInOut = Eased<curve::BackInOut, Value, TimeT>;

template <TweenValueT Value, TweenTimeT TimeT = Time>
using ElasticIn = Eased<curve::ElasticIn, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using ElasticOut = Eased<curve::ElasticOut, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using ElasticInOut = Eased<curve::ElasticInOut, Value, TimeT>;

template <TweenValueT Value, TweenTimeT TimeT = Time>
using BounceIn = Eased<curve::BounceIn, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using BounceOut = Eased<curve::BounceOut, Value, TimeT>;
template <TweenValueT Value, TweenTimeT TimeT = Time>
using BounceInOut = Eased<curve::BounceInOut, Value, TimeT>;

static_assert(SizedTweenT<Linear<float>>);
static_assert(SizedTweenT<Reversed<QuadIn<int, int>>>);
} // namespace ease
