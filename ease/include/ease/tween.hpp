#pragma once
#include <ease/time.hpp>
#include <ease/value.hpp>
#include <utility>

namespace ease {
///
/// \brief A stateless easing capability: maps elapsed time to a value.
///
/// run() is only meaningful for elapsed in [0, duration()); drivers substitute final_value() at completion.
///
template <typename Type>
concept TweenT = requires(Type& t, Type const& ct, typename Type::time_type time) {
					 requires TweenValueT<typename Type::value_type>;
					 requires TweenTimeT<typename Type::time_type>;
					 { ct.duration() } -> std::convertible_to<typename Type::time_type>;
					 { t.run(time) } -> std::convertible_to<typename Type::value_type>;
					 { ct.final_value() } -> std::convertible_to<typename Type::value_type>;
				 };

///
/// \brief A Tween that also knows the value it starts from.
///
template <typename Type>
concept SizedTweenT = TweenT<Type> && requires(Type const& t) {
										  { t.initial_value() } -> std::convertible_to<typename Type::value_type>;
									  };

///
/// \brief Time-reversed view of a Tween: runs from its final value back to its initial value.
///
/// Owns a copy of the wrapped tween; the original is left untouched.
///
template <SizedTweenT Tween>
class Reversed {
  public:
	using tween_type = Tween;
	using value_type = typename Tween::value_type;
	using time_type = typename Tween::time_type;

	explicit Reversed(Tween tween) : m_tween(std::move(tween)) {}

	time_type duration() const { return m_tween.duration(); }
	value_type run(time_type const elapsed) { return m_tween.run(m_tween.duration() - elapsed); }
	value_type initial_value() const { return m_tween.final_value(); }
	value_type final_value() const { return m_tween.initial_value(); }

	Tween const& inner() const { return m_tween; }

  private:
	Tween m_tween;
};
} // namespace ease
