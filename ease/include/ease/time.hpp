#pragma once
#include <chrono>
#include <concepts>
#include <type_traits>

namespace ease {
///
/// \brief Default time type: seconds as float.
///
using Time = std::chrono::duration<float>;

///
/// \brief Customization point for types usable as tween time.
///
/// Specializations provide zero() and ratio(elapsed, duration).
/// ratio() is 1 for a zero duration.
///
template <typename Type>
struct TimeTraits;

template <typename Type>
	requires(std::is_arithmetic_v<Type>)
struct TimeTraits<Type> {
	static constexpr Type zero() { return Type{}; }
	static constexpr double ratio(Type const elapsed, Type const duration) {
		if (duration == Type{}) { return 1.0; }
		return static_cast<double>(elapsed) / static_cast<double>(duration);
	}
};

template <typename Rep, typename Period>
struct TimeTraits<std::chrono::duration<Rep, Period>> {
	using type = std::chrono::duration<Rep, Period>;

	static constexpr type zero() { return type::zero(); }
	static constexpr double ratio(type const elapsed, type const duration) {
		if (duration == type::zero()) { return 1.0; }
		return static_cast<double>(elapsed.count()) / static_cast<double>(duration.count());
	}
};

template <typename Type>
concept TweenTimeT = std::copyable<Type> && requires(Type const& a, Type const& b) {
												{ a + b } -> std::convertible_to<Type>;
												{ a - b } -> std::convertible_to<Type>;
												{ a >= b } -> std::convertible_to<bool>;
												{ TimeTraits<Type>::zero() } -> std::convertible_to<Type>;
												{ TimeTraits<Type>::ratio(a, b) } -> std::convertible_to<double>;
											};

///
/// \brief Completion test shared by every driver: the boundary itself counts as complete.
///
template <TweenTimeT Type>
constexpr bool is_complete(Type const& elapsed, Type const& duration) {
	return elapsed >= duration;
}
} // namespace ease
