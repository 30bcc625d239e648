#pragma once
#include <concepts>
#include <type_traits>

namespace ease {
///
/// \brief Customization point for types usable as tween values.
///
/// Specializations provide scale(value, factor), factor being a fraction (usually) in [0, 1].
///
template <typename Type>
struct ValueTraits;

///
/// \brief Signed arithmetic values; integral results truncate toward zero.
///
/// Unsigned types are excluded: a falling tween's delta (final - initial) would wrap.
///
template <typename Type>
	requires(std::is_floating_point_v<Type> || (std::is_integral_v<Type> && std::is_signed_v<Type>))
struct ValueTraits<Type> {
	static constexpr Type scale(Type const value, double const factor) { return static_cast<Type>(static_cast<double>(value) * factor); }
};

template <typename Type>
concept TweenValueT = std::copyable<Type> && requires(Type const& a, Type const& b, double factor) {
												 { a + b } -> std::convertible_to<Type>;
												 { a - b } -> std::convertible_to<Type>;
												 { ValueTraits<Type>::scale(a, factor) } -> std::convertible_to<Type>;
											 };
} // namespace ease
