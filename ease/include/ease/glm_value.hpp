#pragma once
#include <ease/value.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

namespace ease {
///
/// \brief Component-wise scaling for floating point glm vectors.
///
template <glm::length_t Dim, typename T, glm::qualifier Q>
	requires(std::is_floating_point_v<T>)
struct ValueTraits<glm::vec<Dim, T, Q>> {
	static glm::vec<Dim, T, Q> scale(glm::vec<Dim, T, Q> const& value, double const factor) { return value * static_cast<T>(factor); }
};

static_assert(TweenValueT<glm::vec2>);
static_assert(TweenValueT<glm::vec3>);
static_assert(TweenValueT<glm::vec4>);
static_assert(!TweenValueT<glm::uvec2>);
} // namespace ease
