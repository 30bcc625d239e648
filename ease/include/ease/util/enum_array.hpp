#pragma once
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace ease {
template <typename Type>
concept EnumT = std::is_enum_v<Type>;

///
/// \brief Stores an array of Type, of size Size, indexable by enum E.
///
/// E is expected to end with an eCOUNT_ enumerator.
///
template <EnumT E, typename Type, std::size_t Size = static_cast<std::size_t>(E::eCOUNT_)>
struct EnumArray {
	Type t[Size]{};

	static constexpr std::size_t size() { return Size; }

	constexpr Type& operator[](E const e) { return t[static_cast<std::size_t>(e)]; }
	constexpr Type const& operator[](E const e) const { return t[static_cast<std::size_t>(e)]; }

	constexpr Type const* begin() const { return t; }
	constexpr Type const* end() const { return t + Size; }
};
} // namespace ease
