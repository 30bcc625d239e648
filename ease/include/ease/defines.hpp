#pragma once

namespace ease {
constexpr bool debug_v =
#if defined(EASE_DEBUG)
	true;
#else
	false;
#endif
} // namespace ease
