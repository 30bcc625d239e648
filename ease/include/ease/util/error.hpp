#pragma once
#include <stdexcept>

namespace ease {
///
/// \brief Base ease exception.
///
/// Only thrown on programmer error (eg an empty Chain); completion of a tween is never an error.
///
struct Error : std::runtime_error {
	using std::runtime_error::runtime_error;
};
} // namespace ease
