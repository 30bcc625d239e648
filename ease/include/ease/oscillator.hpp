#pragma once
#include <ease/driver.hpp>
#include <ease/tweener.hpp>
#include <cstdint>

namespace ease {
enum class OscillationDirection : std::uint8_t { eRising, eFalling };

///
/// \brief Alternates forever between a rising and a falling variable-delta driver.
///
/// Starts Rising. The step on which the active driver completes yields its final value and flips
/// direction; the completed driver is rewound for its next turn. Constructed from a single
/// Tweener, the falling driver is derived by running its tween backwards.
///
/// \code
/// auto oscillator = Oscillator{Tweener{Linear<int, int>{0, 2, 2}}};
/// oscillator.update(1); // 1, Rising
/// oscillator.update(1); // 2, Falling
/// oscillator.update(1); // 1, Falling
/// oscillator.update(1); // 0, Rising
/// \endcode
///
template <DriverT Rising, DriverT Falling = reverse_driver_t<Rising>>
	requires(std::same_as<typename Rising::value_type, typename Falling::value_type> &&
			 std::same_as<typename Rising::time_type, typename Falling::time_type>)
class Oscillator {
  public:
	using value_type = typename Rising::value_type;
	using time_type = typename Rising::time_type;

	explicit Oscillator(Rising rising)
		requires(std::same_as<Falling, reverse_driver_t<Rising>>)
		: m_rising(std::move(rising)), m_falling(ReverseDriver<Rising>::make(m_rising)) {
		rewind_finished();
	}

	Oscillator(Rising rising, Falling falling) : m_rising(std::move(rising)), m_falling(std::move(falling)) { rewind_finished(); }

	value_type update(time_type const delta) {
		if (m_direction == OscillationDirection::eRising) { return step(m_rising, delta, OscillationDirection::eFalling); }
		return step(m_falling, delta, OscillationDirection::eRising);
	}

	OscillationDirection direction() const { return m_direction; }
	Rising const& rising() const { return m_rising; }
	Falling const& falling() const { return m_falling; }

  private:
	template <typename Driver>
	value_type step(Driver& out_driver, time_type const delta, OscillationDirection const next) {
		auto ret = out_driver.update(delta);
		if (out_driver.is_finished()) {
			DriverAccess::rewind(out_driver);
			m_direction = next;
		}
		return std::move(*ret);
	}

	void rewind_finished() {
		if (m_rising.is_finished()) { DriverAccess::rewind(m_rising); }
		if (m_falling.is_finished()) { DriverAccess::rewind(m_falling); }
	}

	Rising m_rising;
	Falling m_falling;
	OscillationDirection m_direction{OscillationDirection::eRising};
};

template <typename Rising>
Oscillator(Rising) -> Oscillator<Rising, reverse_driver_t<Rising>>;

template <typename Rising, typename Falling>
Oscillator(Rising, Falling) -> Oscillator<Rising, Falling>;

///
/// \brief Alternates forever between a rising and a falling fixed-delta driver: an unbounded sequence.
///
/// Same transition rules as Oscillator.
///
template <FixedDriverT Rising, FixedDriverT Falling = reverse_driver_t<Rising>>
	requires(std::same_as<typename Rising::value_type, typename Falling::value_type> &&
			 std::same_as<typename Rising::time_type, typename Falling::time_type>)
class FixedOscillator {
  public:
	using value_type = typename Rising::value_type;
	using time_type = typename Rising::time_type;
	using iterator = PullIterator<FixedOscillator>;

	explicit FixedOscillator(Rising rising)
		requires(std::same_as<Falling, reverse_driver_t<Rising>>)
		: m_rising(std::move(rising)), m_falling(ReverseDriver<Rising>::make(m_rising)) {
		rewind_finished();
	}

	FixedOscillator(Rising rising, Falling falling) : m_rising(std::move(rising)), m_falling(std::move(falling)) { rewind_finished(); }

	value_type next() {
		if (m_direction == OscillationDirection::eRising) { return step(m_rising, OscillationDirection::eFalling); }
		return step(m_falling, OscillationDirection::eRising);
	}

	OscillationDirection direction() const { return m_direction; }
	Rising const& rising() const { return m_rising; }
	Falling const& falling() const { return m_falling; }

	iterator begin() { return iterator{*this}; }
	std::default_sentinel_t end() const { return {}; }

  private:
	template <typename Driver>
	value_type step(Driver& out_driver, OscillationDirection const next) {
		auto ret = out_driver.next();
		if (out_driver.is_finished()) {
			DriverAccess::rewind(out_driver);
			m_direction = next;
		}
		return std::move(*ret);
	}

	void rewind_finished() {
		if (m_rising.is_finished()) { DriverAccess::rewind(m_rising); }
		if (m_falling.is_finished()) { DriverAccess::rewind(m_falling); }
	}

	Rising m_rising;
	Falling m_falling;
	OscillationDirection m_direction{OscillationDirection::eRising};
};

template <typename Rising>
FixedOscillator(Rising) -> FixedOscillator<Rising, reverse_driver_t<Rising>>;

template <typename Rising, typename Falling>
FixedOscillator(Rising, Falling) -> FixedOscillator<Rising, Falling>;
} // namespace ease
