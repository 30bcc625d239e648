#pragma once
#include <ease/driver.hpp>
#include <ease/tweener.hpp>

namespace ease {
///
/// \brief Repeats a variable-delta driver forever.
///
/// When the inner driver completes, its final value is returned and it is rewound to zero;
/// overshoot past the boundary is discarded. Works with any DriverT (eg Tweener, Chain).
///
template <DriverT Driver>
class Looper {
  public:
	using driver_type = Driver;
	using value_type = typename Driver::value_type;
	using time_type = typename Driver::time_type;

	explicit Looper(Driver driver) : m_driver(std::move(driver)) {
		if (m_driver.is_finished()) { DriverAccess::rewind(m_driver); }
	}

	value_type update(time_type const delta) {
		auto ret = m_driver.update(delta);
		if (m_driver.is_finished()) { DriverAccess::rewind(m_driver); }
		return std::move(*ret);
	}

	Driver const& driver() const { return m_driver; }

  private:
	Driver m_driver;
};

///
/// \brief Repeats a fixed-delta driver forever: an unbounded sequence.
///
template <FixedDriverT Driver>
class FixedLooper {
  public:
	using driver_type = Driver;
	using value_type = typename Driver::value_type;
	using time_type = typename Driver::time_type;
	using iterator = PullIterator<FixedLooper>;

	explicit FixedLooper(Driver driver) : m_driver(std::move(driver)) {
		if (m_driver.is_finished()) { DriverAccess::rewind(m_driver); }
	}

	value_type next() {
		auto ret = m_driver.next();
		if (m_driver.is_finished()) { DriverAccess::rewind(m_driver); }
		return std::move(*ret);
	}

	Driver const& driver() const { return m_driver; }

	iterator begin() { return iterator{*this}; }
	std::default_sentinel_t end() const { return {}; }

  private:
	Driver m_driver;
};
} // namespace ease
