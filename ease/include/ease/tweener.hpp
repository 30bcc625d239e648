#pragma once
#include <ease/driver.hpp>
#include <ease/tween.hpp>

namespace ease {
///
/// \brief Drives a Tween with a caller supplied delta per update.
///
/// Suited to variable time step loops. Yields the tween's final value on the update that
/// reaches (or overshoots) its duration, and std::nullopt forever after.
///
/// \code
/// auto tweener = Tweener{Linear<int, int>{0, 10, 10}};
/// tweener.update(1);   // 1
/// tweener.update(2);   // 3
/// tweener.update(100); // 10
/// tweener.update(100); // std::nullopt
/// \endcode
///
/// Repeat with Looper{std::move(tweener)}, ping-pong with Oscillator{std::move(tweener)}
/// or Oscillator{std::move(rising), std::move(falling)}.
///
template <TweenT Tween>
class Tweener {
  public:
	using tween_type = Tween;
	using value_type = typename Tween::value_type;
	using time_type = typename Tween::time_type;

	explicit Tweener(Tween tween) : m_tween(std::move(tween)) {}

	///
	/// \brief Advance elapsed time by delta.
	/// \param delta Non-negative time increment
	/// \returns Value at the new elapsed time, the final value on completion, std::nullopt once finished
	///
	std::optional<value_type> update(time_type const delta) {
		if (m_fused) { return {}; }
		m_last_time = m_last_time + delta;
		if (is_complete(m_last_time, m_tween.duration())) {
			m_fused = true;
			m_last_time = m_tween.duration();
			return m_tween.final_value();
		}
		return m_tween.run(m_last_time);
	}

	Tween const& tween() const { return m_tween; }
	time_type current_time() const { return m_last_time; }
	bool is_finished() const { return m_fused; }

  private:
	void rewind() {
		m_last_time = TimeTraits<time_type>::zero();
		m_fused = false;
	}

	Tween m_tween;
	time_type m_last_time{TimeTraits<time_type>::zero()};
	bool m_fused{};

	friend struct DriverAccess;
};

///
/// \brief Drives a Tween by the same delta on every pull.
///
/// Suited to fixed time step loops. Behaves as a single pass sequence: next() yields values
/// until the tween completes (inclusive of its final value), then std::nullopt.
/// Range-for pulls from the same state.
///
/// \code
/// for (int const value : FixedTweener{Linear<int, int>{0, 4, 4}, 1}) {} // 1, 2, 3, 4
/// \endcode
///
/// Repeat with FixedLooper{std::move(fixed)}, ping-pong with FixedOscillator{std::move(fixed)}.
///
template <TweenT Tween>
class FixedTweener {
  public:
	using tween_type = Tween;
	using value_type = typename Tween::value_type;
	using time_type = typename Tween::time_type;
	using iterator = PullIterator<FixedTweener>;

	FixedTweener(Tween tween, time_type delta) : m_tween(std::move(tween)), m_delta(std::move(delta)) {}

	std::optional<value_type> next() {
		if (m_fused) { return {}; }
		m_last_time = m_last_time + m_delta;
		if (is_complete(m_last_time, m_tween.duration())) {
			m_fused = true;
			m_last_time = m_tween.duration();
			return m_tween.final_value();
		}
		return m_tween.run(m_last_time);
	}

	Tween const& tween() const { return m_tween; }
	time_type current_time() const { return m_last_time; }
	time_type delta() const { return m_delta; }
	bool is_finished() const { return m_fused; }

	iterator begin() { return iterator{*this}; }
	std::default_sentinel_t end() const { return {}; }

  private:
	void rewind() {
		m_last_time = TimeTraits<time_type>::zero();
		m_fused = false;
	}

	Tween m_tween;
	time_type m_last_time{TimeTraits<time_type>::zero()};
	time_type m_delta;
	bool m_fused{};

	friend struct DriverAccess;
};

template <SizedTweenT Tween>
struct ReverseDriver<Tweener<Tween>> {
	using type = Tweener<Reversed<Tween>>;

	static type make(Tweener<Tween> const& rising) { return type{Reversed<Tween>{rising.tween()}}; }
};

template <SizedTweenT Tween>
struct ReverseDriver<FixedTweener<Tween>> {
	using type = FixedTweener<Reversed<Tween>>;

	static type make(FixedTweener<Tween> const& rising) { return type{Reversed<Tween>{rising.tween()}, rising.delta()}; }
};
} // namespace ease
