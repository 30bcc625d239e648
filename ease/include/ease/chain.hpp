#pragma once
#include <ease/any_tween.hpp>
#include <ease/driver.hpp>
#include <ease/util/error.hpp>
#include <span>
#include <vector>

namespace ease {
///
/// \brief Drives an ordered sequence of tweens as one continuous timeline.
///
/// update(delta) advances time within the current member; overshoot past a member's duration
/// carries into the next, so one delta may cross several members. A step that crosses members
/// yields the final value of the last member it completed. Completing the last member fuses the
/// chain: std::nullopt forever after. Members need not be continuous with each other.
///
/// Chain is a DriverT, so it can be wrapped in a Looper or Oscillator for repetition.
///
template <TweenValueT Value, TweenTimeT TimeT = Time>
class Chain {
  public:
	using value_type = Value;
	using time_type = TimeT;
	using tween_type = AnyTween<Value, TimeT>;

	///
	/// \brief Construct a Chain from a non-empty sequence of tweens.
	/// \throws Error if tweens is empty
	///
	explicit Chain(std::vector<tween_type> tweens) : m_tweens(std::move(tweens)) {
		if (m_tweens.empty()) { throw Error{"Chain requires at least one tween"}; }
		for (auto const& tween : m_tweens) { m_duration = m_duration + tween.duration(); }
	}

	template <SizedTweenT... Ts>
		requires(sizeof...(Ts) > 0)
	explicit Chain(Ts... tweens) : Chain(make_tweens(std::move(tweens)...)) {}

	std::optional<Value> update(TimeT const delta) {
		if (m_fused) { return {}; }
		m_elapsed = m_elapsed + delta;
		auto crossed = std::optional<Value>{};
		while (is_complete(m_elapsed, current().duration())) {
			crossed = current().final_value();
			if (m_index + 1 == m_tweens.size()) {
				m_fused = true;
				m_elapsed = current().duration();
				return crossed;
			}
			m_elapsed = m_elapsed - current().duration();
			m_offset = m_offset + current().duration();
			++m_index;
		}
		if (crossed) { return crossed; }
		return current().run(m_elapsed);
	}

	///
	/// \brief Sum of all member durations.
	///
	TimeT duration() const { return m_duration; }
	///
	/// \brief Total elapsed time across the chain.
	///
	TimeT current_time() const { return m_offset + m_elapsed; }
	std::size_t index() const { return m_index; }
	std::size_t size() const { return m_tweens.size(); }
	bool is_finished() const { return m_fused; }
	std::span<tween_type const> tweens() const { return m_tweens; }

  private:
	template <typename... Ts>
	static std::vector<tween_type> make_tweens(Ts&&... tweens) {
		auto ret = std::vector<tween_type>{};
		ret.reserve(sizeof...(Ts));
		(ret.emplace_back(std::forward<Ts>(tweens)), ...);
		return ret;
	}

	tween_type& current() { return m_tweens[m_index]; }

	void rewind() {
		m_index = 0;
		m_elapsed = m_offset = TimeTraits<TimeT>::zero();
		m_fused = false;
	}

	std::vector<tween_type> m_tweens{};
	TimeT m_duration{TimeTraits<TimeT>::zero()};
	TimeT m_offset{TimeTraits<TimeT>::zero()};
	TimeT m_elapsed{TimeTraits<TimeT>::zero()};
	std::size_t m_index{};
	bool m_fused{};

	friend struct DriverAccess;
};

template <SizedTweenT T, SizedTweenT... Ts>
Chain(T, Ts...) -> Chain<typename T::value_type, typename T::time_type>;

///
/// \brief Reverse of a chain: members in reverse order, each run backwards.
///
template <TweenValueT Value, TweenTimeT TimeT>
struct ReverseDriver<Chain<Value, TimeT>> {
	using type = Chain<Value, TimeT>;

	static type make(Chain<Value, TimeT> const& rising) {
		using tween_type = typename Chain<Value, TimeT>::tween_type;
		auto const in_tweens = rising.tweens();
		auto tweens = std::vector<tween_type>{};
		tweens.reserve(in_tweens.size());
		for (auto it = in_tweens.rbegin(); it != in_tweens.rend(); ++it) { tweens.emplace_back(Reversed<tween_type>{*it}); }
		return type{std::move(tweens)};
	}
};
} // namespace ease
