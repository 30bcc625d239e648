#pragma once
#include <concepts>
#include <cstddef>
#include <iterator>
#include <optional>

namespace ease {
///
/// \brief Variable-delta driver: yields values per update(delta) until finished, then std::nullopt.
///
template <typename Type>
concept DriverT = requires(Type& d, Type const& cd, typename Type::time_type delta) {
					  typename Type::value_type;
					  { d.update(delta) } -> std::same_as<std::optional<typename Type::value_type>>;
					  { cd.is_finished() } -> std::convertible_to<bool>;
				  };

///
/// \brief Fixed-delta driver: yields values per next() until finished, then std::nullopt.
///
template <typename Type>
concept FixedDriverT = requires(Type& d, Type const& cd) {
						   typename Type::value_type;
						   typename Type::time_type;
						   { d.next() } -> std::same_as<std::optional<typename Type::value_type>>;
						   { cd.is_finished() } -> std::convertible_to<bool>;
					   };

///
/// \brief Grants composition wrappers (loopers, oscillators) the ability to rewind a finished driver.
///
/// Drivers befriend this type; a driver cannot clear its own fuse.
///
struct DriverAccess {
	template <typename Driver>
	static void rewind(Driver& out) {
		out.rewind();
	}
};

///
/// \brief Customization point: the driver that runs a Driver's tween(s) backwards.
///
/// Specializations provide `type` and `static type make(Driver const&)`; used to derive falling oscillators.
///
template <typename Driver>
struct ReverseDriver;

template <typename Driver>
using reverse_driver_t = typename ReverseDriver<Driver>::type;

///
/// \brief Single pass input iterator over a pull-based source (anything with next()).
///
/// Compares equal to std::default_sentinel once the source yields std::nullopt; never, for infinite sources.
///
template <typename Source>
class PullIterator {
  public:
	using value_type = typename Source::value_type;
	using difference_type = std::ptrdiff_t;

	PullIterator() = default;
	explicit PullIterator(Source& source) : m_source(&source) { pull(); }

	value_type const& operator*() const { return *m_current; }

	PullIterator& operator++() { return (pull(), *this); }
	void operator++(int) { pull(); }

	bool operator==(std::default_sentinel_t) const { return !m_current.has_value(); }

  private:
	void pull() { m_current = m_source->next(); }

	Source* m_source{};
	std::optional<value_type> m_current{};
};
} // namespace ease
