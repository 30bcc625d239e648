#pragma once
#include <ease/tween.hpp>
#include <memory>

namespace ease {
///
/// \brief Type erased, copyable owner of any SizedTween of matching value and time types.
///
/// Enables heterogeneous sequences of tweens (eg Chain members). AnyTween is itself a SizedTween.
///
template <TweenValueT Value, TweenTimeT TimeT = Time>
class AnyTween {
  public:
	using value_type = Value;
	using time_type = TimeT;

	AnyTween(AnyTween&&) = default;
	AnyTween& operator=(AnyTween&&) = default;
	AnyTween(AnyTween const& rhs) : m_model(clone(rhs.m_model)) {}
	AnyTween& operator=(AnyTween const& rhs) { return (m_model = clone(rhs.m_model), *this); }

	template <SizedTweenT T>
		requires(!std::same_as<T, AnyTween> && std::same_as<typename T::value_type, Value> && std::same_as<typename T::time_type, TimeT>)
	AnyTween(T t) : m_model(std::make_unique<Model<T>>(std::move(t))) {}

	TimeT duration() const { return m_model->duration(); }
	Value run(TimeT const elapsed) { return m_model->run(elapsed); }
	Value initial_value() const { return m_model->initial_value(); }
	Value final_value() const { return m_model->final_value(); }

	///
	/// \brief Obtain the concrete tween, if it is of type T.
	/// \returns nullptr if the stored tween is not a T
	///
	template <SizedTweenT T>
	T const* as() const {
		if (auto const* p = dynamic_cast<Model<T> const*>(m_model.get())) { return &p->impl; }
		return {};
	}

  private:
	struct Base {
		virtual ~Base() = default;

		virtual TimeT duration() const = 0;
		virtual Value run(TimeT elapsed) = 0;
		virtual Value initial_value() const = 0;
		virtual Value final_value() const = 0;
		virtual std::unique_ptr<Base> clone() const = 0;
	};

	template <SizedTweenT T>
	struct Model : Base {
		T impl;
		Model(T&& t) : impl(std::move(t)) {}

		TimeT duration() const final { return impl.duration(); }
		Value run(TimeT elapsed) final { return impl.run(elapsed); }
		Value initial_value() const final { return impl.initial_value(); }
		Value final_value() const final { return impl.final_value(); }
		std::unique_ptr<Base> clone() const final { return std::make_unique<Model<T>>(*this); }
	};

	static std::unique_ptr<Base> clone(std::unique_ptr<Base> const& other) {
		if (!other) { return {}; }
		return other->clone();
	}

	std::unique_ptr<Base> m_model{};
};
} // namespace ease
