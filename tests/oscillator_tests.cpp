#include <ease/chain.hpp>
#include <ease/eased.hpp>
#include <ease/oscillator.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace {
using namespace ease;
using Direction = OscillationDirection;

TEST(Reversed, RunsBackwards) {
	auto reversed = Reversed{Linear<int, int>{0, 2, 2}};
	EXPECT_EQ(reversed.initial_value(), 2);
	EXPECT_EQ(reversed.final_value(), 0);
	EXPECT_EQ(reversed.duration(), 2);
	EXPECT_EQ(reversed.run(1), 1);

	auto quad = Reversed{QuadIn<float, float>{0.0f, 4.0f, 4.0f}};
	EXPECT_FLOAT_EQ(quad.run(1.0f), (QuadIn<float, float>{0.0f, 4.0f, 4.0f}.run(3.0f)));
}

TEST(Oscillator, FlipsOnCompletingStep) {
	auto oscillator = Oscillator{Tweener{Linear<int, int>{0, 2, 2}}};
	static_assert(std::same_as<decltype(oscillator), Oscillator<Tweener<Linear<int, int>>, Tweener<Reversed<Linear<int, int>>>>>);

	EXPECT_EQ(oscillator.direction(), Direction::eRising);
	EXPECT_EQ(oscillator.update(1), 1);
	EXPECT_EQ(oscillator.direction(), Direction::eRising);
	EXPECT_EQ(oscillator.update(1), 2);
	EXPECT_EQ(oscillator.direction(), Direction::eFalling);
	EXPECT_EQ(oscillator.update(1), 1);
	EXPECT_EQ(oscillator.direction(), Direction::eFalling);
	EXPECT_EQ(oscillator.update(1), 0);
	EXPECT_EQ(oscillator.direction(), Direction::eRising);
	EXPECT_EQ(oscillator.update(1), 1);
	EXPECT_EQ(oscillator.direction(), Direction::eRising);
	EXPECT_EQ(oscillator.update(1), 2);
	EXPECT_EQ(oscillator.direction(), Direction::eFalling);
}

TEST(Oscillator, ExplicitFallingDriver) {
	auto oscillator = Oscillator{Tweener{Linear<int, int>{0, 2, 2}}, Tweener{Linear<int, int>{2, 0, 4}}};
	auto values = std::vector<int>{};
	for (int i = 0; i < 6; ++i) { values.push_back(oscillator.update(1)); }
	EXPECT_EQ(values, (std::vector<int>{1, 2, 2, 1, 1, 0}));
	EXPECT_EQ(oscillator.direction(), Direction::eRising);
}

TEST(Oscillator, AlternatesOnlyAtCompletion) {
	auto oscillator = Oscillator{Tweener{Linear<int, int>{0, 4, 4}}};
	auto previous = oscillator.direction();
	for (int step = 1; step <= 24; ++step) {
		oscillator.update(1);
		auto const flipped = oscillator.direction() != previous;
		EXPECT_EQ(flipped, step % 4 == 0) << "step " << step;
		previous = oscillator.direction();
	}
}

TEST(Oscillator, RewindsFinishedDrivers) {
	auto rising = Tweener{Linear<int, int>{0, 2, 2}};
	ASSERT_EQ(rising.update(2), 2);
	auto oscillator = Oscillator{std::move(rising)};
	EXPECT_FALSE(oscillator.rising().is_finished());
	EXPECT_EQ(oscillator.update(1), 1);
}

TEST(Oscillator, ChainReversesMembers) {
	auto oscillator = Oscillator{Chain{Linear<int, int>{0, 10, 5}, Linear<int, int>{10, 20, 5}}};
	static_assert(std::same_as<decltype(oscillator), Oscillator<Chain<int, int>, Chain<int, int>>>);

	EXPECT_EQ(oscillator.update(5), 10);
	EXPECT_EQ(oscillator.update(5), 20);
	EXPECT_EQ(oscillator.direction(), Direction::eFalling);
	EXPECT_EQ(oscillator.update(5), 10);
	EXPECT_EQ(oscillator.update(5), 0);
	EXPECT_EQ(oscillator.direction(), Direction::eRising);
	EXPECT_EQ(oscillator.update(5), 10);
}

TEST(FixedOscillator, FlipsOnCompletingStep) {
	auto oscillator = FixedOscillator{FixedTweener{Linear<int, int>{0, 2, 2}, 1}};

	EXPECT_EQ(oscillator.direction(), Direction::eRising);
	EXPECT_EQ(oscillator.next(), 1);
	EXPECT_EQ(oscillator.direction(), Direction::eRising);
	EXPECT_EQ(oscillator.next(), 2);
	EXPECT_EQ(oscillator.direction(), Direction::eFalling);
	EXPECT_EQ(oscillator.next(), 1);
	EXPECT_EQ(oscillator.direction(), Direction::eFalling);
	EXPECT_EQ(oscillator.next(), 0);
	EXPECT_EQ(oscillator.direction(), Direction::eRising);
	EXPECT_EQ(oscillator.next(), 1);
	EXPECT_EQ(oscillator.direction(), Direction::eRising);
	EXPECT_EQ(oscillator.next(), 2);
	EXPECT_EQ(oscillator.direction(), Direction::eFalling);
}

TEST(FixedOscillator, UnboundedRange) {
	auto oscillator = FixedOscillator{FixedTweener{Linear<int, int>{0, 2, 2}, 1}};
	auto values = std::vector<int>{};
	for (int const value : oscillator) {
		values.push_back(value);
		if (values.size() == 9) { break; }
	}
	EXPECT_EQ(values, (std::vector<int>{1, 2, 1, 0, 1, 2, 1, 0, 1}));
}
} // namespace
