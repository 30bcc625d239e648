#include <ease/ease_type.hpp>
#include <gtest/gtest.h>

namespace {
using namespace ease;

TEST(Curve, EveryCurveStartsAtZeroAndEndsAtOne) {
	for (std::size_t i = 0; i < static_cast<std::size_t>(EaseType::eCOUNT_); ++i) {
		auto const type = static_cast<EaseType>(i);
		EXPECT_NEAR(evaluate(type, 0.0), 0.0, 1e-6) << to_string(type);
		EXPECT_NEAR(evaluate(type, 1.0), 1.0, 1e-6) << to_string(type);
	}
}

TEST(Curve, Midpoints) {
	EXPECT_DOUBLE_EQ(curve::Linear{}(0.5), 0.5);
	EXPECT_DOUBLE_EQ(curve::QuadIn{}(0.5), 0.25);
	EXPECT_DOUBLE_EQ(curve::QuadOut{}(0.5), 0.75);
	EXPECT_DOUBLE_EQ(curve::QuadInOut{}(0.5), 0.5);
	EXPECT_DOUBLE_EQ(curve::CubicIn{}(0.5), 0.125);
	EXPECT_DOUBLE_EQ(curve::CubicInOut{}(0.5), 0.5);
	EXPECT_DOUBLE_EQ(curve::QuartIn{}(0.5), 0.0625);
	EXPECT_DOUBLE_EQ(curve::QuartOut{}(0.5), 0.9375);
	EXPECT_DOUBLE_EQ(curve::QuartInOut{}(0.5), 0.5);
	EXPECT_DOUBLE_EQ(curve::QuintIn{}(0.5), 0.03125);
	EXPECT_NEAR(curve::SineInOut{}(0.5), 0.5, 1e-12);
	EXPECT_NEAR(curve::BounceInOut{}(0.5), 0.5, 1e-12);
}

TEST(Curve, BackOvershoots) {
	EXPECT_LT(curve::BackIn{}(0.2), 0.0);
	EXPECT_GT(curve::BackOut{}(0.8), 1.0);
}

TEST(Eased, RunScalesValueDelta) {
	auto const linear = Linear<float, float>{0.0f, 10.0f, 2.0f};
	EXPECT_FLOAT_EQ(linear.run(1.0f), 5.0f);
	EXPECT_FLOAT_EQ(linear.initial_value(), 0.0f);
	EXPECT_FLOAT_EQ(linear.final_value(), 10.0f);
	EXPECT_FLOAT_EQ(linear.value_delta(), 10.0f);

	auto const quad = QuadIn<int, int>{0, 100, 10};
	EXPECT_EQ(quad.run(5), 25);
	EXPECT_EQ(quad.duration(), 10);

	auto const falling = Linear<int, int>{10, 0, 10};
	EXPECT_EQ(falling.run(5), 5);
}

TEST(Eased, CustomCurve) {
	auto const step = [](double t) { return t < 0.5 ? 0.0 : 1.0; };
	auto const eased = Eased{0.0f, 8.0f, 4.0f, step};
	EXPECT_FLOAT_EQ(eased.run(1.0f), 0.0f);
	EXPECT_FLOAT_EQ(eased.run(3.0f), 8.0f);
}
} // namespace
