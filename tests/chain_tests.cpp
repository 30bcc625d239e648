#include <ease/chain.hpp>
#include <ease/eased.hpp>
#include <gtest/gtest.h>

namespace {
using namespace ease;

static_assert(DriverT<Chain<int, int>>);

TEST(Chain, EmitsMemberFinalValuesThenNothing) {
	auto chain = Chain{Linear<int, int>{0, 10, 5}, Linear<int, int>{10, 0, 5}};
	EXPECT_EQ(chain.duration(), 10);
	EXPECT_EQ(chain.update(5), 10);
	EXPECT_EQ(chain.index(), 1u);
	EXPECT_EQ(chain.update(5), 0);
	EXPECT_TRUE(chain.is_finished());
	EXPECT_EQ(chain.update(5), std::nullopt);
	EXPECT_EQ(chain.update(0), std::nullopt);
}

TEST(Chain, InterpolatesWithinMember) {
	auto chain = Chain{Linear<int, int>{0, 10, 5}, Linear<int, int>{10, 0, 5}};
	EXPECT_EQ(chain.update(1), 2);
	EXPECT_EQ(chain.update(2), 6);
	EXPECT_EQ(chain.index(), 0u);
	EXPECT_EQ(chain.update(3), 10);
	EXPECT_EQ(chain.index(), 1u);
	EXPECT_EQ(chain.update(1), 6);
	EXPECT_EQ(chain.current_time(), 7);
}

TEST(Chain, OneDeltaCrossesSeveralMembers) {
	auto chain = Chain{Linear<int, int>{0, 10, 4}, Linear<int, int>{10, 20, 4}, Linear<int, int>{20, 30, 4}};
	EXPECT_EQ(chain.update(10), 20);
	EXPECT_EQ(chain.index(), 2u);
	EXPECT_EQ(chain.current_time(), 10);
	EXPECT_EQ(chain.update(1), 27);
}

TEST(Chain, SpanningDeltaMatchesMemberByMember) {
	auto spanning = Chain{Linear<int, int>{0, 10, 4}, Linear<int, int>{10, 20, 4}, Linear<int, int>{20, 30, 4}};
	auto stepped = spanning;
	EXPECT_EQ(spanning.duration(), 12);

	EXPECT_EQ(stepped.update(4), 10);
	EXPECT_EQ(stepped.update(4), 20);
	auto const stepped_end = stepped.update(4);
	auto const spanning_end = spanning.update(12);
	EXPECT_EQ(stepped_end, 30);
	EXPECT_EQ(spanning_end, stepped_end);
	EXPECT_TRUE(spanning.is_finished() && stepped.is_finished());
	EXPECT_EQ(spanning.current_time(), spanning.duration());
}

TEST(Chain, HugeDeltaFinishesWithLastFinalValue) {
	auto chain = Chain{Linear<int, int>{0, 10, 4}, Linear<int, int>{10, 20, 4}};
	EXPECT_EQ(chain.update(1000), 20);
	EXPECT_EQ(chain.update(1), std::nullopt);
}

TEST(Chain, AllowsDiscontinuousMembers) {
	auto chain = Chain{Linear<int, int>{0, 10, 2}, Linear<int, int>{100, 200, 2}};
	EXPECT_EQ(chain.update(1), 5);
	EXPECT_EQ(chain.update(1), 10);
	EXPECT_EQ(chain.update(1), 150);
}

TEST(Chain, ZeroDurationMemberCompletesImmediately) {
	auto chain = Chain{Linear<int, int>{0, 10, 2}, Linear<int, int>{50, 50, 0}, Linear<int, int>{0, -10, 2}};
	EXPECT_EQ(chain.update(2), 50);
	EXPECT_EQ(chain.index(), 2u);
	EXPECT_EQ(chain.update(1), -5);
}

TEST(Chain, MixesCurveTypes) {
	auto chain = Chain{Linear<float, float>{0.0f, 1.0f, 1.0f}, QuadIn<float, float>{1.0f, 2.0f, 1.0f}};
	EXPECT_EQ(chain.update(1.5f), 1.0f);
	auto const value = chain.update(0.0f);
	ASSERT_TRUE(value);
	EXPECT_FLOAT_EQ(*value, 1.25f);
	ASSERT_NE((chain.tweens()[1].as<QuadIn<float, float>>()), nullptr);
}

TEST(Chain, FromVector) {
	auto tweens = std::vector<Chain<int, int>::tween_type>{};
	tweens.emplace_back(Linear<int, int>{0, 4, 4});
	tweens.emplace_back(CubicIn<int, int>{4, 8, 4});
	auto chain = Chain<int, int>{std::move(tweens)};
	EXPECT_EQ(chain.size(), 2u);
	EXPECT_EQ(chain.duration(), 8);
	EXPECT_EQ(chain.update(2), 2);
}

TEST(Chain, EmptyIsAnError) { EXPECT_THROW((Chain<int, int>{std::vector<AnyTween<int, int>>{}}), Error); }
} // namespace
