#include <ease/curve.hpp>
#include <cmath>
#include <numbers>

namespace ease::curve {
namespace {
constexpr auto pi_v = std::numbers::pi_v<double>;

// Back overshoot amounts.
constexpr double back_c1_v{1.70158};
constexpr double back_c2_v{back_c1_v * 1.525};
constexpr double back_c3_v{back_c1_v + 1.0};

constexpr double elastic_c4_v{2.0 * pi_v / 3.0};
constexpr double elastic_c5_v{2.0 * pi_v / 4.5};

constexpr double pow_n(double const t, int const n) {
	auto ret = 1.0;
	for (int i = 0; i < n; ++i) { ret *= t; }
	return ret;
}

double bounce_out(double t) {
	static constexpr double n1{7.5625};
	static constexpr double d1{2.75};
	if (t < 1.0 / d1) { return n1 * t * t; }
	if (t < 2.0 / d1) {
		t -= 1.5 / d1;
		return n1 * t * t + 0.75;
	}
	if (t < 2.5 / d1) {
		t -= 2.25 / d1;
		return n1 * t * t + 0.9375;
	}
	t -= 2.625 / d1;
	return n1 * t * t + 0.984375;
}
} // namespace

double SineIn::operator()(double const t) const { return 1.0 - std::cos(t * pi_v / 2.0); }
double SineOut::operator()(double const t) const { return std::sin(t * pi_v / 2.0); }
double SineInOut::operator()(double const t) const { return -(std::cos(pi_v * t) - 1.0) / 2.0; }

double QuadIn::operator()(double const t) const { return t * t; }
double QuadOut::operator()(double const t) const { return -t * (t - 2.0); }
double QuadInOut::operator()(double const t) const { return t < 0.5 ? 2.0 * t * t : 1.0 - pow_n(-2.0 * t + 2.0, 2) / 2.0; }

double CubicIn::operator()(double const t) const { return t * t * t; }
double CubicOut::operator()(double const t) const { return 1.0 - pow_n(1.0 - t, 3); }
double CubicInOut::operator()(double const t) const { return t < 0.5 ? 4.0 * t * t * t : 1.0 - pow_n(-2.0 * t + 2.0, 3) / 2.0; }

double QuartIn::operator()(double const t) const { return pow_n(t, 4); }
double QuartOut::operator()(double const t) const { return -(pow_n(t - 1.0, 4) - 1.0); }

double QuartInOut::operator()(double t) const {
	t *= 2.0;
	if (t < 1.0) { return pow_n(t, 4) / 2.0; }
	return -(pow_n(t - 2.0, 4) - 2.0) / 2.0;
}

double QuintIn::operator()(double const t) const { return pow_n(t, 5); }
double QuintOut::operator()(double const t) const { return 1.0 + pow_n(t - 1.0, 5); }
double QuintInOut::operator()(double const t) const { return t < 0.5 ? 16.0 * pow_n(t, 5) : 1.0 - pow_n(-2.0 * t + 2.0, 5) / 2.0; }

double ExpoIn::operator()(double const t) const { return t <= 0.0 ? 0.0 : std::pow(2.0, 10.0 * t - 10.0); }
double ExpoOut::operator()(double const t) const { return t >= 1.0 ? 1.0 : 1.0 - std::pow(2.0, -10.0 * t); }

double ExpoInOut::operator()(double const t) const {
	if (t <= 0.0) { return 0.0; }
	if (t >= 1.0) { return 1.0; }
	if (t < 0.5) { return std::pow(2.0, 20.0 * t - 10.0) / 2.0; }
	return (2.0 - std::pow(2.0, -20.0 * t + 10.0)) / 2.0;
}

double CircIn::operator()(double const t) const { return 1.0 - std::sqrt(1.0 - t * t); }
double CircOut::operator()(double const t) const { return std::sqrt(1.0 - pow_n(t - 1.0, 2)); }

double CircInOut::operator()(double const t) const {
	if (t < 0.5) { return (1.0 - std::sqrt(1.0 - pow_n(2.0 * t, 2))) / 2.0; }
	return (std::sqrt(1.0 - pow_n(-2.0 * t + 2.0, 2)) + 1.0) / 2.0;
}

double BackIn::operator()(double const t) const { return back_c3_v * t * t * t - back_c1_v * t * t; }
double BackOut::operator()(double const t) const { return 1.0 + back_c3_v * pow_n(t - 1.0, 3) + back_c1_v * pow_n(t - 1.0, 2); }

double BackInOut::operator()(double const t) const {
	if (t < 0.5) { return (pow_n(2.0 * t, 2) * ((back_c2_v + 1.0) * 2.0 * t - back_c2_v)) / 2.0; }
	return (pow_n(2.0 * t - 2.0, 2) * ((back_c2_v + 1.0) * (2.0 * t - 2.0) + back_c2_v) + 2.0) / 2.0;
}

double ElasticIn::operator()(double const t) const {
	if (t <= 0.0) { return 0.0; }
	if (t >= 1.0) { return 1.0; }
	return -std::pow(2.0, 10.0 * t - 10.0) * std::sin((10.0 * t - 10.75) * elastic_c4_v);
}

double ElasticOut::operator()(double const t) const {
	if (t <= 0.0) { return 0.0; }
	if (t >= 1.0) { return 1.0; }
	return std::pow(2.0, -10.0 * t) * std::sin((10.0 * t - 0.75) * elastic_c4_v) + 1.0;
}

double ElasticInOut::operator()(double const t) const {
	if (t <= 0.0) { return 0.0; }
	if (t >= 1.0) { return 1.0; }
	if (t < 0.5) { return -(std::pow(2.0, 20.0 * t - 10.0) * std::sin((20.0 * t - 11.125) * elastic_c5_v)) / 2.0; }
	return (std::pow(2.0, -20.0 * t + 10.0) * std::sin((20.0 * t - 11.125) * elastic_c5_v)) / 2.0 + 1.0;
}

double BounceIn::operator()(double const t) const { return 1.0 - bounce_out(1.0 - t); }
double BounceOut::operator()(double const t) const { return bounce_out(t); }
double BounceInOut::operator()(double const t) const { return t < 0.5 ? (1.0 - bounce_out(1.0 - 2.0 * t)) / 2.0 : (1.0 + bounce_out(2.0 * t - 1.0)) / 2.0; }
} // namespace ease::curve
