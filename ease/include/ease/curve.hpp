#pragma once

///
/// \brief Easing curves: stateless functors mapping percent complete in [0, 1] to a curve scalar.
///
/// Scalars start at 0 and end at 1; Back and Elastic overshoot in between.
/// Visual references: https://easings.net
///
namespace ease::curve {
struct Linear {
	constexpr double operator()(double const t) const { return t; }
};

struct SineIn {
	double operator()(double t) const;
};
struct SineOut {
	double operator()(double t) const;
};
struct SineInOut {
	double operator()(double t) const;
};

struct QuadIn {
	double operator()(double t) const;
};
struct QuadOut {
	double operator()(double t) const;
};
struct QuadInOut {
	double operator()(double t) const;
};

struct CubicIn {
	double operator()(double t) const;
};
struct CubicOut {
	double operator()(double t) const;
};
struct CubicInOut {
	double operator()(double t) const;
};

struct QuartIn {
	double operator()(double t) const;
};
struct QuartOut {
	double operator()(double t) const;
};
struct QuartInOut {
	double operator()(double t) const;
};

struct QuintIn {
	double operator()(double t) const;
};
struct QuintOut {
	double operator()(double t) const;
};
struct QuintInOut {
	double operator()(double t) const;
};

struct ExpoIn {
	double operator()(double t) const;
};
struct ExpoOut {
	double operator()(double t) const;
};
struct ExpoInOut {
	double operator()(double t) const;
};

struct CircIn {
	double operator()(double t) const;
};
struct CircOut {
	double operator()(double t) const;
};
struct CircInOut {
	double operator()(double t) const;
};

struct BackIn {
	double operator()(double t) const;
};
struct BackOut {
	double operator()(double t) const;
};
struct BackInOut {
	double operator()(double t) const;
};

struct ElasticIn {
	double operator()(double t) const;
};
struct ElasticOut {
	double operator()(double t) const;
};
struct ElasticInOut {
	double operator()(double t) const;
};

struct BounceIn {
	double operator()(double t) const;
};
struct BounceOut {
	double operator()(double t) const;
};
struct BounceInOut {
	double operator()(double t) const;
};
} // namespace ease::curve
