#pragma once
#include <Eigen/Dense>

namespace seasonfit {
	using Real   = double;
	using Vector = Eigen::VectorXd;
	using Matrix = Eigen::MatrixXd;

	/* every double-S model carries exactly seven parameters */
	constexpr int kNParams = 7;

	enum ParamIndex {
		BASE        = 0,    // p0
		AMP_RISE    = 1,    // p1
		RISE_A      = 2,    // p2
		RISE_B      = 3,    // p3
		AMP_FALL    = 4,    // p4
		FALL_A      = 5,    // p5
		FALL_B      = 6     // p6
	};
} // namespace seasonfit
