#pragma once

#include <Eigen/Dense>
#include <cstddef>

namespace regpipe {
namespace core {

/**
 * Fitted parameters of a Standardizer
 *
 * Produced by Standardizer::Fit and never modified afterwards; a re-fit
 * produces a new object. All three vectors have one entry per feature.
 *
 * Conventions:
 * - mean is 0 for every feature when with_mean is false
 * - scale is 1 for every feature when with_std is false
 * - scale is 1 for a zero-variance feature while variance stays 0
 * - otherwise scale = sqrt(variance) (population variance, divisor n)
 */
struct StandardizerState {
	Eigen::VectorXd mean;
	Eigen::VectorXd scale;
	Eigen::VectorXd variance;

	bool with_mean = true;
	bool with_std = true;

	/// Number of rows seen by the fit that produced this state
	size_t n_samples_seen = 0;

	size_t FeatureCount() const {
		return static_cast<size_t>(mean.size());
	}
};

/**
 * Fitted parameters of a LinearRegressor
 *
 * coefficients has one entry per feature and does NOT include the intercept.
 */
struct RegressorState {
	Eigen::VectorXd coefficients;

	/// 0 when fit_intercept is false
	double intercept = 0.0;

	bool fit_intercept = true;

	/// Numerical rank of the (centered) feature block; < FeatureCount() means aliased columns
	size_t rank = 0;

	size_t n_samples_seen = 0;

	size_t FeatureCount() const {
		return static_cast<size_t>(coefficients.size());
	}

	bool IsRankDeficient() const {
		return rank < FeatureCount();
	}
};

} // namespace core
} // namespace regpipe
