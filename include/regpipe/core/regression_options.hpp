#pragma once

#include "regpipe/core/errors.hpp"
#include <cmath>
#include <string>

namespace regpipe {
namespace core {

/**
 * How the solver reacts to a rank-deficient feature block
 *
 * LEAST_NORM: return the minimum-norm least-squares solution (pseudo-inverse).
 *             Aliased directions receive the smallest coefficients that still
 *             minimize the residual sum of squares.
 * RAISE_ERROR: raise SingularMatrixError.
 */
enum class RankDeficiencyPolicy { LEAST_NORM, RAISE_ERROR };

inline std::string RankDeficiencyPolicyName(RankDeficiencyPolicy policy) {
	switch (policy) {
	case RankDeficiencyPolicy::LEAST_NORM:
		return "least_norm";
	case RankDeficiencyPolicy::RAISE_ERROR:
		return "error";
	default:
		return "unknown";
	}
}

/**
 * Configuration for the feature standardizer
 *
 * Matches the flags exported to the hosting node as with_mean / with_std.
 */
struct ScalerOptions {
	/// Center each feature on its mean (otherwise the mean is treated as 0)
	bool with_mean = true;

	/// Divide each feature by its population standard deviation (otherwise scale is 1)
	bool with_std = true;

	ScalerOptions() = default;

	static ScalerOptions Standard() {
		return ScalerOptions();
	}

	static ScalerOptions CenterOnly() {
		ScalerOptions opts;
		opts.with_std = false;
		return opts;
	}

	static ScalerOptions ScaleOnly() {
		ScalerOptions opts;
		opts.with_mean = false;
		return opts;
	}
};

/**
 * Configuration options for the least-squares solver
 *
 * Design notes:
 * - All defaults specified in-class
 * - Validate() checks values that cannot be expressed by the type alone
 */
struct RegressionOptions {
	/// Include an intercept term (data are centered before the solve)
	/// Default: true
	bool fit_intercept = true;

	/// Behaviour when the centered feature block is rank deficient
	/// Default: LEAST_NORM
	RankDeficiencyPolicy rank_policy = RankDeficiencyPolicy::LEAST_NORM;

	/// Relative threshold for rank determination (-1 = auto, use Eigen default)
	/// Default: -1.0 (auto)
	double qr_tolerance = -1.0;

	RegressionOptions() = default;

	/// Convenience constructor for plain OLS
	static RegressionOptions OLS(bool fit_intercept_ = true) {
		RegressionOptions opts;
		opts.fit_intercept = fit_intercept_;
		return opts;
	}

	/// OLS that refuses rank-deficient inputs
	static RegressionOptions Strict(bool fit_intercept_ = true) {
		RegressionOptions opts;
		opts.fit_intercept = fit_intercept_;
		opts.rank_policy = RankDeficiencyPolicy::RAISE_ERROR;
		return opts;
	}

	/**
	 * Validate option values
	 *
	 * @throws InvalidInputError if validation fails
	 */
	void Validate() const {
		// -1 (or any non-positive value) selects the Eigen default
		if (std::isnan(qr_tolerance) || std::isinf(qr_tolerance)) {
			throw InvalidInputError("qr_tolerance must be finite (got " + std::to_string(qr_tolerance) + ")");
		}
		if (qr_tolerance >= 1.0) {
			throw InvalidInputError("qr_tolerance must be below 1 (got " + std::to_string(qr_tolerance) + ")");
		}
	}
};

} // namespace core
} // namespace regpipe
