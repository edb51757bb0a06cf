#pragma once

#include "regpipe/core/errors.hpp"
#include "regpipe/core/feature_matrix.hpp"
#include "regpipe/core/fitted_state.hpp"
#include "regpipe/core/regression_options.hpp"
#include "regpipe/utils/tracing.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

namespace regpipe {
namespace preprocessing {

/**
 * Per-feature standardization: z = (x - mean) / scale
 *
 * Fit computes, per column, the arithmetic mean and the population standard
 * deviation (divisor n). Either step can be switched off through ScalerOptions,
 * in which case the mean is 0 or the scale is 1.
 *
 * Zero-variance columns: a column whose standard deviation is below
 * 10 * eps * max(1, |mean|) gets scale = 1.0 exactly, so its transformed
 * values are value - mean. The reported variance stays at the computed value.
 *
 * Not safe to Fit concurrently with any other call on the same instance.
 */
class Standardizer {
public:
	Standardizer() = default;

	/**
	 * Rebuild a fitted standardizer from a previously exported state
	 *
	 * @throws InvalidInputError if the vectors disagree in length or a scale is zero/non-finite
	 */
	static Standardizer FromState(const core::StandardizerState &state);

	/**
	 * Compute per-feature mean and scale and store them as the current state
	 *
	 * @param X Training matrix (n × p), n >= 1, p >= 1
	 * @param options with_mean / with_std flags
	 * @return Reference to the state now held by the instance
	 * @throws EmptyInputError if X has no rows or no columns
	 * @throws InvalidInputError if X contains NaN or Inf
	 */
	const core::StandardizerState &Fit(const core::FeatureMatrix &X,
	                                   const core::ScalerOptions &options = core::ScalerOptions());

	/**
	 * @throws NotFittedError before Fit
	 * @throws DimensionMismatchError if X.cols() differs from the fitted feature count
	 */
	core::FeatureMatrix Transform(const core::FeatureMatrix &X) const;

	/// Same numbers as Fit(X, options) followed by Transform(X)
	core::FeatureMatrix FitTransform(const core::FeatureMatrix &X,
	                                 const core::ScalerOptions &options = core::ScalerOptions());

	/// x = z * scale + mean; same error contract as Transform
	core::FeatureMatrix InverseTransform(const core::FeatureMatrix &Z) const;

	bool IsFitted() const {
		return fitted_;
	}

	/// @throws NotFittedError before Fit
	const core::StandardizerState &State() const;

	size_t FeatureCount() const {
		return fitted_ ? state_.FeatureCount() : 0;
	}

	/// Pure computation behind Fit; does not touch any instance
	static core::StandardizerState ComputeState(const core::FeatureMatrix &X, const core::ScalerOptions &options);

	/// True when a standard deviation is treated as zero for a column with the given mean
	static bool IsZeroScale(double std_dev, double mean);

private:
	void CheckApplicable(const core::FeatureMatrix &X, const char *operation) const;

	core::StandardizerState state_;
	bool fitted_ = false;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline bool Standardizer::IsZeroScale(double std_dev, double mean) {
	const double eps = std::numeric_limits<double>::epsilon();
	return std_dev < 10.0 * eps * std::max(1.0, std::abs(mean));
}

inline core::StandardizerState Standardizer::ComputeState(const core::FeatureMatrix &X,
                                                          const core::ScalerOptions &options) {
	const auto n = X.rows();
	const auto p = X.cols();

	if (n == 0) {
		throw core::EmptyInputError("Standardizer fit requires at least one row");
	}
	if (p == 0) {
		throw core::EmptyInputError("Standardizer fit requires at least one feature column");
	}
	core::ValidateFinite(X, "feature matrix");

	core::StandardizerState state;
	state.with_mean = options.with_mean;
	state.with_std = options.with_std;
	state.n_samples_seen = static_cast<size_t>(n);
	state.mean = Eigen::VectorXd::Zero(p);
	state.scale = Eigen::VectorXd::Ones(p);
	state.variance = Eigen::VectorXd::Ones(p);

	const Eigen::VectorXd col_means = X.colwise().mean().transpose();

	for (Eigen::Index j = 0; j < p; j++) {
		if (options.with_mean) {
			state.mean(j) = col_means(j);
		}
		if (!options.with_std) {
			continue;
		}

		// Population variance around the true column mean, independent of with_mean
		const double var = (X.col(j).array() - col_means(j)).square().sum() / static_cast<double>(n);
		const double std_dev = std::sqrt(var);
		state.variance(j) = var;

		if (IsZeroScale(std_dev, col_means(j))) {
			REGPIPE_DEBUG("Feature " << j << " has zero variance; using scale 1.0");
			state.scale(j) = 1.0;
		} else {
			state.scale(j) = std_dev;
		}
	}

	return state;
}

inline Standardizer Standardizer::FromState(const core::StandardizerState &state) {
	const auto p = state.mean.size();
	if (p == 0) {
		throw core::InvalidInputError("Standardizer state has no features");
	}
	if (state.scale.size() != p || state.variance.size() != p) {
		throw core::InvalidInputError("Standardizer state vectors differ in length (mean " + std::to_string(p) +
		                              ", scale " + std::to_string(state.scale.size()) + ", var " +
		                              std::to_string(state.variance.size()) + ")");
	}
	for (Eigen::Index j = 0; j < p; j++) {
		if (!std::isfinite(state.mean(j))) {
			throw core::InvalidInputError("Standardizer state has non-finite mean for feature " + std::to_string(j));
		}
		if (!std::isfinite(state.scale(j)) || state.scale(j) == 0.0) {
			throw core::InvalidInputError("Standardizer state has invalid scale for feature " + std::to_string(j));
		}
	}

	Standardizer standardizer;
	standardizer.state_ = state;
	standardizer.fitted_ = true;
	return standardizer;
}

inline const core::StandardizerState &Standardizer::Fit(const core::FeatureMatrix &X,
                                                        const core::ScalerOptions &options) {
	REGPIPE_TIMING_START();

	// Compute into a temporary so a failure leaves the previous state untouched
	core::StandardizerState next = ComputeState(X, options);
	state_ = std::move(next);
	fitted_ = true;

	REGPIPE_DEBUG("Standardizer fitted on " << X.rows() << " rows x " << X.cols() << " features (with_mean="
	                                        << options.with_mean << ", with_std=" << options.with_std << ")");
	REGPIPE_TIMING_END("Standardizer fit");
	return state_;
}

inline void Standardizer::CheckApplicable(const core::FeatureMatrix &X, const char *operation) const {
	if (!fitted_) {
		throw core::NotFittedError(std::string("Standardizer must be fitted before ") + operation);
	}
	if (static_cast<size_t>(X.cols()) != state_.FeatureCount()) {
		throw core::DimensionMismatchError(std::string("Standardizer ") + operation + " expected " +
		                                   std::to_string(state_.FeatureCount()) + " features, got " +
		                                   std::to_string(X.cols()));
	}
}

inline core::FeatureMatrix Standardizer::Transform(const core::FeatureMatrix &X) const {
	CheckApplicable(X, "transform");

	core::FeatureMatrix Z(X.rows(), X.cols());
	for (Eigen::Index j = 0; j < X.cols(); j++) {
		Z.col(j) = (X.col(j).array() - state_.mean(j)) / state_.scale(j);
	}
	return Z;
}

inline core::FeatureMatrix Standardizer::FitTransform(const core::FeatureMatrix &X,
                                                      const core::ScalerOptions &options) {
	Fit(X, options);
	return Transform(X);
}

inline core::FeatureMatrix Standardizer::InverseTransform(const core::FeatureMatrix &Z) const {
	CheckApplicable(Z, "inverse transform");

	core::FeatureMatrix X(Z.rows(), Z.cols());
	for (Eigen::Index j = 0; j < Z.cols(); j++) {
		X.col(j) = Z.col(j).array() * state_.scale(j) + state_.mean(j);
	}
	return X;
}

inline const core::StandardizerState &Standardizer::State() const {
	if (!fitted_) {
		throw core::NotFittedError("Standardizer has not been fitted");
	}
	return state_;
}

} // namespace preprocessing
} // namespace regpipe
