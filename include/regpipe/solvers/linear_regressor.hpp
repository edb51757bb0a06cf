#pragma once

#include "regpipe/core/errors.hpp"
#include "regpipe/core/feature_matrix.hpp"
#include "regpipe/core/fitted_state.hpp"
#include "regpipe/core/regression_options.hpp"
#include "regpipe/utils/tracing.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <utility>

namespace regpipe {
namespace solvers {

/**
 * Ordinary Least Squares linear regressor
 *
 * Minimizes ||y - X*beta - b||^2. The intercept is handled by centering the
 * data, never by augmenting the design matrix:
 * 1. Center X and y on their column means (only when fit_intercept)
 * 2. Complete orthogonal decomposition of the centered X: X*P = Q*[T 0]*Z
 * 3. Numerical rank from the pivoted QR diagonal
 * 4. Minimum-norm least-squares solve
 * 5. intercept = mean(y) - beta . mean(X)
 *
 * For a full-rank X the result is the unique OLS solution. For a rank-deficient
 * X (duplicate, collinear or constant columns) the policy in RegressionOptions
 * decides: LEAST_NORM returns the minimum-norm solution, RAISE_ERROR throws
 * SingularMatrixError.
 *
 * Not safe to Fit concurrently with any other call on the same instance.
 */
class LinearRegressor {
public:
	LinearRegressor() = default;

	/**
	 * Rebuild a fitted regressor from a previously exported state
	 *
	 * @throws InvalidInputError if the state has no features or non-finite values
	 */
	static LinearRegressor FromState(const core::RegressorState &state);

	/**
	 * Fit coefficients and intercept; replaces the current state on success only
	 *
	 * @param X Design matrix (n × p)
	 * @param y Response vector (length n)
	 * @param options fit_intercept, rank policy and rank tolerance
	 * @return Reference to the state now held by the instance
	 * @throws EmptyInputError on zero rows or zero columns
	 * @throws DimensionMismatchError if y.size() != X.rows()
	 * @throws InvalidInputError on NaN/Inf input or invalid options
	 * @throws SingularMatrixError if X is rank deficient under RAISE_ERROR
	 */
	const core::RegressorState &Fit(const core::FeatureMatrix &X, const core::TargetVector &y,
	                                const core::RegressionOptions &options = core::RegressionOptions::OLS());

	/**
	 * Per row: coefficients . row + intercept
	 *
	 * @throws NotFittedError before Fit
	 * @throws DimensionMismatchError on width mismatch
	 */
	Eigen::VectorXd Predict(const core::FeatureMatrix &X) const;

	/**
	 * Coefficient of determination of Predict(X) against y
	 *
	 * @throws NotFittedError, DimensionMismatchError, EmptyInputError
	 */
	double Score(const core::FeatureMatrix &X, const core::TargetVector &y) const;

	bool IsFitted() const {
		return fitted_;
	}

	/// @throws NotFittedError before Fit
	const core::RegressorState &State() const;

	size_t FeatureCount() const {
		return fitted_ ? state_.FeatureCount() : 0;
	}

	/**
	 * Stateless solve behind Fit
	 *
	 * @return RegressorState with coefficients (excluding intercept), intercept and rank
	 */
	static core::RegressorState Solve(const core::FeatureMatrix &X, const core::TargetVector &y,
	                                  const core::RegressionOptions &options);

	/**
	 * R² = 1 - SS_res / SS_tot
	 *
	 * Special cases when the target has zero variance (SS_tot == 0):
	 * - SS_res == 0: exactly 1.0 (perfect fit of a constant)
	 * - SS_res > 0:  0.0
	 * Not clamped: predictions worse than the mean give a negative value.
	 */
	static double RSquared(const Eigen::VectorXd &y, const Eigen::VectorXd &y_pred);

private:
	core::RegressorState state_;
	bool fitted_ = false;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::RegressorState LinearRegressor::Solve(const core::FeatureMatrix &X, const core::TargetVector &y,
                                                   const core::RegressionOptions &options) {
	const auto n = X.rows();
	const auto p = X.cols();

	if (n == 0) {
		throw core::EmptyInputError("LinearRegressor fit requires at least one row");
	}
	if (p == 0) {
		throw core::EmptyInputError("LinearRegressor fit requires at least one feature column");
	}
	if (y.size() != n) {
		throw core::DimensionMismatchError("Target length " + std::to_string(y.size()) +
		                                   " does not match row count " + std::to_string(n));
	}
	options.Validate();
	core::ValidateFinite(X, "feature matrix");
	core::ValidateFinite(y, "target vector");

	Eigen::MatrixXd X_work;
	Eigen::VectorXd y_work;
	Eigen::VectorXd x_means;
	double y_mean = 0.0;

	if (options.fit_intercept) {
		y_mean = y.mean();
		x_means = X.colwise().mean().transpose();
		y_work = y.array() - y_mean;
		X_work = X.rowwise() - x_means.transpose();
	} else {
		X_work = X;
		y_work = y;
		x_means = Eigen::VectorXd::Zero(p);
	}

	Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cod;
	if (options.qr_tolerance > 0.0) {
		cod.setThreshold(options.qr_tolerance);
	}
	cod.compute(X_work);

	core::RegressorState state;
	state.fit_intercept = options.fit_intercept;
	state.n_samples_seen = static_cast<size_t>(n);
	state.rank = static_cast<size_t>(cod.rank());

	if (state.rank < static_cast<size_t>(p)) {
		if (options.rank_policy == core::RankDeficiencyPolicy::RAISE_ERROR) {
			throw core::SingularMatrixError("Design matrix is rank deficient (rank " + std::to_string(state.rank) +
			                                " < " + std::to_string(p) + " features)");
		}
		REGPIPE_DEBUG("Rank-deficient design (rank " << state.rank << " of " << p
		                                             << "); using minimum-norm solution");
	}

	if (state.rank == 0) {
		// Every column is constant (after centering) or zero: nothing to explain
		state.coefficients = Eigen::VectorXd::Zero(p);
	} else {
		state.coefficients = cod.solve(y_work);
	}

	if (options.fit_intercept) {
		state.intercept = y_mean - state.coefficients.dot(x_means);
	} else {
		state.intercept = 0.0;
	}

	return state;
}

inline LinearRegressor LinearRegressor::FromState(const core::RegressorState &state) {
	if (state.coefficients.size() == 0) {
		throw core::InvalidInputError("Regressor state has no coefficients");
	}
	for (Eigen::Index j = 0; j < state.coefficients.size(); j++) {
		if (!std::isfinite(state.coefficients(j))) {
			throw core::InvalidInputError("Regressor state has non-finite coefficient for feature " +
			                              std::to_string(j));
		}
	}
	if (!std::isfinite(state.intercept)) {
		throw core::InvalidInputError("Regressor state has non-finite intercept");
	}
	if (!state.fit_intercept && state.intercept != 0.0) {
		throw core::InvalidInputError("Regressor state without intercept must have intercept 0");
	}

	LinearRegressor regressor;
	regressor.state_ = state;
	regressor.fitted_ = true;
	return regressor;
}

inline const core::RegressorState &LinearRegressor::Fit(const core::FeatureMatrix &X, const core::TargetVector &y,
                                                        const core::RegressionOptions &options) {
	REGPIPE_TIMING_START();

	core::RegressorState next = Solve(X, y, options);
	state_ = std::move(next);
	fitted_ = true;

	REGPIPE_DEBUG("LinearRegressor fitted on " << X.rows() << " rows x " << X.cols() << " features (rank "
	                                           << state_.rank << ", fit_intercept=" << options.fit_intercept << ")");
	REGPIPE_TIMING_END("LinearRegressor fit");
	return state_;
}

inline Eigen::VectorXd LinearRegressor::Predict(const core::FeatureMatrix &X) const {
	if (!fitted_) {
		throw core::NotFittedError("LinearRegressor must be fitted before predict");
	}
	if (static_cast<size_t>(X.cols()) != state_.FeatureCount()) {
		throw core::DimensionMismatchError("LinearRegressor predict expected " +
		                                   std::to_string(state_.FeatureCount()) + " features, got " +
		                                   std::to_string(X.cols()));
	}

	Eigen::VectorXd y_pred = X * state_.coefficients;
	y_pred.array() += state_.intercept;
	return y_pred;
}

inline double LinearRegressor::Score(const core::FeatureMatrix &X, const core::TargetVector &y) const {
	if (!fitted_) {
		throw core::NotFittedError("LinearRegressor must be fitted before score");
	}
	if (X.rows() == 0) {
		throw core::EmptyInputError("Score requires at least one row");
	}
	if (y.size() != X.rows()) {
		throw core::DimensionMismatchError("Target length " + std::to_string(y.size()) +
		                                   " does not match row count " + std::to_string(X.rows()));
	}
	return RSquared(y, Predict(X));
}

inline double LinearRegressor::RSquared(const Eigen::VectorXd &y, const Eigen::VectorXd &y_pred) {
	const double ss_res = (y - y_pred).squaredNorm();
	const double y_mean = y.mean();
	const double ss_tot = (y.array() - y_mean).square().sum();

	if (ss_tot == 0.0) {
		return ss_res == 0.0 ? 1.0 : 0.0;
	}
	return 1.0 - ss_res / ss_tot;
}

inline const core::RegressorState &LinearRegressor::State() const {
	if (!fitted_) {
		throw core::NotFittedError("LinearRegressor has not been fitted");
	}
	return state_;
}

} // namespace solvers
} // namespace regpipe
