#pragma once

#include "regpipe/core/errors.hpp"
#include "regpipe/core/feature_matrix.hpp"
#include "regpipe/core/regression_options.hpp"
#include "regpipe/preprocessing/standardizer.hpp"
#include "regpipe/solvers/linear_regressor.hpp"
#include "regpipe/utils/tracing.hpp"
#include <string>
#include <utility>

namespace regpipe {
namespace pipeline {

/**
 * Standardizer followed by LinearRegressor
 *
 * Fit standardizes the raw features, then fits the regressor on the
 * standardized matrix. Predict and Score take RAW features and apply the
 * fitted standardization first. Both components are replaced together, and
 * only when both fits succeed.
 */
class ScaledRegressionPipeline {
public:
	ScaledRegressionPipeline() = default;

	/**
	 * Assemble a fitted pipeline from already fitted components
	 *
	 * @throws NotFittedError if either component is unfitted
	 * @throws DimensionMismatchError if their feature counts differ
	 */
	static ScaledRegressionPipeline FromComponents(preprocessing::Standardizer standardizer,
	                                               solvers::LinearRegressor regressor);

	void Fit(const core::FeatureMatrix &X, const core::TargetVector &y,
	         const core::ScalerOptions &scaler_options = core::ScalerOptions(),
	         const core::RegressionOptions &regression_options = core::RegressionOptions::OLS());

	/// Standardize raw features with the fitted scaler
	core::FeatureMatrix Transform(const core::FeatureMatrix &X) const;

	Eigen::VectorXd Predict(const core::FeatureMatrix &X) const;

	double Score(const core::FeatureMatrix &X, const core::TargetVector &y) const;

	bool IsFitted() const {
		return standardizer_.IsFitted() && regressor_.IsFitted();
	}

	const preprocessing::Standardizer &GetStandardizer() const {
		return standardizer_;
	}

	const solvers::LinearRegressor &GetRegressor() const {
		return regressor_;
	}

private:
	void CheckFitted(const char *operation) const;

	preprocessing::Standardizer standardizer_;
	solvers::LinearRegressor regressor_;
};

inline ScaledRegressionPipeline ScaledRegressionPipeline::FromComponents(preprocessing::Standardizer standardizer,
                                                                         solvers::LinearRegressor regressor) {
	if (!standardizer.IsFitted() || !regressor.IsFitted()) {
		throw core::NotFittedError("Pipeline components must both be fitted");
	}
	if (standardizer.FeatureCount() != regressor.FeatureCount()) {
		throw core::DimensionMismatchError("Standardizer has " + std::to_string(standardizer.FeatureCount()) +
		                                   " features but regressor has " +
		                                   std::to_string(regressor.FeatureCount()));
	}

	ScaledRegressionPipeline pipeline;
	pipeline.standardizer_ = std::move(standardizer);
	pipeline.regressor_ = std::move(regressor);
	return pipeline;
}

inline void ScaledRegressionPipeline::Fit(const core::FeatureMatrix &X, const core::TargetVector &y,
                                          const core::ScalerOptions &scaler_options,
                                          const core::RegressionOptions &regression_options) {
	// Fit on fresh components and swap in at the end
	preprocessing::Standardizer standardizer;
	solvers::LinearRegressor regressor;

	const core::FeatureMatrix X_scaled = standardizer.FitTransform(X, scaler_options);
	regressor.Fit(X_scaled, y, regression_options);

	standardizer_ = std::move(standardizer);
	regressor_ = std::move(regressor);

	REGPIPE_INFO("Pipeline fitted on " << X.rows() << " rows x " << X.cols() << " features");
}

inline void ScaledRegressionPipeline::CheckFitted(const char *operation) const {
	if (!IsFitted()) {
		throw core::NotFittedError(std::string("Pipeline must be fitted before ") + operation);
	}
}

inline core::FeatureMatrix ScaledRegressionPipeline::Transform(const core::FeatureMatrix &X) const {
	CheckFitted("transform");
	return standardizer_.Transform(X);
}

inline Eigen::VectorXd ScaledRegressionPipeline::Predict(const core::FeatureMatrix &X) const {
	CheckFitted("predict");
	return regressor_.Predict(standardizer_.Transform(X));
}

inline double ScaledRegressionPipeline::Score(const core::FeatureMatrix &X, const core::TargetVector &y) const {
	CheckFitted("score");
	return regressor_.Score(standardizer_.Transform(X), y);
}

} // namespace pipeline
} // namespace regpipe
