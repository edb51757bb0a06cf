#pragma once

#include "regpipe/core/feature_matrix.hpp"
#include "regpipe/core/fitted_state.hpp"
#include "regpipe/pipeline/scaled_regression_pipeline.hpp"
#include "regpipe/solvers/linear_regressor.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace regpipe {
namespace serialization {

/// Flat JSON object: string keys mapped to numbers, booleans, number arrays or string arrays
using SerializedRecord = nlohmann::json;

/**
 * @brief Export and import of fitted parameters as flat JSON records
 *
 * The record is the only interchange artifact with the hosting workflow node.
 *
 * Standardizer keys: mean, scale, var, feature_columns, with_mean, with_std, n_samples_seen
 * Regressor keys:    coefficients, intercept, score, feature_columns, fit_intercept, rank, n_samples_seen
 * Pipeline record:   union of both (feature_columns shared, n_samples_seen from the scaler)
 *
 * Every double is stored unrounded, and Dump() writes the shortest text that
 * parses back to the same bits, so export → Dump → Parse → import reproduces
 * the fitted state exactly.
 */
class PipelineSerializer {
public:
	/**
	 * @throws DimensionMismatchError if feature_names.size() != state.FeatureCount()
	 */
	static SerializedRecord ExportStandardizer(const core::StandardizerState &state,
	                                           const std::vector<std::string> &feature_names);

	/**
	 * @param score R² to embed (see ExportScore)
	 * @throws DimensionMismatchError if feature_names.size() != state.FeatureCount()
	 */
	static SerializedRecord ExportRegressor(const core::RegressorState &state,
	                                        const std::vector<std::string> &feature_names, double score);

	/// R² of the fitted regressor on (X, y)
	static double ExportScore(const solvers::LinearRegressor &regressor, const core::FeatureMatrix &X,
	                          const core::TargetVector &y);

	/**
	 * One flat record with both the scaler and the regressor parameters
	 *
	 * @throws NotFittedError if the pipeline is not fitted
	 * @throws DimensionMismatchError on feature name count mismatch
	 */
	static SerializedRecord ExportPipeline(const pipeline::ScaledRegressionPipeline &pipeline,
	                                       const std::vector<std::string> &feature_names, double score);

	/**
	 * Rebuild a StandardizerState
	 *
	 * Honors the flags the way the hosting node applies a record: with_mean=false
	 * forces mean to 0 and with_std=false forces scale to 1, and the corresponding
	 * arrays may then be null.
	 *
	 * @throws SerializationError on a missing key or wrong value type
	 * @throws DimensionMismatchError if array lengths disagree with feature_columns
	 */
	static core::StandardizerState ImportStandardizer(const SerializedRecord &record);

	/**
	 * @throws SerializationError on a missing key or wrong value type
	 * @throws DimensionMismatchError if coefficients and feature_columns differ in length
	 */
	static core::RegressorState ImportRegressor(const SerializedRecord &record);

	static pipeline::ScaledRegressionPipeline ImportPipeline(const SerializedRecord &record);

	static std::vector<std::string> ImportFeatureColumns(const SerializedRecord &record);

	/// Compact JSON text
	static std::string Dump(const SerializedRecord &record);

	/// @throws SerializationError if text is not a JSON object
	static SerializedRecord Parse(const std::string &text);
};

} // namespace serialization
} // namespace regpipe
