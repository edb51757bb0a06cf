#pragma once

#include "regpipe/core/regression_options.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace regpipe {
namespace utils {

/**
 * Parse component options from the JSON object supplied by the hosting node
 *
 * Keys are matched case-insensitively. A null or absent object yields the
 * defaults.
 *
 * Scaler keys:     with_mean (bool), with_std (bool)
 * Regressor keys:  fit_intercept (bool), rank_policy ("least_norm" | "error"),
 *                  qr_tolerance (number)
 *
 * @throws InvalidInputError for unknown keys, wrong value types or invalid values
 */
class OptionsParser {
public:
	static core::ScalerOptions ParseScalerOptions(const nlohmann::json &options);

	static core::RegressionOptions ParseRegressionOptions(const nlohmann::json &options);

	static core::RankDeficiencyPolicy ParseRankPolicy(const std::string &name);
};

} // namespace utils
} // namespace regpipe
