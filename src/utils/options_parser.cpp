#include "regpipe/utils/options_parser.hpp"

#include "regpipe/core/errors.hpp"

#include <cctype>
#include <string>

namespace regpipe {
namespace utils {

static std::string ToLower(const std::string &str) {
	std::string result = str;
	for (auto &c : result) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	return result;
}

static void RequireObject(const nlohmann::json &options) {
	if (!options.is_object()) {
		throw core::InvalidInputError("Options must be a JSON object");
	}
}

static bool ExtractBool(const nlohmann::json &val, const std::string &key) {
	if (!val.is_boolean()) {
		throw core::InvalidInputError("Option '" + key + "' must be a boolean");
	}
	return val.get<bool>();
}

static double ExtractDouble(const nlohmann::json &val, const std::string &key) {
	if (!val.is_number()) {
		throw core::InvalidInputError("Option '" + key + "' must be a number");
	}
	return val.get<double>();
}

core::RankDeficiencyPolicy OptionsParser::ParseRankPolicy(const std::string &name) {
	const std::string str = ToLower(name);
	if (str == "least_norm" || str == "pinv") {
		return core::RankDeficiencyPolicy::LEAST_NORM;
	} else if (str == "error" || str == "raise") {
		return core::RankDeficiencyPolicy::RAISE_ERROR;
	}
	throw core::InvalidInputError("Invalid rank_policy: '" + name + "'. Valid values are 'least_norm', 'error'");
}

core::ScalerOptions OptionsParser::ParseScalerOptions(const nlohmann::json &options) {
	core::ScalerOptions opts;
	if (options.is_null()) {
		return opts;
	}
	RequireObject(options);

	for (auto it = options.begin(); it != options.end(); ++it) {
		const std::string key = ToLower(it.key());
		if (key == "with_mean") {
			opts.with_mean = ExtractBool(it.value(), key);
		} else if (key == "with_std") {
			opts.with_std = ExtractBool(it.value(), key);
		} else {
			throw core::InvalidInputError("Unknown scaler option: '" + it.key() +
			                              "'. Valid options are: with_mean, with_std");
		}
	}
	return opts;
}

core::RegressionOptions OptionsParser::ParseRegressionOptions(const nlohmann::json &options) {
	core::RegressionOptions opts;
	if (options.is_null()) {
		return opts;
	}
	RequireObject(options);

	for (auto it = options.begin(); it != options.end(); ++it) {
		const std::string key = ToLower(it.key());
		if (key == "fit_intercept") {
			opts.fit_intercept = ExtractBool(it.value(), key);
		} else if (key == "rank_policy") {
			if (!it.value().is_string()) {
				throw core::InvalidInputError("Option 'rank_policy' must be a string");
			}
			opts.rank_policy = ParseRankPolicy(it.value().get<std::string>());
		} else if (key == "qr_tolerance") {
			opts.qr_tolerance = ExtractDouble(it.value(), key);
		} else {
			throw core::InvalidInputError("Unknown regression option: '" + it.key() +
			                              "'. Valid options are: fit_intercept, rank_policy, qr_tolerance");
		}
	}

	opts.Validate();
	return opts;
}

} // namespace utils
} // namespace regpipe
