#include "regpipe/serialization/pipeline_serializer.hpp"

#include "regpipe/core/errors.hpp"
#include "regpipe/utils/tracing.hpp"

#include <cstdint>
#include <initializer_list>
#include <utility>

namespace regpipe {
namespace serialization {

namespace {

const char *const kMean = "mean";
const char *const kScale = "scale";
const char *const kVar = "var";
const char *const kFeatureColumns = "feature_columns";
const char *const kWithMean = "with_mean";
const char *const kWithStd = "with_std";
const char *const kCoefficients = "coefficients";
const char *const kIntercept = "intercept";
const char *const kScore = "score";
const char *const kFitIntercept = "fit_intercept";
const char *const kRank = "rank";
const char *const kSamplesSeen = "n_samples_seen";

nlohmann::json ToJsonArray(const Eigen::VectorXd &v) {
	nlohmann::json arr = nlohmann::json::array();
	for (Eigen::Index i = 0; i < v.size(); i++) {
		arr.push_back(v(i));
	}
	return arr;
}

void CheckNameCount(size_t feature_count, const std::vector<std::string> &feature_names, const char *what) {
	if (feature_names.size() != feature_count) {
		throw core::DimensionMismatchError(std::string(what) + " has " + std::to_string(feature_count) +
		                                   " features but " + std::to_string(feature_names.size()) +
		                                   " feature names were given");
	}
}

const nlohmann::json &RequireKey(const SerializedRecord &record, const char *key) {
	if (!record.is_object()) {
		throw core::SerializationError("Record must be a JSON object");
	}
	auto it = record.find(key);
	if (it == record.end()) {
		throw core::SerializationError(std::string("Record is missing required key '") + key + "'");
	}
	return *it;
}

bool ReadBool(const SerializedRecord &record, const char *key) {
	const auto &value = RequireKey(record, key);
	if (!value.is_boolean()) {
		throw core::SerializationError(std::string("Key '") + key + "' must be a boolean");
	}
	return value.get<bool>();
}

double ReadNumber(const SerializedRecord &record, const char *key) {
	const auto &value = RequireKey(record, key);
	if (!value.is_number()) {
		throw core::SerializationError(std::string("Key '") + key + "' must be a number");
	}
	return value.get<double>();
}

Eigen::VectorXd ReadNumberArray(const nlohmann::json &value, const char *key) {
	if (!value.is_array()) {
		throw core::SerializationError(std::string("Key '") + key + "' must be an array of numbers");
	}
	Eigen::VectorXd v(static_cast<Eigen::Index>(value.size()));
	for (size_t i = 0; i < value.size(); i++) {
		if (!value[i].is_number()) {
			throw core::SerializationError(std::string("Key '") + key + "' element " + std::to_string(i) +
			                               " is not a number");
		}
		v(static_cast<Eigen::Index>(i)) = value[i].get<double>();
	}
	return v;
}

Eigen::VectorXd ReadSizedArray(const nlohmann::json &value, const char *key, size_t expected) {
	Eigen::VectorXd v = ReadNumberArray(value, key);
	if (static_cast<size_t>(v.size()) != expected) {
		throw core::DimensionMismatchError(std::string("Key '") + key + "' has " + std::to_string(v.size()) +
		                                   " values, expected " + std::to_string(expected));
	}
	return v;
}

// Optional non-negative count; absent or null yields the fallback
size_t ReadCountOr(const SerializedRecord &record, const char *key, size_t fallback) {
	auto it = record.find(key);
	if (it == record.end() || it->is_null()) {
		return fallback;
	}
	if (!it->is_number_integer() || it->get<int64_t>() < 0) {
		throw core::SerializationError(std::string("Key '") + key + "' must be a non-negative integer");
	}
	return it->get<size_t>();
}

} // namespace

SerializedRecord PipelineSerializer::ExportStandardizer(const core::StandardizerState &state,
                                                        const std::vector<std::string> &feature_names) {
	CheckNameCount(state.FeatureCount(), feature_names, "Standardizer");

	SerializedRecord record = SerializedRecord::object();
	record[kMean] = ToJsonArray(state.mean);
	record[kScale] = ToJsonArray(state.scale);
	record[kVar] = ToJsonArray(state.variance);
	record[kFeatureColumns] = feature_names;
	record[kWithMean] = state.with_mean;
	record[kWithStd] = state.with_std;
	record[kSamplesSeen] = state.n_samples_seen;
	return record;
}

SerializedRecord PipelineSerializer::ExportRegressor(const core::RegressorState &state,
                                                     const std::vector<std::string> &feature_names, double score) {
	CheckNameCount(state.FeatureCount(), feature_names, "Regressor");

	SerializedRecord record = SerializedRecord::object();
	record[kCoefficients] = ToJsonArray(state.coefficients);
	record[kIntercept] = state.intercept;
	record[kScore] = score;
	record[kFeatureColumns] = feature_names;
	record[kFitIntercept] = state.fit_intercept;
	record[kRank] = state.rank;
	record[kSamplesSeen] = state.n_samples_seen;
	return record;
}

double PipelineSerializer::ExportScore(const solvers::LinearRegressor &regressor, const core::FeatureMatrix &X,
                                       const core::TargetVector &y) {
	return regressor.Score(X, y);
}

SerializedRecord PipelineSerializer::ExportPipeline(const pipeline::ScaledRegressionPipeline &pipeline,
                                                    const std::vector<std::string> &feature_names, double score) {
	if (!pipeline.IsFitted()) {
		throw core::NotFittedError("Pipeline must be fitted before export");
	}

	SerializedRecord record = ExportStandardizer(pipeline.GetStandardizer().State(), feature_names);
	SerializedRecord model = ExportRegressor(pipeline.GetRegressor().State(), feature_names, score);
	for (const char *key : {kCoefficients, kIntercept, kScore, kFitIntercept, kRank}) {
		record[key] = model[key];
	}
	return record;
}

std::vector<std::string> PipelineSerializer::ImportFeatureColumns(const SerializedRecord &record) {
	const auto &value = RequireKey(record, kFeatureColumns);
	if (!value.is_array()) {
		throw core::SerializationError("Key 'feature_columns' must be an array of strings");
	}

	std::vector<std::string> names;
	names.reserve(value.size());
	for (const auto &item : value) {
		if (!item.is_string()) {
			throw core::SerializationError("Key 'feature_columns' must contain only strings");
		}
		names.push_back(item.get<std::string>());
	}
	return names;
}

core::StandardizerState PipelineSerializer::ImportStandardizer(const SerializedRecord &record) {
	const auto names = ImportFeatureColumns(record);
	const size_t p = names.size();
	const auto n = static_cast<Eigen::Index>(p);

	core::StandardizerState state;
	state.with_mean = ReadBool(record, kWithMean);
	state.with_std = ReadBool(record, kWithStd);

	const auto &mean = RequireKey(record, kMean);
	if (state.with_mean) {
		state.mean = ReadSizedArray(mean, kMean, p);
	} else {
		// The node ignores the stored mean when centering was off
		if (!mean.is_null()) {
			ReadSizedArray(mean, kMean, p);
		}
		state.mean = Eigen::VectorXd::Zero(n);
	}

	const auto &scale = RequireKey(record, kScale);
	const auto &var = RequireKey(record, kVar);
	if (state.with_std) {
		state.scale = ReadSizedArray(scale, kScale, p);
		state.variance = ReadSizedArray(var, kVar, p);
	} else {
		state.scale = Eigen::VectorXd::Ones(n);
		if (var.is_null()) {
			state.variance = Eigen::VectorXd::Ones(n);
		} else {
			state.variance = ReadSizedArray(var, kVar, p);
		}
	}

	state.n_samples_seen = ReadCountOr(record, kSamplesSeen, 0);

	REGPIPE_DEBUG("Imported standardizer with " << p << " features");
	return state;
}

core::RegressorState PipelineSerializer::ImportRegressor(const SerializedRecord &record) {
	const auto names = ImportFeatureColumns(record);

	core::RegressorState state;
	state.coefficients = ReadSizedArray(RequireKey(record, kCoefficients), kCoefficients, names.size());
	state.intercept = ReadNumber(record, kIntercept);
	state.fit_intercept = ReadBool(record, kFitIntercept);
	state.rank = ReadCountOr(record, kRank, names.size());
	state.n_samples_seen = ReadCountOr(record, kSamplesSeen, 0);

	REGPIPE_DEBUG("Imported regressor with " << names.size() << " coefficients");
	return state;
}

pipeline::ScaledRegressionPipeline PipelineSerializer::ImportPipeline(const SerializedRecord &record) {
	auto standardizer = preprocessing::Standardizer::FromState(ImportStandardizer(record));
	auto regressor = solvers::LinearRegressor::FromState(ImportRegressor(record));
	return pipeline::ScaledRegressionPipeline::FromComponents(std::move(standardizer), std::move(regressor));
}

std::string PipelineSerializer::Dump(const SerializedRecord &record) {
	return record.dump();
}

SerializedRecord PipelineSerializer::Parse(const std::string &text) {
	SerializedRecord record;
	try {
		record = SerializedRecord::parse(text);
	} catch (const nlohmann::json::parse_error &e) {
		throw core::SerializationError(std::string("Invalid record JSON: ") + e.what());
	}
	if (!record.is_object()) {
		throw core::SerializationError("Record must be a JSON object");
	}
	return record;
}

} // namespace serialization
} // namespace regpipe
