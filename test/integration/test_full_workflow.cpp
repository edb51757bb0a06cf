#include <catch2/catch.hpp>

#include "regpipe/core/errors.hpp"
#include "regpipe/core/feature_matrix.hpp"
#include "regpipe/pipeline/scaled_regression_pipeline.hpp"
#include "regpipe/serialization/pipeline_serializer.hpp"
#include "regpipe/utils/options_parser.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace regpipe;
using namespace regpipe::core;
using regpipe::pipeline::ScaledRegressionPipeline;
using regpipe::preprocessing::Standardizer;
using regpipe::serialization::PipelineSerializer;
using regpipe::solvers::LinearRegressor;
using regpipe::utils::OptionsParser;
using Catch::Matchers::WithinAbs;

const double TOLERANCE = 1e-9;

/**
 * Study hours and previous score against final score:
 * final = 5 * hours + 0.5 * previous + noise
 */
static void StudyData(Eigen::MatrixXd &X, Eigen::VectorXd &y) {
	const double hours[] = {1, 2, 3, 4, 5, 6, 7, 8};
	const double previous[] = {50, 62, 58, 71, 80, 77, 88, 85};
	const double noise[] = {1.0, -2.0, 0.5, 1.5, -1.0, 2.0, -0.5, -1.5};

	X.resize(8, 2);
	y.resize(8);
	for (Eigen::Index i = 0; i < 8; i++) {
		X(i, 0) = hours[i];
		X(i, 1) = previous[i];
		y(i) = 5.0 * hours[i] + 0.5 * previous[i] + noise[i];
	}
}

TEST_CASE("Workflow: scale, fit and predict a new row", "[integration]") {
	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	StudyData(X, y);

	Standardizer scaler;
	auto X_scaled = scaler.FitTransform(X);

	LinearRegressor model;
	model.Fit(X_scaled, y);

	const double score = model.Score(X_scaled, y);
	REQUIRE(score > 0.0);
	REQUIRE(score < 1.0);
	REQUIRE(score > 0.9);

	Eigen::MatrixXd X_new(1, 2);
	X_new << 4.5, 75;
	const double prediction = model.Predict(scaler.Transform(X_new))(0);
	// Close to the noiseless relation 5 * 4.5 + 0.5 * 75
	REQUIRE_THAT(prediction, WithinAbs(60.0, 3.0));

	// Same numbers through the pipeline
	ScaledRegressionPipeline pipeline;
	pipeline.Fit(X, y);
	REQUIRE(pipeline.Predict(X_new)(0) == prediction);
	REQUIRE(pipeline.Score(X, y) == score);
}

TEST_CASE("Workflow: repeated runs are bit-identical", "[integration][determinism]") {
	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	StudyData(X, y);

	const std::vector<std::string> columns = {"hours", "previous_score"};
	std::string first_text;
	Eigen::VectorXd first_prediction;

	for (int run = 0; run < 3; run++) {
		ScaledRegressionPipeline pipeline;
		pipeline.Fit(X, y);
		const double score = pipeline.Score(X, y);
		const std::string text = PipelineSerializer::Dump(PipelineSerializer::ExportPipeline(pipeline, columns, score));
		const Eigen::VectorXd prediction = pipeline.Predict(X);

		if (run == 0) {
			first_text = text;
			first_prediction = prediction;
		} else {
			REQUIRE(text == first_text);
			REQUIRE(prediction == first_prediction);
		}
	}
}

TEST_CASE("Workflow: collinear features reproduce the target", "[integration][rank]") {
	auto X = FeatureMatrixFromRows({{1, 2}, {2, 3}, {3, 4}, {4, 5}, {5, 6}});
	auto y = TargetVectorFromValues({5, 8, 11, 14, 17});

	LinearRegressor model;
	model.Fit(X, y);

	REQUIRE_THAT(model.Score(X, y), WithinAbs(1.0, TOLERANCE));
	REQUIRE_THAT(model.Predict(FeatureMatrixFromRows({{3, 4}}))(0), WithinAbs(11.0, TOLERANCE));

	auto record = PipelineSerializer::ExportRegressor(model.State(), {"x0", "x1"}, model.Score(X, y));
	auto rebuilt = LinearRegressor::FromState(PipelineSerializer::ImportRegressor(
	    PipelineSerializer::Parse(PipelineSerializer::Dump(record))));
	REQUIRE(rebuilt.Predict(X) == model.Predict(X));
}

TEST_CASE("Workflow: applicant scaler exported and re-applied", "[integration][serialization]") {
	auto X = FeatureMatrixFromRows({{25, 50000, 85}, {35, 75000, 92}, {45, 95000, 98}, {22, 30000, 78}, {28, 40000, 82}});

	Standardizer scaler;
	scaler.Fit(X);
	REQUIRE_THAT(scaler.State().mean(0), WithinAbs(31.0, TOLERANCE));
	REQUIRE_THAT(scaler.State().mean(1), WithinAbs(58000.0, 1e-6));
	REQUIRE_THAT(scaler.State().mean(2), WithinAbs(87.0, TOLERANCE));

	const std::string text = PipelineSerializer::Dump(
	    PipelineSerializer::ExportStandardizer(scaler.State(), {"age", "income", "score"}));
	auto applied = Standardizer::FromState(PipelineSerializer::ImportStandardizer(PipelineSerializer::Parse(text)));

	auto Z = applied.Transform(X);
	REQUIRE(Z(0, 0) < 0.0);
	REQUIRE(Z == scaler.Transform(X));

	auto rows = FeatureMatrixToRows(applied.InverseTransform(Z));
	REQUIRE(rows.size() == 5);
	REQUIRE_THAT(rows[2][1], WithinAbs(95000.0, 1e-6));
}

TEST_CASE("Workflow: options from a JSON config drive the fit", "[integration][options]") {
	const auto config = nlohmann::json::parse(R"({
		"scaler": {"with_mean": true, "with_std": false},
		"regression": {"fit_intercept": true, "rank_policy": "error"}
	})");

	auto scaler_options = OptionsParser::ParseScalerOptions(config["scaler"]);
	auto regression_options = OptionsParser::ParseRegressionOptions(config["regression"]);

	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	StudyData(X, y);

	ScaledRegressionPipeline pipeline;
	pipeline.Fit(X, y, scaler_options, regression_options);
	REQUIRE(pipeline.GetStandardizer().State().scale == Eigen::VectorXd::Ones(2));

	// Centering only: coefficients are in raw units
	const auto &coefficients = pipeline.GetRegressor().State().coefficients;
	REQUIRE_THAT(coefficients(0), WithinAbs(5.0, 1.5));
	REQUIRE_THAT(coefficients(1), WithinAbs(0.5, 0.25));

	auto collinear = FeatureMatrixFromRows({{1, 2}, {2, 3}, {3, 4}, {4, 5}, {5, 6}});
	auto target = TargetVectorFromValues({5, 8, 11, 14, 17});
	REQUIRE_THROWS_AS(pipeline.Fit(collinear, target, scaler_options, regression_options), SingularMatrixError);
	// Previous fit is still in place
	REQUIRE(pipeline.GetRegressor().State().n_samples_seen == 8);
}

TEST_CASE("Workflow: pipeline errors", "[integration][errors]") {
	Eigen::MatrixXd X;
	Eigen::VectorXd y;
	StudyData(X, y);

	SECTION("Unfitted pipeline") {
		ScaledRegressionPipeline pipeline;
		REQUIRE_FALSE(pipeline.IsFitted());
		REQUIRE_THROWS_AS(pipeline.Predict(X), NotFittedError);
		REQUIRE_THROWS_AS(pipeline.Transform(X), NotFittedError);
		REQUIRE_THROWS_AS(pipeline.Score(X, y), NotFittedError);
	}

	SECTION("Empty input") {
		ScaledRegressionPipeline pipeline;
		REQUIRE_THROWS_AS(pipeline.Fit(Eigen::MatrixXd(0, 2), Eigen::VectorXd(0)), EmptyInputError);
	}

	SECTION("Target length mismatch") {
		ScaledRegressionPipeline pipeline;
		REQUIRE_THROWS_AS(pipeline.Fit(X, Eigen::VectorXd::Zero(3)), DimensionMismatchError);
		REQUIRE_FALSE(pipeline.IsFitted());
	}

	SECTION("Width mismatch on predict") {
		ScaledRegressionPipeline pipeline;
		pipeline.Fit(X, y);
		REQUIRE_THROWS_AS(pipeline.Predict(Eigen::MatrixXd::Zero(1, 3)), DimensionMismatchError);
	}

	SECTION("Components with different widths") {
		Standardizer scaler;
		scaler.Fit(Eigen::MatrixXd::Random(4, 3));
		LinearRegressor model;
		model.Fit(X, y);
		REQUIRE_THROWS_AS(ScaledRegressionPipeline::FromComponents(scaler, model), DimensionMismatchError);
		REQUIRE_THROWS_AS(ScaledRegressionPipeline::FromComponents(Standardizer(), model), NotFittedError);
	}

	SECTION("Every error is a RegpipeError") {
		ScaledRegressionPipeline pipeline;
		bool caught = false;
		try {
			pipeline.Predict(X);
		} catch (const RegpipeError &) {
			caught = true;
		}
		REQUIRE(caught);
	}
}
