#include <catch2/catch.hpp>

#include "regpipe/core/errors.hpp"
#include "regpipe/core/feature_matrix.hpp"
#include "regpipe/core/fitted_state.hpp"
#include "regpipe/core/regression_options.hpp"

using namespace regpipe::core;

TEST_CASE("FeatureMatrixFromRows - shape and values", "[core][matrix]") {
	auto X = FeatureMatrixFromRows({{1, 2}, {3, 4}, {5, 6}});

	REQUIRE(X.rows() == 3);
	REQUIRE(X.cols() == 2);
	REQUIRE(X(0, 0) == 1.0);
	REQUIRE(X(1, 1) == 4.0);
	REQUIRE(X(2, 0) == 5.0);
}

TEST_CASE("FeatureMatrixFromRows - ragged rows are rejected", "[core][matrix]") {
	REQUIRE_THROWS_AS(FeatureMatrixFromRows({{1, 2}, {3}, {5, 6}}), DimensionMismatchError);
	REQUIRE_THROWS_AS(FeatureMatrixFromRows({{1, 2}, {3, 4, 5}}), DimensionMismatchError);
}

TEST_CASE("FeatureMatrixFromRows - empty input gives an empty matrix", "[core][matrix]") {
	auto X = FeatureMatrixFromRows({});
	REQUIRE(X.rows() == 0);
	REQUIRE(X.cols() == 0);
}

TEST_CASE("FeatureMatrixToRows - inverse of FeatureMatrixFromRows", "[core][matrix]") {
	std::vector<std::vector<double>> rows = {{1.5, -2.0, 3.25}, {0.0, 7.0, 1e-3}};
	REQUIRE(FeatureMatrixToRows(FeatureMatrixFromRows(rows)) == rows);
}

TEST_CASE("TargetVectorFromValues", "[core][matrix]") {
	auto y = TargetVectorFromValues({5, 8, 11});
	REQUIRE(y.size() == 3);
	REQUIRE(y(2) == 11.0);
}

TEST_CASE("StandardizerState - feature count", "[core][state]") {
	StandardizerState state;
	REQUIRE(state.FeatureCount() == 0);

	state.mean = Eigen::VectorXd::Zero(3);
	state.scale = Eigen::VectorXd::Ones(3);
	state.variance = Eigen::VectorXd::Ones(3);
	REQUIRE(state.FeatureCount() == 3);
}

TEST_CASE("RegressorState - rank deficiency flag", "[core][state]") {
	RegressorState state;
	state.coefficients = Eigen::VectorXd::Zero(2);

	state.rank = 2;
	REQUIRE_FALSE(state.IsRankDeficient());

	state.rank = 1;
	REQUIRE(state.IsRankDeficient());
}

TEST_CASE("RegressionOptions - defaults and named constructors", "[core][options]") {
	SECTION("Defaults") {
		RegressionOptions opts;
		REQUIRE(opts.fit_intercept);
		REQUIRE(opts.rank_policy == RankDeficiencyPolicy::LEAST_NORM);
		REQUIRE(opts.qr_tolerance == -1.0);
		REQUIRE_NOTHROW(opts.Validate());
	}

	SECTION("OLS without intercept") {
		auto opts = RegressionOptions::OLS(false);
		REQUIRE_FALSE(opts.fit_intercept);
		REQUIRE(opts.rank_policy == RankDeficiencyPolicy::LEAST_NORM);
	}

	SECTION("Strict") {
		auto opts = RegressionOptions::Strict();
		REQUIRE(opts.fit_intercept);
		REQUIRE(opts.rank_policy == RankDeficiencyPolicy::RAISE_ERROR);
	}

	SECTION("Policy names") {
		REQUIRE(RankDeficiencyPolicyName(RankDeficiencyPolicy::LEAST_NORM) == "least_norm");
		REQUIRE(RankDeficiencyPolicyName(RankDeficiencyPolicy::RAISE_ERROR) == "error");
	}
}

TEST_CASE("ScalerOptions - named constructors", "[core][options]") {
	auto standard = ScalerOptions::Standard();
	REQUIRE(standard.with_mean);
	REQUIRE(standard.with_std);

	auto center = ScalerOptions::CenterOnly();
	REQUIRE(center.with_mean);
	REQUIRE_FALSE(center.with_std);

	auto scale = ScalerOptions::ScaleOnly();
	REQUIRE_FALSE(scale.with_mean);
	REQUIRE(scale.with_std);
}

TEST_CASE("Errors - hierarchy", "[core][errors]") {
	SECTION("Input errors are invalid_argument") {
		REQUIRE_THROWS_AS(throw EmptyInputError("x"), std::invalid_argument);
		REQUIRE_THROWS_AS(throw DimensionMismatchError("x"), std::invalid_argument);
		REQUIRE_THROWS_AS(throw InvalidInputError("x"), std::invalid_argument);
	}

	SECTION("State and numeric errors") {
		REQUIRE_THROWS_AS(throw NotFittedError("x"), std::logic_error);
		REQUIRE_THROWS_AS(throw SingularMatrixError("x"), std::runtime_error);
		REQUIRE_THROWS_AS(throw SerializationError("x"), std::runtime_error);
	}

	SECTION("Everything is a RegpipeError") {
		REQUIRE_THROWS_AS(throw SingularMatrixError("x"), RegpipeError);
		REQUIRE_THROWS_AS(throw NotFittedError("x"), RegpipeError);
		REQUIRE_THROWS_AS(throw EmptyInputError("x"), RegpipeError);
	}

	SECTION("Message is preserved") {
		try {
			throw DimensionMismatchError("width 3 != 2");
		} catch (const std::exception &e) {
			REQUIRE(std::string(e.what()) == "width 3 != 2");
		}
	}
}
