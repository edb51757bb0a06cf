#pragma once

#include "regpipe/core/errors.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <vector>

namespace regpipe {
namespace core {

/// Samples in rows, features in columns
using FeatureMatrix = Eigen::MatrixXd;

/// One target value per sample
using TargetVector = Eigen::VectorXd;

/**
 * Build a FeatureMatrix from row-major nested vectors
 *
 * @param rows One inner vector per sample; all must have the same width
 * @return Matrix with rows.size() rows and rows[0].size() columns
 * @throws DimensionMismatchError if any row width differs from the first
 */
inline FeatureMatrix FeatureMatrixFromRows(const std::vector<std::vector<double>> &rows) {
	if (rows.empty()) {
		return FeatureMatrix(0, 0);
	}

	const size_t width = rows[0].size();
	FeatureMatrix X(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(width));

	for (size_t i = 0; i < rows.size(); i++) {
		if (rows[i].size() != width) {
			throw DimensionMismatchError("Row " + std::to_string(i) + " has " + std::to_string(rows[i].size()) +
			                             " values, expected " + std::to_string(width));
		}
		for (size_t j = 0; j < width; j++) {
			X(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows[i][j];
		}
	}

	return X;
}

inline TargetVector TargetVectorFromValues(const std::vector<double> &values) {
	TargetVector y(static_cast<Eigen::Index>(values.size()));
	for (size_t i = 0; i < values.size(); i++) {
		y(static_cast<Eigen::Index>(i)) = values[i];
	}
	return y;
}

/// Convert back to row-major nested vectors (for handing results to callers without Eigen)
inline std::vector<std::vector<double>> FeatureMatrixToRows(const FeatureMatrix &X) {
	std::vector<std::vector<double>> rows(static_cast<size_t>(X.rows()));
	for (Eigen::Index i = 0; i < X.rows(); i++) {
		rows[static_cast<size_t>(i)].reserve(static_cast<size_t>(X.cols()));
		for (Eigen::Index j = 0; j < X.cols(); j++) {
			rows[static_cast<size_t>(i)].push_back(X(i, j));
		}
	}
	return rows;
}

/**
 * Reject NaN and infinite values
 *
 * @param X Matrix to check
 * @param what Name used in the error message
 * @throws InvalidInputError on the first non-finite value
 */
inline void ValidateFinite(const FeatureMatrix &X, const std::string &what) {
	for (Eigen::Index j = 0; j < X.cols(); j++) {
		for (Eigen::Index i = 0; i < X.rows(); i++) {
			if (!std::isfinite(X(i, j))) {
				throw InvalidInputError("Non-finite value in " + what + " at row " + std::to_string(i) + ", column " +
				                        std::to_string(j));
			}
		}
	}
}

inline void ValidateFinite(const TargetVector &y, const std::string &what) {
	for (Eigen::Index i = 0; i < y.size(); i++) {
		if (!std::isfinite(y(i))) {
			throw InvalidInputError("Non-finite value in " + what + " at row " + std::to_string(i));
		}
	}
}

} // namespace core
} // namespace regpipe
