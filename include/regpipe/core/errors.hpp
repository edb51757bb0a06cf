#pragma once

#include <stdexcept>
#include <string>

namespace regpipe {
namespace core {

/**
 * Error taxonomy for fitting, applying and serializing models
 *
 * Every error raised by regpipe derives from RegpipeError so callers can catch
 * the whole family at once, and from one of the standard exception classes so
 * code that only knows <stdexcept> keeps working:
 * - Input problems (empty, mismatched, non-finite) are std::invalid_argument
 * - Calling transform/predict on an unfitted component is std::logic_error
 * - Numerical failures and malformed records are std::runtime_error
 *
 * A failing call never leaves a component with a partially updated state.
 */
class RegpipeError {
public:
	virtual ~RegpipeError() = default;
};

/// Zero rows (or zero feature columns) passed to a fit
class EmptyInputError : public std::invalid_argument, public RegpipeError {
public:
	explicit EmptyInputError(const std::string &msg) : std::invalid_argument(msg) {
	}
};

/// Width, length or feature-name count does not match
class DimensionMismatchError : public std::invalid_argument, public RegpipeError {
public:
	explicit DimensionMismatchError(const std::string &msg) : std::invalid_argument(msg) {
	}
};

/// NaN/Inf values, invalid options, or an inconsistent reconstructed state
class InvalidInputError : public std::invalid_argument, public RegpipeError {
public:
	explicit InvalidInputError(const std::string &msg) : std::invalid_argument(msg) {
	}
};

/// Transform, predict or state access before a successful fit
class NotFittedError : public std::logic_error, public RegpipeError {
public:
	explicit NotFittedError(const std::string &msg) : std::logic_error(msg) {
	}
};

/// Rank-deficient design matrix under RankDeficiencyPolicy::RAISE_ERROR
class SingularMatrixError : public std::runtime_error, public RegpipeError {
public:
	explicit SingularMatrixError(const std::string &msg) : std::runtime_error(msg) {
	}
};

/// Record is missing a key, carries a value of the wrong type, or is not valid JSON
class SerializationError : public std::runtime_error, public RegpipeError {
public:
	explicit SerializationError(const std::string &msg) : std::runtime_error(msg) {
	}
};

} // namespace core
} // namespace regpipe
