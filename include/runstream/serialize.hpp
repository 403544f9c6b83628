#pragma once

/// @file include/runstream/serialize.hpp
/// @brief Deterministic JSON rendering of analysis results.
///
/// Keys are emitted in a fixed order and numbers in shortest round-trip
/// form, so identical results always serialize to identical bytes.

#include "runstream/errors.hpp"
#include "runstream/result.hpp"

#include <span>
#include <string>

namespace runstream::serialize {

[[nodiscard]] std::string to_json(const StreamAnalysisResult& result);

[[nodiscard]] std::string to_json(std::span<const AnalysisError> errors);

/// `{"result": ..., "errors": [...]}` with the absent side as null / [].
[[nodiscard]] std::string to_json(const AnalysisOutcome& outcome);

}  // namespace runstream::serialize
