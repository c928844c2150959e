/*───────────────────────────────────────────────────────────
 *  errors.hpp   –  exception taxonomy of the planning core
 *
 *  Every component converts library failures (json, LightGBM,
 *  OR-tools, file I/O) into one of these before returning.
 *  Solver non-optimality is NOT an exception: it travels as
 *  SolveStatus + DecisionSource on the OptimizationOutcome.
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <stdexcept>
#include <string>

namespace induct {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

/* empty / malformed dataset, bad config, bad override value */
class InputError : public Error {
public:
    explicit InputError(const std::string& msg) : Error("input error: " + msg) {}
};

/* fewer than the minimum samples, or single-class labels */
class InsufficientDataError : public Error {
public:
    explicit InsufficientDataError(const std::string& msg)
        : Error("insufficient data: " + msg) {}
};

/* corrupt or mismatched model artifact */
class ModelLoadError : public Error {
public:
    explicit ModelLoadError(const std::string& msg)
        : Error("model load error: " + msg) {}
};

class OverrideNotFoundError : public Error {
public:
    explicit OverrideNotFoundError(const std::string& train_id)
        : Error("override target not found: " + train_id), train_id_(train_id) {}
    const std::string& train_id() const { return train_id_; }

private:
    std::string train_id_;
};

} // namespace induct
