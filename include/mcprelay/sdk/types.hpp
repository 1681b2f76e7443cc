/**
 * @file types.hpp
 * @brief Common type definitions for the relay and the bridge
 */

#pragma once

#include "mcprelay/sdk/errors.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace mcprelay {
namespace sdk {

/**
 * @brief Result type for operations that can fail
 *
 * An error result carries an ErrorCode and an optional human readable detail
 * that is surfaced to callers (e.g. "Request timeout (60s)").
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(ErrorCode::SUCCESS) {}
    Result(ErrorCode error) : error_(error) {}
    Result(ErrorCode error, std::string detail) : error_(error), detail_(std::move(detail)) {}

    bool is_ok() const { return error_ == ErrorCode::SUCCESS; }
    bool is_err() const { return !is_ok(); }

    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Attempted to access value of an error result");
        }
        return value_;
    }

    ErrorCode error() const { return error_; }

    // Detail if present, otherwise the generic text for the code
    std::string error_detail() const {
        return detail_.empty() ? ErrorCodeToString(error_) : detail_;
    }

    std::string error_message() const {
        if (detail_.empty()) {
            return ErrorCodeToString(error_);
        }
        return ErrorCodeToString(error_) + ": " + detail_;
    }

private:
    T value_{};
    ErrorCode error_;
    std::string detail_;
};

// Specialization for void result
template<>
class Result<void> {
public:
    Result() : error_(ErrorCode::SUCCESS) {}
    Result(ErrorCode error) : error_(error) {}
    Result(ErrorCode error, std::string detail) : error_(error), detail_(std::move(detail)) {}

    bool is_ok() const { return error_ == ErrorCode::SUCCESS; }
    bool is_err() const { return !is_ok(); }

    ErrorCode error() const { return error_; }

    std::string error_detail() const {
        return detail_.empty() ? ErrorCodeToString(error_) : detail_;
    }

    std::string error_message() const {
        if (detail_.empty()) {
            return ErrorCodeToString(error_);
        }
        return ErrorCodeToString(error_) + ": " + detail_;
    }

private:
    ErrorCode error_;
    std::string detail_;
};

// Common type aliases
using Json = nlohmann::json;
using NodeId = std::string;
using KeyHash = std::string;
using CorrelationId = std::string;
using TimePoint = std::chrono::system_clock::time_point;

} // namespace sdk
} // namespace mcprelay
