/**
 * @file OperationResult.hpp
 * @brief Outcome of an operation that may fail without throwing.
 */

#pragma once
#include <string>
#include <utility>

namespace stablecopy::domain {

struct OperationResult {
    bool ok = false;
    std::string message;

    static OperationResult success(std::string msg = {}) {
        return {true, std::move(msg)};
    }

    static OperationResult failure(std::string msg) {
        return {false, std::move(msg)};
    }
};

} // namespace stablecopy::domain
