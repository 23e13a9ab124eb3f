/**
 * @file EngineErrors.hpp
 * @brief Exceptions raised by the forecasting and redistribution engine.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace hemoflow::domain {

class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief Prediction requested before a trained model is available. */
class ModelNotReady : public EngineError {
public:
    ModelNotReady() : EngineError("Model must be trained before making predictions") {}
    explicit ModelNotReady(const std::string& what) : EngineError(what) {}
};

/** @brief Source cell holds fewer units than requested. */
class InsufficientInventory : public EngineError {
public:
    using EngineError::EngineError;
};

/** @brief Destination cell would exceed its maximum capacity. */
class CapacityExceeded : public EngineError {
public:
    using EngineError::EngineError;
};

/** @brief The cells changed between validation and commit. */
class TransferConflict : public EngineError {
public:
    using EngineError::EngineError;
};

class InvalidArgument : public EngineError {
public:
    using EngineError::EngineError;
};

/** @brief A persisted model artifact is unreadable or internally inconsistent. */
class ArtifactError : public EngineError {
public:
    using EngineError::EngineError;
};

} // namespace hemoflow::domain
