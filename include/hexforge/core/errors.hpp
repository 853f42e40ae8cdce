// HexForge Core
// errors.hpp - Fatal generation error taxonomy

#pragma once

#include <stdexcept>
#include <string>

namespace hexforge::core {

// Base of every error that aborts a generation run. There is no partial
// success: whichever builder throws, the whole batch is abandoned before export.
class GenerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    [[nodiscard]] virtual const char* kind() const noexcept { return "GenerationError"; }
};

// Invalid numeric configuration, detected before any host call is made
class ParameterError : public GenerationError {
public:
    using GenerationError::GenerationError;

    [[nodiscard]] const char* kind() const noexcept override { return "ParameterError"; }
};

// A boolean or bevel request that would produce empty or ill-defined geometry
class GeometryDegeneracyError : public GenerationError {
public:
    using GenerationError::GenerationError;

    [[nodiscard]] const char* kind() const noexcept override { return "GeometryDegeneracyError"; }
};

// A host scene call failed (unknown handle, unsupported operation, reparenting twice)
class HostOperationError : public GenerationError {
public:
    using GenerationError::GenerationError;

    [[nodiscard]] const char* kind() const noexcept override { return "HostOperationError"; }
};

}  // namespace hexforge::core
