#pragma once

#include <string>

namespace voxel_stack::core {

/// Error result of stack assembly and volume import
struct AssemblyError {
    enum class Code {
        EmptyInput,
        GeometryMismatch,
        InvalidConfiguration,
        SliceLoadFailed,
        PixelDataMismatch,
        InternalError
    };

    Code code = Code::InternalError;
    std::string message;

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::EmptyInput: return "Empty input: " + message;
            case Code::GeometryMismatch: return "Geometry mismatch: " + message;
            case Code::InvalidConfiguration: return "Invalid configuration: " + message;
            case Code::SliceLoadFailed: return "Slice load failed: " + message;
            case Code::PixelDataMismatch: return "Pixel data mismatch: " + message;
            case Code::InternalError: return "Internal error: " + message;
        }
        return "Unknown error";
    }
};

}  // namespace voxel_stack::core
