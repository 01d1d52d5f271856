#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace voxel_stack::core {

/// Recoverable condition noticed while assembling or transforming a volume
struct Diagnostic {
    enum class Code {
        IrregularSliceSpacing,
        OrientationNotUnitNorm
    };

    Code code = Code::IrregularSliceSpacing;
    std::string message;

    /// Values the message refers to (e.g. distinct slice distances)
    std::vector<double> values;
};

/// Short name of a diagnostic code, e.g. "irregular_slice_spacing"
std::string toString(Diagnostic::Code code);

/**
 * @brief Caller-supplied channel for non-fatal diagnostics
 *
 * Passed into assembly and import calls instead of a process-wide warning
 * mechanism, so that concurrent imports each report into their own sink.
 */
class DiagnosticsSink {
public:
    virtual ~DiagnosticsSink() = default;

    virtual void report(const Diagnostic& diagnostic) = 0;
};

/// Sink that keeps every diagnostic in memory
class CollectingDiagnosticsSink : public DiagnosticsSink {
public:
    void report(const Diagnostic& diagnostic) override;

    [[nodiscard]] std::vector<Diagnostic> diagnostics() const;

    [[nodiscard]] std::size_t count() const;

    [[nodiscard]] std::size_t count(Diagnostic::Code code) const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<Diagnostic> diagnostics_;
};

/// Sink that writes diagnostics as warnings to a spdlog logger
class LoggingDiagnosticsSink : public DiagnosticsSink {
public:
    /// Uses the "Diagnostics" logger from LoggerFactory
    LoggingDiagnosticsSink();

    explicit LoggingDiagnosticsSink(std::shared_ptr<spdlog::logger> logger);

    void report(const Diagnostic& diagnostic) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

/// Sink that drops everything
class NullDiagnosticsSink : public DiagnosticsSink {
public:
    void report(const Diagnostic&) override {}
};

}  // namespace voxel_stack::core
