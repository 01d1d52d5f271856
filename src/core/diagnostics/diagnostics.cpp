#include "core/diagnostics.hpp"
#include "core/logging.hpp"

#include <algorithm>

namespace voxel_stack::core {

std::string toString(Diagnostic::Code code) {
    switch (code) {
        case Diagnostic::Code::IrregularSliceSpacing: return "irregular_slice_spacing";
        case Diagnostic::Code::OrientationNotUnitNorm: return "orientation_not_unit_norm";
    }
    return "unknown";
}

void CollectingDiagnosticsSink::report(const Diagnostic& diagnostic) {
    std::lock_guard lock(mutex_);
    diagnostics_.push_back(diagnostic);
}

std::vector<Diagnostic> CollectingDiagnosticsSink::diagnostics() const {
    std::lock_guard lock(mutex_);
    return diagnostics_;
}

std::size_t CollectingDiagnosticsSink::count() const {
    std::lock_guard lock(mutex_);
    return diagnostics_.size();
}

std::size_t CollectingDiagnosticsSink::count(Diagnostic::Code code) const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::count_if(
        diagnostics_.begin(), diagnostics_.end(),
        [code](const Diagnostic& d) { return d.code == code; }));
}

void CollectingDiagnosticsSink::clear() {
    std::lock_guard lock(mutex_);
    diagnostics_.clear();
}

LoggingDiagnosticsSink::LoggingDiagnosticsSink()
    : logger_(logging::LoggerFactory::create("Diagnostics")) {}

LoggingDiagnosticsSink::LoggingDiagnosticsSink(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

void LoggingDiagnosticsSink::report(const Diagnostic& diagnostic) {
    if (!logger_) {
        return;
    }
    logger_->warn("[{}] {}", toString(diagnostic.code), diagnostic.message);
}

}  // namespace voxel_stack::core
