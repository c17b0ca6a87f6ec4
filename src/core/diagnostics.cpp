#include <webless/core/diagnostics.h>
#include <sstream>
#include <utility>

namespace webless::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
        if (!event.stage.empty()) {
            oss << "/" << event.stage;
        }
    }
    if (event.has_location()) {
        oss << " (" << event.line << ":" << event.column << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    emit_at(severity, module, stage, message, 0, 0);
}

void DiagnosticEmitter::emit_at(Severity severity, const std::string& module,
                                const std::string& stage, const std::string& message,
                                std::size_t line, std::size_t column) {
    if (severity < min_severity_) return;

    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.line = line;
    event.column = line != 0 ? column : 0;
    record(std::move(event));
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

void DiagnosticEmitter::record(DiagnosticEvent event) {
    events_.push_back(event);
    for (const auto& observer : observers_) {
        observer(event);
    }
}

} // namespace webless::core
