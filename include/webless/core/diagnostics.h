#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace webless::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

// One reported event. Events about a position in the parsed source carry
// its 1-based line and column; both are 0 otherwise.
struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::size_t line = 0;
    std::size_t column = 0;

    bool has_location() const { return line != 0; }
};

// "[severity] module/stage (line:col): message"
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Records events at or above the minimum severity and forwards each one
// to every observer.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);
    void emit_at(Severity severity, const std::string& module, const std::string& stage,
                 const std::string& message, std::size_t line, std::size_t column);

    void set_min_severity(Severity min) { min_severity_ = min; }
    Severity min_severity() const { return min_severity_; }

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const { return events_; }
    std::size_t size() const { return events_.size(); }

private:
    void record(DiagnosticEvent event);

    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    Severity min_severity_ = Severity::Info;
};

} // namespace webless::core
