#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace sleek::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

// Accepts "info", "warning"/"warn", "error" (any case).
bool parse_severity(const std::string& text, Severity& out);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects events for one unit of work (one proxied request). Not shared
// between threads; each request owns its emitter.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void info(const std::string& module, const std::string& stage, const std::string& message);
    void warning(const std::string& module, const std::string& stage, const std::string& message);
    void error(const std::string& module, const std::string& stage, const std::string& message);

    void set_correlation_id(std::uint64_t id);
    void set_min_severity(Severity min);

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const;
    std::size_t size() const;

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

// Observer that writes one formatted line per event to stderr. Safe to share
// between emitters on different threads.
DiagnosticObserver stderr_observer();

} // namespace sleek::core
