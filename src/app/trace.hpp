#ifndef TRISTAGE_APP_TRACE_HPP
#define TRISTAGE_APP_TRACE_HPP

#include <atomic>
#include <iostream>
#include <sstream>
#include <string>

namespace tristage::app {

class TraceLogger {
public:
    static void SetEnabled(bool enabled) noexcept {
        enabled_.store(enabled, std::memory_order_relaxed);
    }

    static bool Enabled() noexcept {
        return enabled_.load(std::memory_order_relaxed);
    }

    static void Log(const std::string& message) {
        if (Enabled()) {
            std::cout << "[TRACE] " << message << '\n';
        }
    }

    template <typename T>
    static void LogVariable(const char* name, const T& value) {
        if (Enabled()) {
            std::ostringstream oss;
            oss << name << " = " << value;
            Log(oss.str());
        }
    }

private:
    static inline std::atomic_bool enabled_{false};
};

class TraceScope {
public:
    explicit TraceScope(const char* name) : name_(name) {
        TraceLogger::Log(name_);
    }

private:
    const char* name_;
};

} // namespace tristage::app

#define TRISTAGE_TRACE_CONCAT_INNER(a, b) a##b
#define TRISTAGE_TRACE_CONCAT(a, b) TRISTAGE_TRACE_CONCAT_INNER(a, b)
#define TRACE_FUNCTION() \
    tristage::app::TraceScope TRISTAGE_TRACE_CONCAT(traceScope, __COUNTER__){__func__}
#define TRACE_VAR(var) tristage::app::TraceLogger::LogVariable(#var, var)

#endif // TRISTAGE_APP_TRACE_HPP
