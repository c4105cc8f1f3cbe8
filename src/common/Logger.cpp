#include "mindarbor/common/Logger.h"
#include "mindarbor/backends/SpdlogBackend.h"

#include <cctype>
#include <mutex>

namespace mindarbor {

std::unique_ptr<ILoggerBackend> Logger::backend_;

namespace {

std::mutex backendMutex;

struct CaptureState {
    std::mutex mutex;
    bool enabled = false;
    std::vector<std::string> lines;
};

CaptureState& captureState() {
    static CaptureState state;
    return state;
}

}  // namespace

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backendMutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string& logDir, bool logToFile) {
    std::lock_guard<std::mutex> lock(backendMutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    write(LogLevel::Error, message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

void Logger::write(LogLevel level, const std::string& message,
                   const std::source_location& loc) {
    ensureBackend();
    std::string line = extractFunctionName(loc) + "() - " + message;
    backend_->log(level, line, loc);
    captureLog("[" + std::string(logLevelName(level)) + "] " + line);
}

// ===== Log Capture =====

void Logger::enableCapture(bool enable) {
    auto& state = captureState();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.enabled = enable;
}

bool Logger::isCaptureEnabled() {
    auto& state = captureState();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.enabled;
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines) {
    auto& state = captureState();
    std::lock_guard<std::mutex> lock(state.mutex);

    std::vector<std::string> result;
    for (const auto& line : state.lines) {
        if (pattern.empty() || line.find(pattern) != std::string::npos) {
            result.push_back(line);
        }
    }

    // Keep the most recent maxLines entries
    if (maxLines > 0 && result.size() > maxLines) {
        result.erase(result.begin(),
                     result.begin() + static_cast<std::ptrdiff_t>(result.size() - maxLines));
    }
    return result;
}

void Logger::clearCapturedLogs() {
    auto& state = captureState();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.lines.clear();
}

void Logger::captureLog(const std::string& line) {
    auto& state = captureState();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.enabled) {
        state.lines.push_back(line);
    }
}

std::string Logger::extractFunctionName(const std::source_location& loc) {
    std::string signature = loc.function_name();

    // Clang spells the unnamed namespace with parentheses
    const std::string anonymous = "(anonymous namespace)";
    for (size_t pos = signature.find(anonymous); pos != std::string::npos;
         pos = signature.find(anonymous, pos)) {
        signature.replace(pos, anonymous.size(), "{anonymous}");
    }

    size_t paren = signature.find('(');
    if (paren == std::string::npos) {
        return "Unknown";
    }

    // Qualified name starts after the last top-level space (return type)
    int depth = 0;
    size_t start = 0;
    for (size_t i = 0; i < paren; ++i) {
        char c = signature[i];
        if (c == '<') ++depth;
        else if (c == '>') --depth;
        else if (c == ' ' && depth == 0) start = i + 1;
    }

    // Drop template arguments, keep namespace/class qualification
    std::string name;
    depth = 0;
    for (size_t i = start; i < paren; ++i) {
        char c = signature[i];
        if (c == '<') ++depth;
        else if (c == '>') --depth;
        else if (depth == 0) name += c;
    }

    while (!name.empty() && (std::isspace(static_cast<unsigned char>(name.front())) ||
                             name.front() == '*' || name.front() == '&')) {
        name.erase(0, 1);
    }
    while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back()))) {
        name.pop_back();
    }

    // Strip our own namespace so lines read "TreeLayout::layout"
    const std::string prefix = "mindarbor::";
    if (name.rfind(prefix, 0) == 0) {
        name.erase(0, prefix.size());
    }
    return name.empty() ? "Unknown" : name;
}

}  // namespace mindarbor
