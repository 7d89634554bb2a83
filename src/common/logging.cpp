#include "llmchat/common/logging.h"

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <mutex>
#include <strings.h>

#ifdef __ANDROID__
#include <android/log.h>
#endif

namespace llmchat {

namespace {

constexpr char kLogTag[] = "llmchat";

LogSeverity initialLogLevel() {
    LogSeverity severity = LogSeverity::INFO;
    const char* envLevel = std::getenv("LLMCHAT_LOG_LEVEL");
    if (envLevel != nullptr) {
        parseLogSeverity(envLevel, severity);
    }
    return severity;
}

std::atomic<LogSeverity>& logLevel() {
    static std::atomic<LogSeverity> level(initialLogLevel());
    return level;
}

// Strip the directory part so that log lines stay short.
const char* baseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

#ifdef __ANDROID__
int toAndroidPriority(const LogSeverity severity) {
    switch (severity) {
        case LogSeverity::DEBUG:
            return ANDROID_LOG_DEBUG;
        case LogSeverity::INFO:
            return ANDROID_LOG_INFO;
        case LogSeverity::WARN:
            return ANDROID_LOG_WARN;
        case LogSeverity::ERROR:
            return ANDROID_LOG_ERROR;
        case LogSeverity::FATAL:
            return ANDROID_LOG_FATAL;
    }
    return ANDROID_LOG_DEFAULT;
}
#endif

} // namespace

void setLogLevel(const LogSeverity severity) {
    logLevel().store(severity);
}

LogSeverity getLogLevel() {
    return logLevel().load();
}

bool parseLogSeverity(const std::string& name, LogSeverity& severity) {
#define MATCH_SEVERITY(type)                   \
    if (!strcasecmp(name.c_str(), #type)) {    \
        severity = LogSeverity::type;          \
        return true;                           \
    }

    MATCH_SEVERITY(DEBUG)
    MATCH_SEVERITY(INFO)
    MATCH_SEVERITY(WARN)
    MATCH_SEVERITY(ERROR)

#undef MATCH_SEVERITY

    return false;
}

const char* getLogSeverityName(const LogSeverity severity) {
    switch (severity) {
        case LogSeverity::DEBUG:
            return "DEBUG";
        case LogSeverity::INFO:
            return "INFO";
        case LogSeverity::WARN:
            return "WARN";
        case LogSeverity::ERROR:
            return "ERROR";
        case LogSeverity::FATAL:
            return "FATAL";
    }
    return "UNKNOWN";
}

LogMessage::LogMessage(const LogSeverity severity, const char* file, const int line)
    : kSeverity(severity), kFile(file), kLine(line) {}

LogMessage::~LogMessage() noexcept(false) {
    const bool isFatal = (kSeverity == LogSeverity::FATAL);
    if (!isFatal && kSeverity < getLogLevel()) {
        return;
    }

    const std::string message = mStream.str();

#ifdef __ANDROID__
    __android_log_print(toAndroidPriority(kSeverity), kLogTag, "%s:%d %s", baseName(kFile),
                        kLine, message.c_str());
#else
    {
        static std::mutex outputMutex;
        std::lock_guard<std::mutex> lock(outputMutex);
        std::cerr << "[" << getLogSeverityName(kSeverity) << "][" << kLogTag << "] "
                  << baseName(kFile) << ":" << kLine << " " << message << std::endl;
    }
#endif

    if (isFatal && std::uncaught_exceptions() == 0) {
        throw FatalError(message);
    }
}

} // namespace llmchat
