#pragma once

#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace llmchat {

enum class LogSeverity {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

// Thrown by LOG(FATAL) and failed CHECKs once the message has been written.
class FatalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Messages below this severity are dropped. FATAL is always emitted.
void setLogLevel(const LogSeverity severity);

LogSeverity getLogLevel();

// Parses "debug", "info", "warn", "error" (case-insensitive). Returns false if unrecognized.
bool parseLogSeverity(const std::string& name, LogSeverity& severity);

const char* getLogSeverityName(const LogSeverity severity);

class LogMessage {
public:
    LogMessage(const LogSeverity severity, const char* file, const int line);

    // Throws FatalError for FATAL messages unless the stack is already unwinding.
    ~LogMessage() noexcept(false);

    std::ostream& stream() { return mStream; }

private:
    LogMessage(const LogMessage&) = delete;
    LogMessage& operator=(const LogMessage&) = delete;

private:
    const LogSeverity kSeverity;
    const char* kFile;
    const int kLine;
    std::ostringstream mStream;
};

// Turns a stream expression into void so it can be used in a ternary.
struct LogMessageVoidify {
    void operator&(std::ostream&) {}
};

} // namespace llmchat

#define LOG(severity) \
    ::llmchat::LogMessage(::llmchat::LogSeverity::severity, __FILE__, __LINE__).stream()

#define CHECK(condition)                                          \
    (condition) ? (void)0                                         \
                : ::llmchat::LogMessageVoidify() & LOG(FATAL) \
                                                       << "Check failed: " #condition " "

#define CHECK_OP(a, b, op) CHECK((a)op(b)) << "(" << (a) << " vs. " << (b) << ") "

#define CHECK_EQ(a, b) CHECK_OP(a, b, ==)
#define CHECK_NE(a, b) CHECK_OP(a, b, !=)
#define CHECK_LT(a, b) CHECK_OP(a, b, <)
#define CHECK_LE(a, b) CHECK_OP(a, b, <=)
#define CHECK_GT(a, b) CHECK_OP(a, b, >)
#define CHECK_GE(a, b) CHECK_OP(a, b, >=)

#ifdef NDEBUG
#define DCHECK(condition) \
    while (false)         \
    CHECK(condition)
#define DCHECK_OP(a, b, op) \
    while (false)           \
    CHECK_OP(a, b, op)
#define DLOG(severity) \
    while (false)      \
    LOG(severity)
#else
#define DCHECK(condition) CHECK(condition)
#define DCHECK_OP(a, b, op) CHECK_OP(a, b, op)
#define DLOG(severity) LOG(severity)
#endif

#define DCHECK_EQ(a, b) DCHECK_OP(a, b, ==)
#define DCHECK_NE(a, b) DCHECK_OP(a, b, !=)
#define DCHECK_LT(a, b) DCHECK_OP(a, b, <)
#define DCHECK_LE(a, b) DCHECK_OP(a, b, <=)
#define DCHECK_GT(a, b) DCHECK_OP(a, b, >)
#define DCHECK_GE(a, b) DCHECK_OP(a, b, >=)
