#pragma once

#include "llmchat/image.h"

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace llmchat {

// Receives streamed partial results. `done` is true exactly once, on the last call.
using ResultListener = std::function<void(const std::string& partialResult, bool done)>;

class TaskRuntimeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class PreferredBackend {
    CPU,
    GPU
};

const char* getPreferredBackendName(const PreferredBackend backend);

// clang-format off

struct LlmInferenceOptions {
    std::string modelPath;
    int maxTokens                     = 1024;
    PreferredBackend preferredBackend = PreferredBackend::GPU;
    int maxNumImages                  = 0;
};

struct LlmSessionOptions {
    int topK                  = 40;
    float topP                = 0.9f;
    float temperature         = 1.0f;
    bool enableVisionModality = false;
};

// clang-format on

// A conversation on top of a loaded engine. Query chunks and images accumulate until the next
// generateResponseAsync() call.
class LlmSession {
public:
    virtual ~LlmSession() {}

    virtual void addQueryChunk(const std::string& text) = 0;

    virtual void addImage(const Image& image) = 0;

    // Returns once the request is submitted. The listener is called from the runtime's threads.
    virtual void generateResponseAsync(ResultListener listener) = 0;

    // Releases the session. Safe to call more than once.
    virtual void close() = 0;
};

class LlmEngine {
public:
    virtual ~LlmEngine() {}

    virtual std::unique_ptr<LlmSession> createSession(const LlmSessionOptions& options) = 0;

    // Releases the engine. Sessions created from it must be closed first.
    virtual void close() = 0;
};

// Entry point of the vendor ML-task runtime.
class TaskRuntime {
public:
    virtual ~TaskRuntime() {}

    virtual std::unique_ptr<LlmEngine> createEngine(const LlmInferenceOptions& options) = 0;
};

} // namespace llmchat
