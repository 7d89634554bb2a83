#pragma once

#include "llmchat/backend/native_engine.h"
#include "llmchat/backend/task_runtime.h"
#include "llmchat/image.h"
#include "llmchat/model.h"

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace llmchat {

using CleanUpListener = std::function<void()>;

// Called once per initialize(). An empty string means success, otherwise it is a readable error.
using InitDoneCallback = std::function<void(const std::string& error)>;

// Picks a backend per model, owns the backend objects attached to the model, and normalizes
// streaming, error and completion signaling of both backends to a single ResultListener.
class LlmChatModelHelper {
public:
    // Either backend may be null when it is not available in this build. Models that select a
    // missing backend fail to initialize with a readable message. Backends must outlive the
    // helper and every model instance it created.
    LlmChatModelHelper(TaskRuntime* taskRuntime, NativeEngineApi* nativeEngineApi)
        : mTaskRuntime(taskRuntime), mNativeEngineApi(nativeEngineApi) {}

    LlmChatModelHelper(const LlmChatModelHelper&) = delete;
    LlmChatModelHelper& operator=(const LlmChatModelHelper&) = delete;

    void initialize(Model& model, const InitDoneCallback& onDone);

    // Replaces the task runtime session with a fresh one built from the current config values.
    void resetSession(Model& model);

    // Releases the model instance and fires the pending cleanup listener of the model, if any.
    void cleanUp(Model& model);

    // Streams the response to `resultListener`, which sees exactly one final result. Errors are
    // reported inline as that final result instead of being thrown. A non-empty
    // `cleanUpListener` is remembered for the next cleanUp(), unless a listener is already
    // pending for this model.
    void runInference(Model& model, const std::string& input, const ResultListener& resultListener,
                      const CleanUpListener& cleanUpListener, const Image* image = nullptr);

    bool hasPendingCleanUpListener(const std::string& modelName) const;

private:
    // Each returns an empty string on success, or the message to report via onDone.
    std::string initializeNativeEngine(Model& model);
    std::string initializeTaskRuntime(Model& model, const std::string& accelerator);

    LlmSessionOptions makeSessionOptions(const Model& model) const;

    void runTaskRuntimeInference(const Model& model, TaskRuntimeInstance& instance,
                                 const std::string& input, const ResultListener& resultListener,
                                 const Image* image);
    void runNativeEngineInference(const Model& model, NativeEngineWrapper& wrapper,
                                  const std::string& input, const ResultListener& resultListener,
                                  const Image* image);

private:
    TaskRuntime* mTaskRuntime;
    NativeEngineApi* mNativeEngineApi;

    // Indexed by model name
    mutable std::mutex mCleanUpListenersMutex;
    std::unordered_map<std::string, CleanUpListener> mCleanUpListeners;
};

// Strips the source location trace the task runtime appends to its error messages.
std::string cleanUpTaskErrorMessage(const std::string& message);

} // namespace llmchat
