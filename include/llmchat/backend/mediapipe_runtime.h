#pragma once

#include "llmchat/backend/task_runtime.h"

#include <string>

namespace llmchat {

// TaskRuntime over the MediaPipe LLM Inference engine C API.
class MediaPipeTaskRuntime : public TaskRuntime {
public:
    // Engines write their weight caches under `cacheDir`. Empty means next to the model file.
    explicit MediaPipeTaskRuntime(const std::string& cacheDir = "") : kCacheDir(cacheDir) {}

    std::unique_ptr<LlmEngine> createEngine(const LlmInferenceOptions& options) override;

private:
    const std::string kCacheDir;
};

} // namespace llmchat
