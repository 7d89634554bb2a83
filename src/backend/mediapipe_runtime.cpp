#include "llmchat/backend/mediapipe_runtime.h"

#include "llmchat/common/logging.h"

#include "include/core/SkBitmap.h"
#include "include/core/SkImageInfo.h"
#include "mediapipe/tasks/cc/genai/inference/c/llm_inference_engine.h"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <cstdlib>
#include <cstring>
#include <utility>

namespace llmchat {

namespace {

// Same default as the Java LlmInference options. Sessions asking for a larger top-k are rejected.
constexpr size_t kMaxTopK = 40;

// Throws TaskRuntimeError if the C API call failed. Takes ownership of `errorMsg`.
void throwIfFailed(const int status, char* errorMsg, const char* what) {
    std::string message;
    if (errorMsg != nullptr) {
        message = errorMsg;
        std::free(errorMsg);
    }
    if (status == 0) {
        return;
    }
    if (message.empty()) {
        message = std::string(what) + " failed with status " + std::to_string(status);
    }
    throw TaskRuntimeError(message);
}

// Outlives the PredictAsync() call. Deleted by the callback once the response is done.
struct PendingResponse {
    ResultListener listener;
};

void onPredictResponse(void* callbackContext, LlmResponseContext* responseContext) {
    auto pending = static_cast<PendingResponse*>(callbackContext);

    std::string partialResult;
    for (size_t i = 0; i < responseContext->response_count; i++) {
        partialResult += responseContext->response_array[i];
    }
    const bool done = responseContext->done;
    LlmInferenceEngine_CloseResponseContext(responseContext);

    try {
        pending->listener(partialResult, done);
    } catch (const std::exception& e) {
        LOG(ERROR) << "Result listener threw: " << e.what();
    }
    if (done) {
        delete pending;
    }
}

class MediaPipeLlmSession : public LlmSession {
public:
    explicit MediaPipeLlmSession(LlmInferenceEngine_Session* session) : mSession(session) {}

    ~MediaPipeLlmSession() override { close(); }

    void addQueryChunk(const std::string& text) override {
        ensureOpen();
        char* errorMsg = nullptr;
        const auto status =
            LlmInferenceEngine_Session_AddQueryChunk(mSession, text.c_str(), &errorMsg);
        throwIfFailed(status, errorMsg, "AddQueryChunk");
    }

    void addImage(const Image& image) override {
        ensureOpen();
        if (image.channels != 3) {
            throw TaskRuntimeError("LlmInference expects an RGB image");
        }
        const cv::Mat rgb(image.height, image.width, CV_8UC3,
                          const_cast<uint8_t*>(image.pixels.data()));
        cv::Mat rgba;
        cv::cvtColor(rgb, rgba, cv::COLOR_RGB2RGBA);

        SkBitmap bitmap;
        const auto info = SkImageInfo::Make(image.width, image.height, kRGBA_8888_SkColorType,
                                            kOpaque_SkAlphaType);
        if (!bitmap.tryAllocPixels(info)) {
            throw TaskRuntimeError("Failed to allocate the image bitmap");
        }
        for (int row = 0; row < rgba.rows; row++) {
            std::memcpy(bitmap.getAddr(0, row), rgba.ptr(row), rgba.cols * rgba.elemSize());
        }

        char* errorMsg = nullptr;
        const auto status = LlmInferenceEngine_Session_AddImage(mSession, &bitmap, &errorMsg);
        throwIfFailed(status, errorMsg, "AddImage");
    }

    void generateResponseAsync(ResultListener listener) override {
        ensureOpen();
        auto pending = new PendingResponse{std::move(listener)};
        char* errorMsg = nullptr;
        const auto status = LlmInferenceEngine_Session_PredictAsync(mSession, pending, &errorMsg,
                                                                    onPredictResponse);
        if (status != 0) {
            delete pending;
        }
        throwIfFailed(status, errorMsg, "PredictAsync");
    }

    void close() override {
        if (mSession == nullptr) {
            return;
        }
        const auto status = LlmInferenceEngine_Session_Delete(mSession);
        mSession = nullptr;
        if (status != 0) {
            LOG(WARN) << "LlmInferenceEngine_Session_Delete returned " << status;
        }
    }

private:
    void ensureOpen() const {
        if (mSession == nullptr) {
            throw TaskRuntimeError("LlmInference session is closed");
        }
    }

private:
    LlmInferenceEngine_Session* mSession;
};

class MediaPipeLlmEngine : public LlmEngine {
public:
    MediaPipeLlmEngine(LlmInferenceEngine_Engine* engine, const int maxNumImages)
        : mEngine(engine), kMaxNumImages(maxNumImages) {}

    ~MediaPipeLlmEngine() override { close(); }

    std::unique_ptr<LlmSession> createSession(const LlmSessionOptions& options) override {
        if (mEngine == nullptr) {
            throw TaskRuntimeError("LlmInference engine is closed");
        }
        if (options.enableVisionModality && kMaxNumImages == 0) {
            throw TaskRuntimeError("Vision modality requires an engine created with images");
        }

        LlmSessionConfig config{};
        config.topk = options.topK;
        config.topp = options.topP;
        config.temperature = options.temperature;
        config.random_seed = 0;
        config.enable_vision_modality = options.enableVisionModality;

        LlmInferenceEngine_Session* session = nullptr;
        char* errorMsg = nullptr;
        const auto status =
            LlmInferenceEngine_CreateSession(mEngine, &config, &session, &errorMsg);
        throwIfFailed(status, errorMsg, "CreateSession");
        return std::make_unique<MediaPipeLlmSession>(session);
    }

    void close() override {
        if (mEngine == nullptr) {
            return;
        }
        LlmInferenceEngine_Engine_Delete(mEngine);
        mEngine = nullptr;
    }

private:
    LlmInferenceEngine_Engine* mEngine;
    const int kMaxNumImages;
};

} // namespace

std::unique_ptr<LlmEngine> MediaPipeTaskRuntime::createEngine(const LlmInferenceOptions& options) {
    LOG(DEBUG) << "Creating LlmInference engine for " << options.modelPath << " on "
               << getPreferredBackendName(options.preferredBackend);

    LlmModelSettings settings{};
    settings.model_path = options.modelPath.c_str();
    settings.cache_dir = kCacheDir.empty() ? nullptr : kCacheDir.c_str();
    settings.max_num_tokens = options.maxTokens;
    settings.max_num_images = options.maxNumImages;
    settings.max_top_k = kMaxTopK;
    settings.number_of_supported_lora_ranks = 0;
    settings.preferred_backend =
        options.preferredBackend == PreferredBackend::CPU ? kCpu : kGpu;

    LlmInferenceEngine_Engine* engine = nullptr;
    char* errorMsg = nullptr;
    const auto status = LlmInferenceEngine_CreateEngine(&settings, &engine, &errorMsg);
    throwIfFailed(status, errorMsg, "CreateEngine");
    return std::make_unique<MediaPipeLlmEngine>(engine, options.maxNumImages);
}

} // namespace llmchat
