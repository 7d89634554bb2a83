#include "llmchat/llm_chat_model_helper.h"

#include "common/overloaded.h"
#include "llmchat/common/logging.h"
#include "llmchat/common/timer.h"
#include "utils/utils.h"

#include <atomic>
#include <exception>
#include <memory>
#include <utility>
#include <variant>

namespace llmchat {

namespace {

constexpr char kSourceLocationTraceMarker[] = "=== Source Location Trace";

// Adapts the native engine's three callbacks to a ResultListener and guarantees that the
// listener sees at most one final (done == true) call.
class ResultListenerCallback : public StringCallback {
public:
    ResultListenerCallback(const std::string& modelName, const ResultListener& listener)
        : kModelName(modelName), mListener(listener) {}

    void onResponse(const std::string& token) override {
        if (mDone.load()) {
            LOG(WARN) << "Dropping token received after the response of " << kModelName
                      << " has ended";
            return;
        }
        mListener(token, false);
    }

    void onError(const std::string& errorMessage) override {
        if (!finish())
            return;
        LOG(ERROR) << "Genie error: " << errorMessage;
        mListener("Error from Genie: " + errorMessage, true);
    }

    void onComplete() override {
        if (!finish())
            return;
        LOG(INFO) << "Genie inference complete for model " << kModelName << ".";
        mListener("", true);
    }

    bool isDone() const { return mDone.load(); }

private:
    // Returns true for the first terminal event only.
    bool finish() { return !mDone.exchange(true); }

private:
    const std::string kModelName;
    const ResultListener& mListener;
    std::atomic<bool> mDone{false};
};

} // namespace

std::string cleanUpTaskErrorMessage(const std::string& message) {
    const auto tracePos = message.find(kSourceLocationTraceMarker);
    if (tracePos == std::string::npos) {
        return utils::trim(message);
    }
    return utils::trim(message.substr(0, tracePos));
}

void LlmChatModelHelper::initialize(Model& model, const InitDoneCallback& onDone) {
    if (model.instance) {
        LOG(WARN) << "Model '" << model.name << "' is already initialized. Cleaning it up first.";
        cleanUp(model);
    }

    const auto accelerator =
        model.getStringConfigValue(ConfigKey::ACCELERATOR, getAcceleratorLabel(Accelerator::GPU));
    LOG(DEBUG) << "Initializing...";
    LOG(DEBUG) << "Initializing for accelerator: " << accelerator;

    Timer timer;
    timer.start();

    Accelerator parsedAccelerator = Accelerator::GPU;
    const bool isGenie =
        parseAccelerator(accelerator, parsedAccelerator) && parsedAccelerator == Accelerator::GENIE;

    const auto error =
        isGenie ? initializeNativeEngine(model) : initializeTaskRuntime(model, accelerator);
    if (!error.empty()) {
        onDone(error);
        return;
    }
    LOG(INFO) << "Done model init of '" << model.name << "'. (Time taken: " << timer.reset()
              << " s)";
    onDone("");
}

std::string LlmChatModelHelper::initializeNativeEngine(Model& model) {
    const auto modelDir = model.getGenieModelDir();
    const auto htpConfig = model.getHtpConfigPath();
    if (mNativeEngineApi == nullptr) {
        LOG(ERROR) << "Failed to initialize GenieWrapper: native engine is not available";
        return "Failed to load Genie model: native engine is not available in this build";
    }
    LOG(DEBUG) << "Attempting to load Genie model from " << modelDir << " with HTP config "
               << htpConfig;
    try {
        model.instance.emplace(std::in_place_type<NativeEngineWrapper>, *mNativeEngineApi,
                               modelDir, htpConfig);
    } catch (const std::exception& e) {
        model.instance.reset();
        LOG(ERROR) << "Failed to initialize GenieWrapper: " << e.what();
        return std::string("Failed to load Genie model: ") + e.what();
    }
    LOG(DEBUG) << "GenieWrapper initialized successfully.";
    return "";
}

std::string LlmChatModelHelper::initializeTaskRuntime(Model& model,
                                                      const std::string& accelerator) {
    LlmInferenceOptions options;
    options.modelPath = model.modelPath;
    options.maxTokens = model.getIntConfigValue(ConfigKey::MAX_TOKENS, kDefaultMaxToken);
    options.preferredBackend = PreferredBackend::GPU;
    Accelerator parsedAccelerator;
    if (parseAccelerator(accelerator, parsedAccelerator) && parsedAccelerator == Accelerator::CPU) {
        options.preferredBackend = PreferredBackend::CPU;
    }
    options.maxNumImages = model.llmSupportImage ? 1 : 0;

    if (mTaskRuntime == nullptr) {
        LOG(ERROR) << "Failed to initialize LlmInference: task runtime is not available";
        return "LlmInference is not available in this build";
    }

    std::unique_ptr<LlmEngine> engine;
    try {
        engine = mTaskRuntime->createEngine(options);
        auto session = engine->createSession(makeSessionOptions(model));
        model.instance.emplace(TaskRuntimeInstance{std::move(engine), std::move(session)});
    } catch (const std::exception& e) {
        LOG(ERROR) << "Failed to initialize LlmInference: " << e.what();
        if (engine) {
            try {
                engine->close();
            } catch (const std::exception& closeError) {
                LOG(ERROR) << "Failed to close LlmInference engine: " << closeError.what();
            }
        }
        const auto message = cleanUpTaskErrorMessage(e.what());
        return message.empty() ? "Unknown error initializing LlmInference" : message;
    }
    LOG(DEBUG) << "LlmInference initialized successfully for " << accelerator << " ("
               << getPreferredBackendName(options.preferredBackend) << ").";
    return "";
}

LlmSessionOptions LlmChatModelHelper::makeSessionOptions(const Model& model) const {
    LlmSessionOptions options;
    options.topK = model.getIntConfigValue(ConfigKey::TOPK, kDefaultTopK);
    options.topP = model.getFloatConfigValue(ConfigKey::TOPP, kDefaultTopP);
    options.temperature = model.getFloatConfigValue(ConfigKey::TEMPERATURE, kDefaultTemperature);
    options.enableVisionModality = model.llmSupportImage;
    return options;
}

void LlmChatModelHelper::resetSession(Model& model) {
    LOG(DEBUG) << "Resetting session for model '" << model.name << "'";
    if (!model.instance) {
        return;
    }

    std::visit(Overloaded{
                   [&](TaskRuntimeInstance& instance) {
                       if (!instance.engine) {
                           LOG(ERROR) << "LlmInference engine of '" << model.name
                                      << "' is gone. Unable to create a new session.";
                           return;
                       }
                       try {
                           if (instance.session) {
                               instance.session->close();
                               instance.session.reset();
                           }
                           instance.session =
                               instance.engine->createSession(makeSessionOptions(model));
                       } catch (const std::exception& e) {
                           LOG(ERROR) << "Failed to reset LlmInference session of '"
                                      << model.name << "': " << e.what();
                           instance.session.reset();
                           return;
                       }
                       LOG(DEBUG) << "LlmInference session reset.";
                   },
                   [&](NativeEngineWrapper&) {
                       LOG(INFO) << "Resetting session is not applicable for GenieWrapper. Model: "
                                 << model.name;
                   },
               },
               *model.instance);
    LOG(DEBUG) << "Resetting done";
}

void LlmChatModelHelper::cleanUp(Model& model) {
    if (!model.instance) {
        return;
    }
    LOG(DEBUG) << "Cleaning up model '" << model.name << "' with instance type "
               << getModelInstanceTypeName(*model.instance);

    try {
        std::visit(Overloaded{
                       [](TaskRuntimeInstance& instance) {
                           if (instance.session) {
                               instance.session->close();
                           }
                           if (instance.engine) {
                               instance.engine->close();
                           }
                           LOG(DEBUG) << "LlmInference instance cleaned up.";
                       },
                       [](NativeEngineWrapper& wrapper) {
                           wrapper.close();
                           LOG(DEBUG) << "GenieWrapper instance cleaned up.";
                       },
                   },
                   *model.instance);
    } catch (const std::exception& e) {
        LOG(ERROR) << "Error during cleanUp for model " << model.name << ": " << e.what();
    }

    model.instance.reset();

    CleanUpListener onCleanUp;
    {
        std::lock_guard<std::mutex> lock(mCleanUpListenersMutex);
        const auto it = mCleanUpListeners.find(model.name);
        if (it != mCleanUpListeners.end()) {
            onCleanUp = std::move(it->second);
            mCleanUpListeners.erase(it);
        }
    }
    if (onCleanUp) {
        onCleanUp();
    }
    LOG(DEBUG) << "Clean up process finished for model '" << model.name << "'.";
}

void LlmChatModelHelper::runInference(Model& model, const std::string& input,
                                      const ResultListener& resultListener,
                                      const CleanUpListener& cleanUpListener, const Image* image) {
    if (!model.instance) {
        LOG(ERROR) << "Model instance is null for " << model.name << ". Cannot run inference.";
        resultListener("Error: Model not initialized or already cleaned up.", true);
        return;
    }

    if (cleanUpListener) {
        std::lock_guard<std::mutex> lock(mCleanUpListenersMutex);
        mCleanUpListeners.emplace(model.name, cleanUpListener);
    }

    LOG(DEBUG) << "Running inference for model '" << model.name << "' with instance "
               << getModelInstanceTypeName(*model.instance);
    std::visit(Overloaded{
                   [&](TaskRuntimeInstance& instance) {
                       runTaskRuntimeInference(model, instance, input, resultListener, image);
                   },
                   [&](NativeEngineWrapper& wrapper) {
                       runNativeEngineInference(model, wrapper, input, resultListener, image);
                   },
               },
               *model.instance);
}

bool LlmChatModelHelper::hasPendingCleanUpListener(const std::string& modelName) const {
    std::lock_guard<std::mutex> lock(mCleanUpListenersMutex);
    return mCleanUpListeners.find(modelName) != mCleanUpListeners.end();
}

void LlmChatModelHelper::runTaskRuntimeInference(const Model& model,
                                                 TaskRuntimeInstance& instance,
                                                 const std::string& input,
                                                 const ResultListener& resultListener,
                                                 const Image* image) {
    if (!instance.session) {
        resultListener("Error: LlmInference session is null.", true);
        return;
    }
    // Set once the final result went out. Shared with the listener the runtime may call later.
    auto finished = std::make_shared<std::atomic<bool>>(false);
    try {
        // The text chunk has to be added before the image.
        instance.session->addQueryChunk(input);
        if (image != nullptr) {
            if (model.llmSupportImage) {
                instance.session->addImage(image_utils::prepareVisionInput(*image));
            } else {
                LOG(WARN) << "Model '" << model.name
                          << "' does not support image input. Image will be ignored.";
            }
        }
        instance.session->generateResponseAsync(
            [resultListener, finished, modelName = model.name](const std::string& partialResult,
                                                              const bool done) {
                if (finished->load()) {
                    LOG(WARN) << "Dropping result received after the response of " << modelName
                              << " has ended";
                    return;
                }
                if (done && finished->exchange(true))
                    return;
                resultListener(partialResult, done);
            });
    } catch (const std::exception& e) {
        LOG(ERROR) << "Failed to run LlmInference for model " << model.name << ": " << e.what();
        if (finished->exchange(true)) {
            // The final result is already out, e.g. the listener itself threw on it.
            return;
        }
        resultListener("Error: " + cleanUpTaskErrorMessage(e.what()), true);
        return;
    }
    LOG(DEBUG) << "LlmInference.generateResponseAsync called.";
}

void LlmChatModelHelper::runNativeEngineInference(const Model& model,
                                                  NativeEngineWrapper& wrapper,
                                                  const std::string& input,
                                                  const ResultListener& resultListener,
                                                  const Image* image) {
    if (image != nullptr) {
        LOG(WARN) << "GenieWrapper currently does not support image input. Image will be ignored.";
    }
    ResultListenerCallback callback(model.name, resultListener);
    try {
        wrapper.getResponseForPrompt(input, callback);
    } catch (const std::exception& e) {
        callback.onError(e.what());
    }
    if (!callback.isDone()) {
        LOG(WARN) << "Genie returned without signaling the end of the response. "
                     "Treating it as complete.";
        callback.onComplete();
    }
    LOG(DEBUG) << "GenieWrapper.getResponseForPrompt called.";
}

} // namespace llmchat
