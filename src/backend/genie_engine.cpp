#include "llmchat/backend/genie_engine.h"

#include "backend/genie_response_stream.h"
#include "llmchat/common/logging.h"
#include "llmchat/common/timer.h"

#include "GenieCommon.h"
#include "GenieDialog.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

namespace fs = std::filesystem;

using json = nlohmann::json;

namespace llmchat {

namespace {

// Owns one Genie dialog and its config. Its address is the native handle.
class GenieEngine {
public:
    explicit GenieEngine(const std::string& dialogConfig) {
        auto status = GenieDialogConfig_createFromJson(dialogConfig.c_str(), &mConfigHandle);
        if (status != GENIE_STATUS_SUCCESS) {
            throw NativeEngineError("Failed to create the Genie dialog config. Status: " +
                                    std::to_string(status));
        }
        status = GenieDialog_create(mConfigHandle, &mDialogHandle);
        if (status != GENIE_STATUS_SUCCESS) {
            GenieDialogConfig_free(mConfigHandle);
            throw NativeEngineError("Failed to create the Genie dialog. Status: " +
                                    std::to_string(status));
        }
    }

    ~GenieEngine() {
        if (GenieDialog_free(mDialogHandle) != GENIE_STATUS_SUCCESS) {
            LOG(ERROR) << "Failed to free the Genie dialog";
        }
        if (GenieDialogConfig_free(mConfigHandle) != GENIE_STATUS_SUCCESS) {
            LOG(ERROR) << "Failed to free the Genie dialog config";
        }
    }

    GenieEngine(const GenieEngine&) = delete;
    GenieEngine& operator=(const GenieEngine&) = delete;

    GenieDialog_Handle_t getDialog() const { return mDialogHandle; }

private:
    GenieDialogConfig_Handle_t mConfigHandle = nullptr;
    GenieDialog_Handle_t mDialogHandle = nullptr;
};

GenieEngine* fromNativeHandle(const NativeHandle nativeHandle) {
    return reinterpret_cast<GenieEngine*>(static_cast<intptr_t>(nativeHandle));
}

void onQueryResponse(const char* response, const GenieDialog_SentenceCode_t sentenceCode,
                     const void* userData) {
    auto stream = static_cast<GenieResponseStream*>(const_cast<void*>(userData));
    if (sentenceCode == GENIE_DIALOG_SENTENCE_ABORT) {
        stream->onAbort();
        return;
    }
    stream->onFragment(response);
}

std::string readFile(const std::string& path) {
    std::ifstream fin(path);
    if (!fin) {
        throw NativeEngineError("Unable to open " + path);
    }
    std::stringstream buffer;
    buffer << fin.rdbuf();
    return buffer.str();
}

std::string resolvePath(const fs::path& baseDir, const std::string& path) {
    const fs::path fsPath(path);
    if (fsPath.is_absolute()) {
        return path;
    }
    return (baseDir / fsPath).lexically_normal().string();
}

} // namespace

std::string GenieEngineApi::prepareDialogConfig(const std::string& configJson,
                                                const std::string& modelDirPath,
                                                const std::string& htpConfigPath) {
    const fs::path modelDir(modelDirPath);
    json config;
    try {
        config = json::parse(configJson);
        auto& dialog = config.at("dialog");

        auto& tokenizerPath = dialog.at("tokenizer").at("path");
        tokenizerPath = resolvePath(modelDir, tokenizerPath.get<std::string>());

        auto& engine = dialog.at("engine");
        engine.at("backend")["extensions"] = htpConfigPath;

        auto& ctxBins = engine.at("model").at("binary").at("ctx-bins");
        for (auto& ctxBin : ctxBins) {
            ctxBin = resolvePath(modelDir, ctxBin.get<std::string>());
        }
    } catch (const json::exception& e) {
        throw NativeEngineError(std::string("Invalid Genie config: ") + e.what());
    }
    return config.dump();
}

NativeHandle GenieEngineApi::loadModel(const std::string& modelDirPath,
                                       const std::string& htpConfigPath) {
    Timer timer;
    timer.start();
    LOG(INFO) << "Loading Genie model from " << modelDirPath;
    try {
        const auto configPath = (fs::path(modelDirPath) / kGenieConfigFileName).string();
        const auto dialogConfig =
            prepareDialogConfig(readFile(configPath), modelDirPath, htpConfigPath);
        auto engine = std::make_unique<GenieEngine>(dialogConfig);
        LOG(INFO) << "Done Genie model load. (Time taken: " << timer.reset() << " s)";
        return static_cast<NativeHandle>(reinterpret_cast<intptr_t>(engine.release()));
    } catch (const std::exception& e) {
        LOG(ERROR) << "Failed to load Genie model: " << e.what();
        return kInvalidNativeHandle;
    }
}

void GenieEngineApi::getResponseForPrompt(const NativeHandle nativeHandle,
                                          const std::string& userInput,
                                          StringCallback& callback) {
    if (nativeHandle == kInvalidNativeHandle) {
        callback.onError("Native model not loaded or handle is invalid.");
        return;
    }
    auto engine = fromNativeHandle(nativeHandle);

    GenieResponseStream stream(callback);
    Timer timer;
    timer.start();
    const auto status = GenieDialog_query(engine->getDialog(), userInput.c_str(),
                                          GENIE_DIALOG_SENTENCE_COMPLETE, onQueryResponse,
                                          &stream);
    LOG(DEBUG) << "GenieDialog_query returned " << status << " in " << timer.reset() << " s";

    stream.finish(status == GENIE_STATUS_SUCCESS
                      ? ""
                      : "Failed to get response from Genie. Status: " + std::to_string(status));
}

void GenieEngineApi::freeModel(const NativeHandle nativeHandle) {
    if (nativeHandle == kInvalidNativeHandle) {
        return;
    }
    std::unique_ptr<GenieEngine> engine(fromNativeHandle(nativeHandle));
    engine.reset();
    LOG(DEBUG) << "Freed Genie model";
}

} // namespace llmchat
