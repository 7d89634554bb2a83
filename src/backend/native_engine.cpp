#include "llmchat/backend/native_engine.h"

#include "llmchat/common/logging.h"

#include <exception>
#include <utility>

namespace llmchat {

NativeEngineWrapper::NativeEngineWrapper(NativeEngineApi& api, const std::string& modelDirPath,
                                         const std::string& htpConfigPath)
    : mApi(&api) {
    mNativeHandle = mApi->loadModel(modelDirPath, htpConfigPath);
    if (mNativeHandle == kInvalidNativeHandle) {
        throw NativeEngineError("Failed to load native model. Handle: " +
                                std::to_string(mNativeHandle));
    }
    LOG(DEBUG) << "Loaded native model " << modelDirPath << " (handle=" << mNativeHandle << ")";
}

NativeEngineWrapper::~NativeEngineWrapper() {
    if (mNativeHandle == kInvalidNativeHandle) {
        return;
    }
    LOG(WARN) << "NativeEngineWrapper destroyed without close(). Releasing handle "
              << mNativeHandle;
    try {
        close();
    } catch (const std::exception& e) {
        LOG(ERROR) << "Failed to free native model on destruction: " << e.what();
    }
}

NativeEngineWrapper::NativeEngineWrapper(NativeEngineWrapper&& other) noexcept
    : mApi(other.mApi), mNativeHandle(std::exchange(other.mNativeHandle, kInvalidNativeHandle)) {}

NativeEngineWrapper& NativeEngineWrapper::operator=(NativeEngineWrapper&& other) noexcept {
    if (this != &other) {
        try {
            close();
        } catch (const std::exception& e) {
            LOG(ERROR) << "Failed to free native model on reassignment: " << e.what();
        }
        mApi = other.mApi;
        mNativeHandle = std::exchange(other.mNativeHandle, kInvalidNativeHandle);
    }
    return *this;
}

void NativeEngineWrapper::getResponseForPrompt(const std::string& userInput,
                                               StringCallback& callback) {
    if (mNativeHandle == kInvalidNativeHandle) {
        LOG(ERROR) << "getResponseForPrompt called on a released native model";
        callback.onError("Native model not loaded or handle is invalid.");
        return;
    }
    mApi->getResponseForPrompt(mNativeHandle, userInput, callback);
}

void NativeEngineWrapper::close() {
    if (mNativeHandle == kInvalidNativeHandle) {
        return;
    }
    // Zeroed before freeModel() in case it throws.
    const auto handle = std::exchange(mNativeHandle, kInvalidNativeHandle);
    mApi->freeModel(handle);
    LOG(DEBUG) << "Freed native model handle " << handle;
}

} // namespace llmchat
