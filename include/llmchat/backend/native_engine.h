#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace llmchat {

// Opaque integer identifying a resource owned by the native engine.
using NativeHandle = int64_t;

constexpr NativeHandle kInvalidNativeHandle = 0;

class NativeEngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Streaming sink of the native engine. One of onError/onComplete ends each request.
class StringCallback {
public:
    virtual ~StringCallback() {}
    virtual void onResponse(const std::string& token) = 0;
    virtual void onError(const std::string& errorMessage) = 0;
    virtual void onComplete() = 0;
};

// The three-entry handle ABI of the native inference engine.
class NativeEngineApi {
public:
    virtual ~NativeEngineApi() {}

    // Returns kInvalidNativeHandle on failure.
    virtual NativeHandle loadModel(const std::string& modelDirPath,
                                   const std::string& htpConfigPath) = 0;

    // Blocks until the response has ended. The callback may be invoked from another thread but
    // is not used after this returns.
    virtual void getResponseForPrompt(const NativeHandle nativeHandle, const std::string& userInput,
                                      StringCallback& callback) = 0;

    virtual void freeModel(const NativeHandle nativeHandle) = 0;
};

// Owns one native handle for the lifetime of the object.
//
// Construction loads the model and throws NativeEngineError if the engine hands back a zero
// handle. After close() the handle is zero and every further call is a guarded no-op.
class NativeEngineWrapper {
public:
    NativeEngineWrapper(NativeEngineApi& api, const std::string& modelDirPath,
                        const std::string& htpConfigPath);

    ~NativeEngineWrapper();

    NativeEngineWrapper(NativeEngineWrapper&& other) noexcept;
    NativeEngineWrapper& operator=(NativeEngineWrapper&& other) noexcept;

    NativeEngineWrapper(const NativeEngineWrapper&) = delete;
    NativeEngineWrapper& operator=(const NativeEngineWrapper&) = delete;

    // Generates a response for the given input, tunneling each token to the callback.
    // On a released wrapper the callback receives onError() and the engine is not called.
    void getResponseForPrompt(const std::string& userInput, StringCallback& callback);

    // Frees the loaded model. Safe to call more than once.
    void close();

    bool isLoaded() const { return mNativeHandle != kInvalidNativeHandle; }

    NativeHandle getNativeHandle() const { return mNativeHandle; }

private:
    NativeEngineApi* mApi;
    NativeHandle mNativeHandle = kInvalidNativeHandle;
};

} // namespace llmchat
