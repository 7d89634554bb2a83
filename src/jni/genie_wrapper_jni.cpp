#include "llmchat/backend/genie_engine.h"
#include "llmchat/common/logging.h"

#include <jni.h>

#include <string>

using llmchat::GenieEngineApi;
using llmchat::kInvalidNativeHandle;
using llmchat::NativeHandle;

namespace {

GenieEngineApi genieEngineApi;

class JStringWrapper {
public:
    JStringWrapper(JNIEnv* env, jstring str) : mEnv(env), mJString(str), mCStr(nullptr) {
        if (str) {
            mCStr = env->GetStringUTFChars(str, nullptr);
        }
    }

    ~JStringWrapper() {
        if (mCStr) {
            mEnv->ReleaseStringUTFChars(mJString, mCStr);
        }
    }

    JStringWrapper(const JStringWrapper&) = delete;
    JStringWrapper& operator=(const JStringWrapper&) = delete;

    std::string str() const { return mCStr ? mCStr : ""; }
    bool isValid() const { return mCStr != nullptr; }

private:
    JNIEnv* mEnv;
    jstring mJString;
    const char* mCStr;
};

// Forwards to a Java StringCallback. Only valid on the thread that owns `env`.
class JavaStringCallback : public llmchat::StringCallback {
public:
    JavaStringCallback(JNIEnv* env, jobject callback) : mEnv(env), mCallback(callback) {
        jclass callbackClass = env->GetObjectClass(callback);
        mOnResponse = env->GetMethodID(callbackClass, "onResponse", "(Ljava/lang/String;)V");
        mOnError = env->GetMethodID(callbackClass, "onError", "(Ljava/lang/String;)V");
        mOnComplete = env->GetMethodID(callbackClass, "onComplete", "()V");
        env->DeleteLocalRef(callbackClass);
        mStringClass = env->FindClass("java/lang/String");
        if (mStringClass != nullptr) {
            mStringFromBytes = env->GetMethodID(mStringClass, "<init>", "([BLjava/lang/String;)V");
            mCharsetName = env->NewStringUTF("UTF-8");
        }
        mJavaExceptionPending = env->ExceptionCheck();
    }

    ~JavaStringCallback() {
        if (mCharsetName)
            mEnv->DeleteLocalRef(mCharsetName);
        if (mStringClass)
            mEnv->DeleteLocalRef(mStringClass);
    }

    JavaStringCallback(const JavaStringCallback&) = delete;
    JavaStringCallback& operator=(const JavaStringCallback&) = delete;

    bool isValid() const { return !mJavaExceptionPending; }

    void onResponse(const std::string& token) override { callWithString(mOnResponse, token); }

    void onError(const std::string& errorMessage) override {
        callWithString(mOnError, errorMessage);
    }

    void onComplete() override {
        if (mJavaExceptionPending)
            return;
        mEnv->CallVoidMethod(mCallback, mOnComplete);
        mJavaExceptionPending = mEnv->ExceptionCheck();
    }

private:
    void callWithString(jmethodID method, const std::string& value) {
        // A pending Java exception forbids further JNI calls. It is rethrown in Java on return.
        if (mJavaExceptionPending)
            return;
        jstring jValue = newJavaString(value);
        if (jValue == nullptr) {
            mJavaExceptionPending = true;
            return;
        }
        mEnv->CallVoidMethod(mCallback, method, jValue);
        mEnv->DeleteLocalRef(jValue);
        mJavaExceptionPending = mEnv->ExceptionCheck();
    }

    // Decodes standard UTF-8 in Java. NewStringUTF expects Modified UTF-8, which rejects
    // supplementary characters in their 4-byte form.
    jstring newJavaString(const std::string& value) {
        const auto length = static_cast<jsize>(value.size());
        jbyteArray bytes = mEnv->NewByteArray(length);
        if (bytes == nullptr)
            return nullptr;
        mEnv->SetByteArrayRegion(bytes, 0, length, reinterpret_cast<const jbyte*>(value.data()));
        auto jValue = static_cast<jstring>(
            mEnv->NewObject(mStringClass, mStringFromBytes, bytes, mCharsetName));
        mEnv->DeleteLocalRef(bytes);
        return jValue;
    }

private:
    JNIEnv* mEnv;
    jobject mCallback;
    jclass mStringClass = nullptr;
    jmethodID mStringFromBytes = nullptr;
    jstring mCharsetName = nullptr;
    jmethodID mOnResponse = nullptr;
    jmethodID mOnError = nullptr;
    jmethodID mOnComplete = nullptr;
    bool mJavaExceptionPending = false;
};

} // namespace

extern "C" {

JNIEXPORT jlong JNICALL Java_com_quicinc_chatapp_GenieWrapper_loadModel(JNIEnv* env, jobject,
                                                                       jstring modelDirPath,
                                                                       jstring htpConfigPath) {
    const JStringWrapper modelDir(env, modelDirPath);
    const JStringWrapper htpConfig(env, htpConfigPath);
    if (!modelDir.isValid() || !htpConfig.isValid()) {
        LOG(ERROR) << "loadModel: model directory and HTP config path are required";
        return kInvalidNativeHandle;
    }
    try {
        return genieEngineApi.loadModel(modelDir.str(), htpConfig.str());
    } catch (const std::exception& e) {
        LOG(ERROR) << "loadModel failed: " << e.what();
        return kInvalidNativeHandle;
    }
}

JNIEXPORT void JNICALL Java_com_quicinc_chatapp_GenieWrapper_getResponseForPrompt(
    JNIEnv* env, jobject, jlong nativeHandle, jstring userInput, jobject callback) {
    if (callback == nullptr) {
        LOG(ERROR) << "getResponseForPrompt: callback is null";
        return;
    }
    JavaStringCallback javaCallback(env, callback);
    if (!javaCallback.isValid()) {
        LOG(ERROR) << "getResponseForPrompt: callback does not implement StringCallback";
        return;
    }
    const JStringWrapper input(env, userInput);
    try {
        genieEngineApi.getResponseForPrompt(static_cast<NativeHandle>(nativeHandle), input.str(),
                                            javaCallback);
    } catch (const std::exception& e) {
        javaCallback.onError(e.what());
    }
}

JNIEXPORT void JNICALL Java_com_quicinc_chatapp_GenieWrapper_freeModel(JNIEnv*, jobject,
                                                                      jlong nativeHandle) {
    try {
        genieEngineApi.freeModel(static_cast<NativeHandle>(nativeHandle));
    } catch (const std::exception& e) {
        LOG(ERROR) << "freeModel failed: " << e.what();
    }
}

} // extern "C"
