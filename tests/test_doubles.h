#pragma once

#include "llmchat/backend/native_engine.h"
#include "llmchat/backend/task_runtime.h"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace llmchat::test_doubles {

// Everything the fake task runtime saw, shared by the runtime and all objects it created.
struct TaskRuntimeRecord {
    // Failure injection
    std::string createEngineError;
    std::string createSessionError;
    std::string addQueryChunkError;
    std::string generateError;

    // Scripted response, delivered synchronously from generateResponseAsync()
    std::vector<std::string> responseChunks = {"Hello", " world"};

    std::vector<LlmInferenceOptions> engineOptions;
    std::vector<LlmSessionOptions> sessionOptions;
    std::vector<std::string> queryChunks;
    std::vector<Image> images;
    std::vector<std::string> events;
    int sessionsCreated = 0;
    int sessionsClosed = 0;
    int enginesClosed = 0;
};

class FakeLlmSession : public LlmSession {
public:
    FakeLlmSession(std::shared_ptr<TaskRuntimeRecord> record, const int id)
        : mRecord(std::move(record)), kId(id) {}

    void addQueryChunk(const std::string& text) override {
        mRecord->events.push_back("addQueryChunk");
        if (!mRecord->addQueryChunkError.empty())
            throw TaskRuntimeError(mRecord->addQueryChunkError);
        mRecord->queryChunks.push_back(text);
    }

    void addImage(const Image& image) override {
        mRecord->events.push_back("addImage");
        mRecord->images.push_back(image);
    }

    void generateResponseAsync(ResultListener listener) override {
        mRecord->events.push_back("generateResponseAsync");
        if (!mRecord->generateError.empty())
            throw TaskRuntimeError(mRecord->generateError);
        const auto& chunks = mRecord->responseChunks;
        for (size_t i = 0; i < chunks.size(); i++) {
            listener(chunks[i], i + 1 == chunks.size());
        }
    }

    void close() override {
        if (mClosed)
            return;
        mClosed = true;
        mRecord->sessionsClosed++;
        mRecord->events.push_back("closeSession" + std::to_string(kId));
    }

    bool isClosed() const { return mClosed; }

private:
    std::shared_ptr<TaskRuntimeRecord> mRecord;
    const int kId;
    bool mClosed = false;
};

class FakeLlmEngine : public LlmEngine {
public:
    explicit FakeLlmEngine(std::shared_ptr<TaskRuntimeRecord> record)
        : mRecord(std::move(record)) {}

    std::unique_ptr<LlmSession> createSession(const LlmSessionOptions& options) override {
        mRecord->sessionOptions.push_back(options);
        if (!mRecord->createSessionError.empty())
            throw TaskRuntimeError(mRecord->createSessionError);
        const int id = ++mRecord->sessionsCreated;
        mRecord->events.push_back("createSession" + std::to_string(id));
        return std::make_unique<FakeLlmSession>(mRecord, id);
    }

    void close() override {
        mRecord->enginesClosed++;
        mRecord->events.push_back("closeEngine");
    }

private:
    std::shared_ptr<TaskRuntimeRecord> mRecord;
};

class FakeTaskRuntime : public TaskRuntime {
public:
    std::unique_ptr<LlmEngine> createEngine(const LlmInferenceOptions& options) override {
        record->engineOptions.push_back(options);
        if (!record->createEngineError.empty())
            throw TaskRuntimeError(record->createEngineError);
        return std::make_unique<FakeLlmEngine>(record);
    }

    std::shared_ptr<TaskRuntimeRecord> record = std::make_shared<TaskRuntimeRecord>();
};

// Scripted native engine. Handles are small positive integers.
class FakeNativeEngineApi : public NativeEngineApi {
public:
    enum class Ending {
        COMPLETE,
        ERROR,
        NONE,           // Returns without a terminal callback
        ERROR_THEN_MORE // Reports an error, then keeps streaming and completes
    };

    NativeHandle loadModel(const std::string& modelDirPath,
                           const std::string& htpConfigPath) override {
        loadedPaths.emplace_back(modelDirPath, htpConfigPath);
        if (failLoad)
            return kInvalidNativeHandle;
        const NativeHandle handle = ++mLastHandle;
        liveHandles[handle] = modelDirPath;
        return handle;
    }

    void getResponseForPrompt(const NativeHandle nativeHandle, const std::string& userInput,
                              StringCallback& callback) override {
        prompts.push_back(userInput);
        promptHandles.push_back(nativeHandle);
        if (throwOnPrompt)
            throw NativeEngineError("engine exploded");
        for (const auto& token : tokens) {
            callback.onResponse(token);
        }
        switch (ending) {
            case Ending::COMPLETE:
                callback.onComplete();
                break;
            case Ending::ERROR:
                callback.onError(errorMessage);
                break;
            case Ending::NONE:
                break;
            case Ending::ERROR_THEN_MORE:
                callback.onError(errorMessage);
                callback.onResponse("late");
                callback.onComplete();
                break;
        }
    }

    void freeModel(const NativeHandle nativeHandle) override {
        freedHandles.push_back(nativeHandle);
        liveHandles.erase(nativeHandle);
        if (throwOnFree)
            throw NativeEngineError("free failed");
    }

    bool failLoad = false;
    bool throwOnPrompt = false;
    bool throwOnFree = false;
    std::vector<std::string> tokens = {"Hi", " there"};
    Ending ending = Ending::COMPLETE;
    std::string errorMessage = "context exceeded";

    std::vector<std::pair<std::string, std::string>> loadedPaths;
    std::vector<std::string> prompts;
    std::vector<NativeHandle> promptHandles;
    std::vector<NativeHandle> freedHandles;
    std::map<NativeHandle, std::string> liveHandles;

private:
    NativeHandle mLastHandle = kInvalidNativeHandle;
};

// Collects everything delivered to a ResultListener.
struct ResultCollector {
    ResultListener listener() {
        return [this](const std::string& partialResult, const bool done) {
            results.emplace_back(partialResult, done);
        };
    }

    int doneCount() const {
        int count = 0;
        for (const auto& result : results) {
            if (result.second)
                count++;
        }
        return count;
    }

    std::string text() const {
        std::string all;
        for (const auto& result : results) {
            all += result.first;
        }
        return all;
    }

    std::vector<std::pair<std::string, bool>> results;
};

// Collects the StringCallback events of a native engine call.
class RecordingStringCallback : public StringCallback {
public:
    void onResponse(const std::string& token) override { tokens.push_back(token); }
    void onError(const std::string& errorMessage) override { errors.push_back(errorMessage); }
    void onComplete() override { completions++; }

    std::vector<std::string> tokens;
    std::vector<std::string> errors;
    int completions = 0;
};

} // namespace llmchat::test_doubles
