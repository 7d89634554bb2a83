#pragma once

#include "llmchat/backend/native_engine.h"
#include "utils/utils.h"

#include <string>

namespace llmchat {

// Turns the sentence fragments of one Genie dialog query into StringCallback events.
//
// Only whole UTF-8 code points reach onResponse(). Exceptions thrown by the callback are held
// back until finish(), since fragments arrive from inside the C library. finish() sends exactly
// one terminal event.
class GenieResponseStream {
public:
    explicit GenieResponseStream(StringCallback& callback) : mCallback(callback) {}

    GenieResponseStream(const GenieResponseStream&) = delete;
    GenieResponseStream& operator=(const GenieResponseStream&) = delete;

    void onFragment(const char* fragment);

    void onAbort() { mAborted = true; }

    // `queryError` is empty if the query call itself succeeded.
    void finish(const std::string& queryError);

    bool isFinished() const { return mFinished; }

private:
    StringCallback& mCallback;
    utils::UTF8CharResolver mUtf8Resolver;
    std::string mCallbackError;
    bool mAborted = false;
    bool mFinished = false;
};

} // namespace llmchat
