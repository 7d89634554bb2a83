#include "backend/genie_response_stream.h"

#include "llmchat/common/logging.h"

#include <exception>

namespace llmchat {

void GenieResponseStream::onFragment(const char* fragment) {
    if (fragment == nullptr || mFinished || !mCallbackError.empty()) {
        return;
    }
    try {
        if (mUtf8Resolver.addBytes(fragment) && mUtf8Resolver.hasResolved()) {
            mCallback.onResponse(mUtf8Resolver.getResolvedStr());
        }
    } catch (const std::exception& e) {
        mCallbackError = e.what();
        if (mCallbackError.empty())
            mCallbackError = "Response callback failed";
        LOG(ERROR) << "Response callback failed. Ignoring the rest of the response.";
    }
}

void GenieResponseStream::finish(const std::string& queryError) {
    if (mFinished) {
        LOG(WARN) << "Genie response already finished";
        return;
    }
    mFinished = true;

    if (!mCallbackError.empty()) {
        mCallback.onError(mCallbackError);
        return;
    }
    if (!queryError.empty()) {
        mCallback.onError(queryError);
        return;
    }
    if (mAborted) {
        mCallback.onError("Genie query was aborted");
        return;
    }
    // A truncated multibyte sequence is not valid UTF-8 and must not reach the callback.
    const auto tail = mUtf8Resolver.flush();
    if (!tail.empty()) {
        LOG(WARN) << "Dropping an incomplete UTF-8 sequence of " << tail.size()
                  << " bytes at the end of the response";
    }
    mCallback.onComplete();
}

} // namespace llmchat
