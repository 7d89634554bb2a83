#include "llmchat/backend/native_engine.h"

#include "test_doubles.h"

#include <gtest/gtest.h>

#include <string>
#include <utility>

using namespace llmchat;
using test_doubles::FakeNativeEngineApi;
using test_doubles::RecordingStringCallback;

namespace {

TEST(NativeEngineWrapperTest, LoadsModelOnConstruction) {
    FakeNativeEngineApi api;
    NativeEngineWrapper wrapper(api, "/bundle", "/bundle/htp.json");
    EXPECT_TRUE(wrapper.isLoaded());
    EXPECT_NE(wrapper.getNativeHandle(), kInvalidNativeHandle);
    ASSERT_EQ(api.loadedPaths.size(), 1u);
    EXPECT_EQ(api.loadedPaths[0].first, "/bundle");
    EXPECT_EQ(api.loadedPaths[0].second, "/bundle/htp.json");
    wrapper.close();
}

TEST(NativeEngineWrapperTest, ZeroHandleThrows) {
    FakeNativeEngineApi api;
    api.failLoad = true;
    try {
        NativeEngineWrapper wrapper(api, "/bundle", "/htp.json");
        FAIL() << "Construction should have failed";
    } catch (const NativeEngineError& e) {
        EXPECT_EQ(std::string(e.what()), "Failed to load native model. Handle: 0");
    }
    EXPECT_TRUE(api.freedHandles.empty());
}

TEST(NativeEngineWrapperTest, ForwardsPromptWithHandle) {
    FakeNativeEngineApi api;
    NativeEngineWrapper wrapper(api, "/bundle", "/htp.json");
    RecordingStringCallback callback;
    wrapper.getResponseForPrompt("Hello?", callback);

    ASSERT_EQ(api.prompts.size(), 1u);
    EXPECT_EQ(api.prompts[0], "Hello?");
    EXPECT_EQ(api.promptHandles[0], wrapper.getNativeHandle());
    EXPECT_EQ(callback.tokens, (std::vector<std::string>{"Hi", " there"}));
    EXPECT_EQ(callback.completions, 1);
    EXPECT_TRUE(callback.errors.empty());
    wrapper.close();
}

TEST(NativeEngineWrapperTest, CloseIsIdempotent) {
    FakeNativeEngineApi api;
    NativeEngineWrapper wrapper(api, "/bundle", "/htp.json");
    const auto handle = wrapper.getNativeHandle();
    wrapper.close();
    wrapper.close();
    EXPECT_FALSE(wrapper.isLoaded());
    EXPECT_EQ(wrapper.getNativeHandle(), kInvalidNativeHandle);
    EXPECT_EQ(api.freedHandles, (std::vector<NativeHandle>{handle}));
}

TEST(NativeEngineWrapperTest, CallAfterCloseReportsErrorWithoutEngineCall) {
    FakeNativeEngineApi api;
    NativeEngineWrapper wrapper(api, "/bundle", "/htp.json");
    wrapper.close();

    RecordingStringCallback callback;
    wrapper.getResponseForPrompt("Hello?", callback);
    EXPECT_TRUE(api.prompts.empty());
    EXPECT_EQ(callback.errors,
              (std::vector<std::string>{"Native model not loaded or handle is invalid."}));
    EXPECT_EQ(callback.completions, 0);
}

TEST(NativeEngineWrapperTest, DestructorFreesUnclosedHandle) {
    FakeNativeEngineApi api;
    NativeHandle handle = kInvalidNativeHandle;
    {
        NativeEngineWrapper wrapper(api, "/bundle", "/htp.json");
        handle = wrapper.getNativeHandle();
    }
    EXPECT_EQ(api.freedHandles, (std::vector<NativeHandle>{handle}));
    EXPECT_TRUE(api.liveHandles.empty());
}

TEST(NativeEngineWrapperTest, DestructorSwallowsFreeFailure) {
    FakeNativeEngineApi api;
    api.throwOnFree = true;
    EXPECT_NO_THROW(NativeEngineWrapper(api, "/bundle", "/htp.json"));
    EXPECT_EQ(api.freedHandles.size(), 1u);
}

TEST(NativeEngineWrapperTest, FailedCloseStillReleasesHandle) {
    FakeNativeEngineApi api;
    api.throwOnFree = true;
    NativeEngineWrapper wrapper(api, "/bundle", "/htp.json");
    EXPECT_THROW(wrapper.close(), NativeEngineError);
    EXPECT_FALSE(wrapper.isLoaded());
    EXPECT_NO_THROW(wrapper.close());
    EXPECT_EQ(api.freedHandles.size(), 1u);
}

TEST(NativeEngineWrapperTest, MoveTransfersOwnership) {
    FakeNativeEngineApi api;
    NativeEngineWrapper first(api, "/first", "/htp.json");
    const auto firstHandle = first.getNativeHandle();

    NativeEngineWrapper moved(std::move(first));
    EXPECT_FALSE(first.isLoaded());
    EXPECT_EQ(moved.getNativeHandle(), firstHandle);

    NativeEngineWrapper second(api, "/second", "/htp.json");
    const auto secondHandle = second.getNativeHandle();
    second = std::move(moved);
    EXPECT_EQ(second.getNativeHandle(), firstHandle);
    EXPECT_EQ(api.freedHandles, (std::vector<NativeHandle>{secondHandle}));

    second.close();
    EXPECT_TRUE(api.liveHandles.empty());
}

} // namespace
