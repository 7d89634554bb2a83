#pragma once

#include "llmchat/backend/native_engine.h"

#include <string>

namespace llmchat {

constexpr char kGenieConfigFileName[] = "genie_config.json";

// NativeEngineApi over the Qualcomm Genie dialog C API.
//
// A model bundle directory holds genie_config.json, the tokenizer and the context binaries.
// Paths inside the config are taken relative to that directory.
class GenieEngineApi : public NativeEngineApi {
public:
    NativeHandle loadModel(const std::string& modelDirPath,
                           const std::string& htpConfigPath) override;

    void getResponseForPrompt(const NativeHandle nativeHandle, const std::string& userInput,
                              StringCallback& callback) override;

    void freeModel(const NativeHandle nativeHandle) override;

    // Rewrites the bundle's config so that it can be loaded from any working directory.
    // Throws NativeEngineError if a required entry is missing.
    static std::string prepareDialogConfig(const std::string& configJson,
                                           const std::string& modelDirPath,
                                           const std::string& htpConfigPath);
};

} // namespace llmchat
