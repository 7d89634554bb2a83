#pragma once

#include "llmchat/backend/native_engine.h"
#include "llmchat/backend/task_runtime.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace llmchat {

constexpr int kDefaultMaxToken = 1024;
constexpr int kDefaultTopK = 40;
constexpr float kDefaultTopP = 0.9f;
constexpr float kDefaultTemperature = 1.0f;

enum class ConfigKey {
    MAX_TOKENS,
    TOPK,
    TOPP,
    TEMPERATURE,
    ACCELERATOR
};

// Human readable label, e.g. "Max tokens".
const char* getConfigKeyLabel(const ConfigKey key);

// Key used in the YAML model list, e.g. "maxTokens".
const char* getConfigKeyYamlName(const ConfigKey key);

// Returns false if `yamlName` is not a known config key.
bool getConfigKeyFromYamlName(const std::string& yamlName, ConfigKey& key);

enum class Accelerator {
    CPU,
    GPU,
    GENIE
};

const char* getAcceleratorLabel(const Accelerator accelerator);

// Case-insensitive. Returns false for an unknown label.
bool parseAccelerator(const std::string& label, Accelerator& accelerator);

using ConfigValue = std::variant<int, float, std::string>;

// Task runtime variant of a model instance: one engine plus a replaceable session.
struct TaskRuntimeInstance {
    std::unique_ptr<LlmEngine> engine;
    std::unique_ptr<LlmSession> session; // Null or a single live session
};

using ModelInstance = std::variant<TaskRuntimeInstance, NativeEngineWrapper>;

const char* getModelInstanceTypeName(const ModelInstance& instance);

struct Model {
    std::string name;
    std::string modelPath;     // Task runtime model file
    std::string genieModelDir; // Native engine model bundle. Defaults to modelPath's directory.
    std::string htpConfigPath; // Defaults to <genieModelDir>/htp_backend_ext_config.json
    bool llmSupportImage = false;
    std::map<ConfigKey, ConfigValue> configValues;

    // Attached runtime, if initialized
    std::optional<ModelInstance> instance;

    int getIntConfigValue(const ConfigKey key, const int defaultValue) const;

    float getFloatConfigValue(const ConfigKey key, const float defaultValue) const;

    std::string getStringConfigValue(const ConfigKey key, const std::string& defaultValue) const;

    std::string getGenieModelDir() const;

    std::string getHtpConfigPath() const;
};

} // namespace llmchat
