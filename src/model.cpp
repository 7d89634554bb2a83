#include "llmchat/model.h"

#include "common/overloaded.h"
#include "llmchat/common/logging.h"

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <strings.h>

namespace fs = std::filesystem;

namespace llmchat {

namespace {

constexpr char kDefaultHtpConfigName[] = "htp_backend_ext_config.json";

} // namespace

const char* getConfigKeyLabel(const ConfigKey key) {
#define RETURN_LABEL(type, label) \
    case ConfigKey::type:         \
        return label;

    switch (key) {
        RETURN_LABEL(MAX_TOKENS, "Max tokens")
        RETURN_LABEL(TOPK, "TopK")
        RETURN_LABEL(TOPP, "TopP")
        RETURN_LABEL(TEMPERATURE, "Temperature")
        RETURN_LABEL(ACCELERATOR, "Choose accelerator")
    }

#undef RETURN_LABEL
    return "";
}

const char* getConfigKeyYamlName(const ConfigKey key) {
#define RETURN_YAML_NAME(type, name) \
    case ConfigKey::type:            \
        return name;

    switch (key) {
        RETURN_YAML_NAME(MAX_TOKENS, "maxTokens")
        RETURN_YAML_NAME(TOPK, "topK")
        RETURN_YAML_NAME(TOPP, "topP")
        RETURN_YAML_NAME(TEMPERATURE, "temperature")
        RETURN_YAML_NAME(ACCELERATOR, "accelerator")
    }

#undef RETURN_YAML_NAME
    return "";
}

bool getConfigKeyFromYamlName(const std::string& yamlName, ConfigKey& key) {
#define MATCH_YAML_NAME(type)                              \
    if (yamlName == getConfigKeyYamlName(ConfigKey::type)) { \
        key = ConfigKey::type;                             \
        return true;                                       \
    }

    MATCH_YAML_NAME(MAX_TOKENS)
    MATCH_YAML_NAME(TOPK)
    MATCH_YAML_NAME(TOPP)
    MATCH_YAML_NAME(TEMPERATURE)
    MATCH_YAML_NAME(ACCELERATOR)

#undef MATCH_YAML_NAME
    return false;
}

const char* getAcceleratorLabel(const Accelerator accelerator) {
    switch (accelerator) {
        case Accelerator::CPU:
            return "CPU";
        case Accelerator::GPU:
            return "GPU";
        case Accelerator::GENIE:
            return "Genie";
    }
    return "";
}

bool parseAccelerator(const std::string& label, Accelerator& accelerator) {
    for (const auto candidate : {Accelerator::CPU, Accelerator::GPU, Accelerator::GENIE}) {
        if (!strcasecmp(label.c_str(), getAcceleratorLabel(candidate))) {
            accelerator = candidate;
            return true;
        }
    }
    return false;
}

const char* getModelInstanceTypeName(const ModelInstance& instance) {
    return std::visit(Overloaded{
                          [](const TaskRuntimeInstance&) { return "TaskRuntimeInstance"; },
                          [](const NativeEngineWrapper&) { return "NativeEngineWrapper"; },
                      },
                      instance);
}

int Model::getIntConfigValue(const ConfigKey key, const int defaultValue) const {
    const auto it = configValues.find(key);
    if (it == configValues.end()) {
        return defaultValue;
    }
    return std::visit(Overloaded{
                          [](const int value) { return value; },
                          [](const float value) { return static_cast<int>(value); },
                          [&](const std::string& value) {
                              try {
                                  return std::stoi(value);
                              } catch (const std::logic_error&) {
                                  LOG(WARN) << "Config '" << getConfigKeyLabel(key)
                                            << "' of model '" << name << "' is not an integer: "
                                            << value;
                                  return defaultValue;
                              }
                          },
                      },
                      it->second);
}

float Model::getFloatConfigValue(const ConfigKey key, const float defaultValue) const {
    const auto it = configValues.find(key);
    if (it == configValues.end()) {
        return defaultValue;
    }
    return std::visit(Overloaded{
                          [](const int value) { return static_cast<float>(value); },
                          [](const float value) { return value; },
                          [&](const std::string& value) {
                              try {
                                  return std::stof(value);
                              } catch (const std::logic_error&) {
                                  LOG(WARN) << "Config '" << getConfigKeyLabel(key)
                                            << "' of model '" << name << "' is not a number: "
                                            << value;
                                  return defaultValue;
                              }
                          },
                      },
                      it->second);
}

std::string Model::getStringConfigValue(const ConfigKey key,
                                        const std::string& defaultValue) const {
    const auto it = configValues.find(key);
    if (it == configValues.end()) {
        return defaultValue;
    }
    return std::visit(Overloaded{
                          [](const int value) { return std::to_string(value); },
                          [](const float value) {
                              std::ostringstream stream;
                              stream << value;
                              return stream.str();
                          },
                          [](const std::string& value) { return value; },
                      },
                      it->second);
}

std::string Model::getGenieModelDir() const {
    if (!genieModelDir.empty()) {
        return genieModelDir;
    }
    return fs::path(modelPath).parent_path().string();
}

std::string Model::getHtpConfigPath() const {
    if (!htpConfigPath.empty()) {
        return htpConfigPath;
    }
    return (fs::path(getGenieModelDir()) / kDefaultHtpConfigName).string();
}

} // namespace llmchat
