#include "llmchat/model_config.h"

#include "llmchat/common/logging.h"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

namespace fs = std::filesystem;

namespace llmchat {

namespace {

const std::unordered_set<std::string> kKnownModelKeys = {
    "name", "modelPath", "genieModelDir", "htpConfigPath", "llmSupportImage", "defaultConfig"};

std::string resolvePath(const fs::path& baseDir, const std::string& path) {
    if (path.empty()) {
        return path;
    }
    const fs::path fsPath(path);
    if (fsPath.is_absolute()) {
        return fsPath.lexically_normal().string();
    }
    return (baseDir / fsPath).lexically_normal().string();
}

ConfigValue parseConfigValue(const ConfigKey key, const YAML::Node& node) {
    switch (key) {
        case ConfigKey::MAX_TOKENS:
        case ConfigKey::TOPK:
            return node.as<int>();
        case ConfigKey::TOPP:
        case ConfigKey::TEMPERATURE:
            return node.as<float>();
        case ConfigKey::ACCELERATOR:
            return node.as<std::string>();
    }
    return node.as<std::string>();
}

void parseDefaultConfig(const YAML::Node& defaultConfigYaml, Model& model) {
    if (!defaultConfigYaml.IsMap()) {
        LOG(FATAL) << "Invalid yaml config file: 'defaultConfig' of model '" << model.name
                   << "' is not a map.";
    }
    for (const auto& kv : defaultConfigYaml) {
        const auto yamlName = kv.first.as<std::string>();
        ConfigKey key;
        if (!getConfigKeyFromYamlName(yamlName, key)) {
            LOG(WARN) << "Ignoring unknown config '" << yamlName << "' of model '" << model.name
                      << "'.";
            continue;
        }
        try {
            model.configValues[key] = parseConfigValue(key, kv.second);
        } catch (const YAML::BadConversion& e) {
            LOG(FATAL) << "Invalid yaml config file: '" << yamlName << "' of model '"
                       << model.name << "' has an invalid value (" << e.what() << ").";
        }
    }

    const auto accelerator = model.getStringConfigValue(ConfigKey::ACCELERATOR, "");
    Accelerator parsed;
    if (!accelerator.empty() && !parseAccelerator(accelerator, parsed)) {
        LOG(WARN) << "Unknown accelerator '" << accelerator << "' for model '" << model.name
                  << "'. GPU will be used.";
    }
}

} // namespace

void parseModelConfigYaml(const std::string& configYamlPath, std::vector<Model>& models) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(configYamlPath);
    } catch (const YAML::Exception& e) {
        LOG(FATAL) << "Unable to load yaml config file '" << configYamlPath << "': " << e.what();
    }
    const fs::path baseDir = fs::path(configYamlPath).parent_path();

    const auto& modelsYaml = config["models"];

    // Error checking:
    //   - 'models' has to be a sequence.
    //   - Every model needs a unique 'name'.
    //   - Every model needs at least one of 'modelPath' and 'genieModelDir'.
    if (!modelsYaml || !modelsYaml.IsSequence()) {
        LOG(FATAL) << "Invalid yaml config file: 'models' is not found in the config or is not "
                      "a list.";
    }

    std::unordered_set<std::string> seenNames;
    std::vector<Model> parsedModels;
    parsedModels.reserve(modelsYaml.size());

    try {
        for (const auto& modelYaml : modelsYaml) {
            const auto& nameYaml = modelYaml["name"];
            if (!nameYaml || nameYaml.as<std::string>().empty()) {
                LOG(FATAL) << "Invalid yaml config file: A model entry is missing its 'name'.";
            }
            Model model;
            model.name = nameYaml.as<std::string>();
            if (!seenNames.insert(model.name).second) {
                LOG(FATAL) << "Invalid yaml config file: Duplicated model name '" << model.name
                           << "'.";
            }

            for (const auto& kv : modelYaml) {
                const auto key = kv.first.as<std::string>();
                if (kKnownModelKeys.find(key) == kKnownModelKeys.end()) {
                    LOG(WARN) << "Ignoring unknown key '" << key << "' of model '" << model.name
                              << "'.";
                }
            }

#define PARSE_PATH(key)                                                          \
    if (modelYaml[#key]) {                                                       \
        model.key = resolvePath(baseDir, modelYaml[#key].as<std::string>());     \
    }
            PARSE_PATH(modelPath)
            PARSE_PATH(genieModelDir)
            PARSE_PATH(htpConfigPath)
#undef PARSE_PATH

            if (model.modelPath.empty() && model.genieModelDir.empty()) {
                LOG(FATAL) << "Invalid yaml config file: Model '" << model.name
                           << "' defines neither 'modelPath' nor 'genieModelDir'.";
            }

            if (modelYaml["llmSupportImage"]) {
                model.llmSupportImage = modelYaml["llmSupportImage"].as<bool>();
            }

            if (modelYaml["defaultConfig"]) {
                parseDefaultConfig(modelYaml["defaultConfig"], model);
            }

            LOG(DEBUG) << "Parsed model '" << model.name << "' (image support: "
                       << model.llmSupportImage << ")";
            parsedModels.push_back(std::move(model));
        }
    } catch (const YAML::Exception& e) {
        LOG(FATAL) << "Invalid yaml config file '" << configYamlPath << "': " << e.what();
    }

    LOG(INFO) << "Loaded " << parsedModels.size() << " model(s) from " << configYamlPath;
    models = std::move(parsedModels);
}

Model* findModel(std::vector<Model>& models, const std::string& name) {
    for (auto& model : models) {
        if (model.name == name) {
            return &model;
        }
    }
    return nullptr;
}

} // namespace llmchat
