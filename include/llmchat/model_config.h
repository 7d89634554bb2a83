#pragma once

#include "llmchat/model.h"

#include <string>
#include <vector>

namespace llmchat {

// Loads the model list from a yaml file of the form
//
//   models:
//     - name: Gemma3-1B-IT
//       modelPath: gemma3-1b-it-int4.task
//       llmSupportImage: false
//       defaultConfig:
//         maxTokens: 1024
//         topK: 64
//         topP: 0.95
//         temperature: 1.0
//         accelerator: GPU
//
// Relative paths are resolved against the directory of the yaml file. Throws FatalError on an
// invalid config.
void parseModelConfigYaml(const std::string& configYamlPath, std::vector<Model>& models);

// Returns nullptr if no model has the given name.
Model* findModel(std::vector<Model>& models, const std::string& name);

} // namespace llmchat
