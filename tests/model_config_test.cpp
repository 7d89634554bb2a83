#include "llmchat/model_config.h"

#include "llmchat/common/logging.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace llmchat;

namespace {

class ModelConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& path : mWrittenFiles) {
            std::remove(path.c_str());
        }
    }

    std::string writeYaml(const std::string& content) {
        const std::string path = ::testing::TempDir() + "llmchat_models_" +
                                 std::to_string(mWrittenFiles.size()) + ".yaml";
        std::ofstream fout(path);
        fout << content;
        mWrittenFiles.push_back(path);
        return path;
    }

    std::string tempDir() const {
        auto dir = ::testing::TempDir();
        if (!dir.empty() && dir.back() == '/')
            dir.pop_back();
        return dir;
    }

private:
    std::vector<std::string> mWrittenFiles;
};

TEST_F(ModelConfigTest, ParsesModelList) {
    const auto path = writeYaml(R"(
models:
  - name: Gemma
    modelPath: /models/gemma.task
    llmSupportImage: true
    defaultConfig:
      maxTokens: 2048
      topK: 64
      topP: 0.95
      temperature: 0.8
      accelerator: CPU
  - name: Llama
    genieModelDir: /bundles/llama
    defaultConfig:
      accelerator: Genie
)");
    std::vector<Model> models;
    parseModelConfigYaml(path, models);
    ASSERT_EQ(models.size(), 2u);

    const auto& gemma = models[0];
    EXPECT_EQ(gemma.name, "Gemma");
    EXPECT_EQ(gemma.modelPath, "/models/gemma.task");
    EXPECT_TRUE(gemma.llmSupportImage);
    EXPECT_EQ(gemma.getIntConfigValue(ConfigKey::MAX_TOKENS, 0), 2048);
    EXPECT_EQ(gemma.getIntConfigValue(ConfigKey::TOPK, 0), 64);
    EXPECT_FLOAT_EQ(gemma.getFloatConfigValue(ConfigKey::TOPP, 0.f), 0.95f);
    EXPECT_FLOAT_EQ(gemma.getFloatConfigValue(ConfigKey::TEMPERATURE, 0.f), 0.8f);
    EXPECT_EQ(gemma.getStringConfigValue(ConfigKey::ACCELERATOR, ""), "CPU");
    EXPECT_FALSE(gemma.instance.has_value());

    const auto& llama = models[1];
    EXPECT_FALSE(llama.llmSupportImage);
    EXPECT_EQ(llama.getGenieModelDir(), "/bundles/llama");
    EXPECT_EQ(llama.getHtpConfigPath(), "/bundles/llama/htp_backend_ext_config.json");
    EXPECT_EQ(llama.getStringConfigValue(ConfigKey::ACCELERATOR, ""), "Genie");
    EXPECT_EQ(llama.getIntConfigValue(ConfigKey::MAX_TOKENS, kDefaultMaxToken), 1024);
}

TEST_F(ModelConfigTest, ResolvesRelativePathsAgainstYamlDirectory) {
    const auto path = writeYaml(R"(
models:
  - name: Local
    modelPath: models/../models/local.task
    htpConfigPath: htp.json
)");
    std::vector<Model> models;
    parseModelConfigYaml(path, models);
    ASSERT_EQ(models.size(), 1u);
    EXPECT_EQ(models[0].modelPath, tempDir() + "/models/local.task");
    EXPECT_EQ(models[0].htpConfigPath, tempDir() + "/htp.json");
}

TEST_F(ModelConfigTest, IgnoresUnknownKeys) {
    const auto path = writeYaml(R"(
models:
  - name: A
    modelPath: /a.task
    description: not used
    defaultConfig:
      seed: 3
      topK: 10
)");
    std::vector<Model> models;
    parseModelConfigYaml(path, models);
    ASSERT_EQ(models.size(), 1u);
    EXPECT_EQ(models[0].configValues.size(), 1u);
    EXPECT_EQ(models[0].getIntConfigValue(ConfigKey::TOPK, 0), 10);
}

TEST_F(ModelConfigTest, FindModelByName) {
    const auto path = writeYaml(R"(
models:
  - name: A
    modelPath: /a.task
  - name: B
    modelPath: /b.task
)");
    std::vector<Model> models;
    parseModelConfigYaml(path, models);
    auto model = findModel(models, "B");
    ASSERT_NE(model, nullptr);
    EXPECT_EQ(model->modelPath, "/b.task");
    EXPECT_EQ(findModel(models, "C"), nullptr);
}

TEST_F(ModelConfigTest, InvalidConfigsAreFatal) {
    const std::vector<std::string> invalidConfigs = {
        "other: 1\n",
        "models: {name: A}\n",
        "models:\n  - modelPath: /a.task\n",
        "models:\n  - name: A\n",
        "models:\n  - {name: A, modelPath: /a}\n  - {name: A, modelPath: /b}\n",
        "models:\n  - {name: A, modelPath: /a, defaultConfig: [1, 2]}\n",
        "models:\n  - {name: A, modelPath: /a, defaultConfig: {topK: lots}}\n",
        "models:\n  - {name: A, modelPath: /a, llmSupportImage: maybe}\n",
    };
    for (const auto& content : invalidConfigs) {
        std::vector<Model> models;
        EXPECT_THROW(parseModelConfigYaml(writeYaml(content), models), FatalError) << content;
        EXPECT_TRUE(models.empty()) << content;
    }
}

TEST_F(ModelConfigTest, MissingFileIsFatal) {
    std::vector<Model> models;
    EXPECT_THROW(parseModelConfigYaml(tempDir() + "/does_not_exist.yaml", models), FatalError);
}

} // namespace
