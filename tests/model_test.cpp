#include "llmchat/model.h"

#include "test_doubles.h"

#include <gtest/gtest.h>

#include <string>

using namespace llmchat;

namespace {

TEST(ConfigKeyTest, YamlNamesRoundTrip) {
    for (const auto key : {ConfigKey::MAX_TOKENS, ConfigKey::TOPK, ConfigKey::TOPP,
                           ConfigKey::TEMPERATURE, ConfigKey::ACCELERATOR}) {
        ConfigKey parsed;
        ASSERT_TRUE(getConfigKeyFromYamlName(getConfigKeyYamlName(key), parsed));
        EXPECT_EQ(parsed, key);
    }
    ConfigKey unused;
    EXPECT_FALSE(getConfigKeyFromYamlName("maxtokens", unused));
}

TEST(ConfigKeyTest, Labels) {
    EXPECT_STREQ(getConfigKeyLabel(ConfigKey::MAX_TOKENS), "Max tokens");
    EXPECT_STREQ(getConfigKeyLabel(ConfigKey::ACCELERATOR), "Choose accelerator");
}

TEST(AcceleratorTest, LabelsAndParsing) {
    EXPECT_STREQ(getAcceleratorLabel(Accelerator::CPU), "CPU");
    EXPECT_STREQ(getAcceleratorLabel(Accelerator::GPU), "GPU");
    EXPECT_STREQ(getAcceleratorLabel(Accelerator::GENIE), "Genie");

    Accelerator accelerator = Accelerator::CPU;
    EXPECT_TRUE(parseAccelerator("genie", accelerator));
    EXPECT_EQ(accelerator, Accelerator::GENIE);
    EXPECT_TRUE(parseAccelerator("gpu", accelerator));
    EXPECT_EQ(accelerator, Accelerator::GPU);
    EXPECT_FALSE(parseAccelerator("NPU", accelerator));
    EXPECT_EQ(accelerator, Accelerator::GPU);
}

TEST(ModelConfigValueTest, MissingKeysReturnDefaults) {
    Model model;
    EXPECT_EQ(model.getIntConfigValue(ConfigKey::MAX_TOKENS, kDefaultMaxToken), 1024);
    EXPECT_EQ(model.getIntConfigValue(ConfigKey::TOPK, kDefaultTopK), 40);
    EXPECT_FLOAT_EQ(model.getFloatConfigValue(ConfigKey::TOPP, kDefaultTopP), 0.9f);
    EXPECT_FLOAT_EQ(model.getFloatConfigValue(ConfigKey::TEMPERATURE, kDefaultTemperature), 1.0f);
    EXPECT_EQ(model.getStringConfigValue(ConfigKey::ACCELERATOR, "GPU"), "GPU");
}

TEST(ModelConfigValueTest, ConvertsBetweenStoredTypes) {
    Model model;
    model.configValues[ConfigKey::MAX_TOKENS] = 2048.7f;
    model.configValues[ConfigKey::TOPK] = std::string("64");
    model.configValues[ConfigKey::TOPP] = 1;
    model.configValues[ConfigKey::TEMPERATURE] = std::string("0.25");
    model.configValues[ConfigKey::ACCELERATOR] = 7;

    EXPECT_EQ(model.getIntConfigValue(ConfigKey::MAX_TOKENS, 0), 2048);
    EXPECT_EQ(model.getIntConfigValue(ConfigKey::TOPK, 0), 64);
    EXPECT_FLOAT_EQ(model.getFloatConfigValue(ConfigKey::TOPP, 0.f), 1.0f);
    EXPECT_FLOAT_EQ(model.getFloatConfigValue(ConfigKey::TEMPERATURE, 0.f), 0.25f);
    EXPECT_EQ(model.getStringConfigValue(ConfigKey::ACCELERATOR, ""), "7");
}

TEST(ModelConfigValueTest, UnparsableStringFallsBackToDefault) {
    Model model;
    model.name = "m";
    model.configValues[ConfigKey::TOPK] = std::string("many");
    model.configValues[ConfigKey::TOPP] = std::string("");
    EXPECT_EQ(model.getIntConfigValue(ConfigKey::TOPK, 40), 40);
    EXPECT_FLOAT_EQ(model.getFloatConfigValue(ConfigKey::TOPP, 0.9f), 0.9f);
}

TEST(ModelPathTest, GenieDirDefaultsToModelPathDirectory) {
    Model model;
    model.modelPath = "/data/models/llama/model.bin";
    EXPECT_EQ(model.getGenieModelDir(), "/data/models/llama");
    EXPECT_EQ(model.getHtpConfigPath(), "/data/models/llama/htp_backend_ext_config.json");

    model.genieModelDir = "/bundle";
    model.htpConfigPath = "/configs/htp.json";
    EXPECT_EQ(model.getGenieModelDir(), "/bundle");
    EXPECT_EQ(model.getHtpConfigPath(), "/configs/htp.json");
}

TEST(ModelInstanceTest, TypeNames) {
    EXPECT_STREQ(getModelInstanceTypeName(ModelInstance(TaskRuntimeInstance{})),
                 "TaskRuntimeInstance");

    test_doubles::FakeNativeEngineApi api;
    ModelInstance instance(std::in_place_type<NativeEngineWrapper>, api, "/dir", "/htp.json");
    EXPECT_STREQ(getModelInstanceTypeName(instance), "NativeEngineWrapper");
    std::get<NativeEngineWrapper>(instance).close();
}

} // namespace
