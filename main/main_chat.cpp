#include "llmchat/common/logging.h"
#include "llmchat/common/timer.h"
#include "llmchat/image.h"
#include "llmchat/llm_chat_model_helper.h"
#include "llmchat/model_config.h"
#include "utils/utils.h"

#ifdef LLMCHAT_WITH_MEDIAPIPE
#include "llmchat/backend/mediapipe_runtime.h"
#endif
#ifdef LLMCHAT_WITH_GENIE
#include "llmchat/backend/genie_engine.h"
#endif

#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using namespace llmchat;

// Blocks the main thread until the listener has seen the final result.
class ResponsePrinter {
public:
    ResultListener listener() {
        return [this](const std::string& partialResult, const bool done) {
            std::cout << partialResult << std::flush;
            mFullResponse += partialResult;
            if (done) {
                std::lock_guard<std::mutex> lock(mMutex);
                mDone = true;
                mCondition.notify_all();
            }
        };
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mMutex);
        mCondition.wait(lock, [this] { return mDone; });
    }

    const std::string& getFullResponse() const { return mFullResponse; }

private:
    std::mutex mMutex;
    std::condition_variable mCondition;
    bool mDone = false;
    std::string mFullResponse;
};

bool parseImageSize(const std::string& str, int& width, int& height) {
    const auto dims = utils::split(str, "xX");
    if (dims.size() != 2)
        return false;
    try {
        width = std::stoi(dims[0]);
        height = std::stoi(dims[1]);
    } catch (const std::logic_error&) {
        return false;
    }
    return width > 0 && height > 0;
}

// Reads an interleaved 8-bit image. The channel count follows from the file size.
std::optional<Image> loadRawImage(const std::string& path, const int width, const int height) {
    std::ifstream fin(path, std::ios::binary);
    if (!fin) {
        LOG(ERROR) << "Unable to open the image file: " << path;
        return std::nullopt;
    }
    Image image;
    image.width = width;
    image.height = height;
    image.pixels.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
    const size_t numPixels = static_cast<size_t>(width) * height;
    if (image.pixels.size() % numPixels != 0) {
        LOG(ERROR) << "Image size " << image.pixels.size() << " does not match " << width << "x"
                   << height;
        return std::nullopt;
    }
    image.channels = image.pixels.size() / numPixels;
    return image;
}

int main(int argc, char* argv[]) {
    std::string yamlConfigPath = "models.yaml";
    std::string modelName;
    std::string accelerator;
    std::vector<std::string> prompts;
    std::vector<std::string> promptFiles;
    std::string imagePath;
    std::string imageSize;
    std::string defaultPrompt = "Tell me a short story about a robot learning to paint.";

    using utils::matchArgument;

    // Process command line.
    //  -m or --model to pick a model from the yaml model list.
    //  -p or --prompt to add an input prompt.
    //  -i or --input-file to read prompts from a file, one per line.
    //  -im or --image with --image-size to attach a raw image to every prompt.
    //  -a or --accelerator to override the accelerator of the model.
    for (int i = 1; i < argc; i++) {
        std::string curArg(argv[i]);
        if (matchArgument(curArg, "--model", "-m")) {
            ENSURE_NEXT_ARG_EXISTS(i)
            modelName = argv[++i];
        } else if (matchArgument(curArg, "--prompt", "-p")) {
            ENSURE_NEXT_ARG_EXISTS(i)
            prompts.emplace_back(argv[++i]);
        } else if (matchArgument(curArg, "--input-file", "-i")) {
            ENSURE_NEXT_ARG_EXISTS(i)
            promptFiles.emplace_back(argv[++i]);
        } else if (matchArgument(curArg, "--image", "-im")) {
            ENSURE_NEXT_ARG_EXISTS(i)
            imagePath = argv[++i];
        } else if (matchArgument(curArg, "--image-size")) {
            ENSURE_NEXT_ARG_EXISTS(i)
            imageSize = argv[++i];
        } else if (matchArgument(curArg, "--accelerator", "-a")) {
            ENSURE_NEXT_ARG_EXISTS(i)
            accelerator = argv[++i];
        } else if (fs::path(curArg).extension() == ".yaml") {
            LOG(INFO) << "Using yaml config file: " << curArg;
            yamlConfigPath = curArg;
        } else {
            LOG(INFO) << "Unrecognized argument: " << curArg;
        }
    }

    const auto filePrompts = utils::readPromptFiles(promptFiles, true);
    prompts.insert(prompts.end(), filePrompts.begin(), filePrompts.end());
    if (prompts.empty())
        prompts.push_back(defaultPrompt); // Use the default example.

    std::vector<Model> models;
    try {
        parseModelConfigYaml(yamlConfigPath, models);
    } catch (const FatalError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    if (models.empty()) {
        LOG(ERROR) << "No model is defined in " << yamlConfigPath;
        return 1;
    }
    if (modelName.empty()) {
        modelName = models.front().name;
        LOG(INFO) << "No model given. Using the first model: " << modelName;
    }
    auto model = findModel(models, modelName);
    if (model == nullptr) {
        LOG(ERROR) << "Model '" << modelName << "' is not in " << yamlConfigPath;
        return 1;
    }
    if (!accelerator.empty()) {
        model->configValues[ConfigKey::ACCELERATOR] = accelerator;
    }

    std::optional<Image> image;
    if (!imagePath.empty()) {
        int width = 0, height = 0;
        if (!parseImageSize(imageSize, width, height)) {
            LOG(ERROR) << "A valid --image-size WxH is required with --image";
            return 1;
        }
        image = loadRawImage(imagePath, width, height);
        if (!image)
            return 1;
    }

    std::unique_ptr<TaskRuntime> taskRuntime;
    std::unique_ptr<NativeEngineApi> nativeEngineApi;
#ifdef LLMCHAT_WITH_MEDIAPIPE
    taskRuntime = std::make_unique<MediaPipeTaskRuntime>();
#endif
#ifdef LLMCHAT_WITH_GENIE
    nativeEngineApi = std::make_unique<GenieEngineApi>();
#endif

    LlmChatModelHelper helper(taskRuntime.get(), nativeEngineApi.get());

    std::string initError;
    helper.initialize(*model, [&](const std::string& error) { initError = error; });
    if (!initError.empty()) {
        LOG(ERROR) << "Failed to initialize '" << model->name << "': " << initError;
        return 1;
    }

    const size_t numPrompt = prompts.size();
    Timer timer;
    for (size_t i = 0; i < numPrompt; i++) {
        std::cout << "=========== Processing the " << i << "-th input. ===========" << std::endl;
        std::cout << "\n[Prompt]\n" << prompts[i] << '\n' << std::endl;
        std::cout << "[Response]" << std::endl;

        ResponsePrinter printer;
        timer.start();
        helper.runInference(
            *model, prompts[i], printer.listener(),
            [] { LOG(INFO) << "Model cleaned up."; }, image ? &*image : nullptr);
        printer.wait();
        const double elapsed = timer.reset();

        std::cout << "\n\n[Latency]\n  " << elapsed << " s for "
                  << printer.getFullResponse().size() << " bytes" << std::endl;
        helper.resetSession(*model);
    }
    helper.cleanUp(*model);
    return 0;
}
