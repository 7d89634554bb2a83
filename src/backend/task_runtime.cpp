#include "llmchat/backend/task_runtime.h"

namespace llmchat {

const char* getPreferredBackendName(const PreferredBackend backend) {
    switch (backend) {
        case PreferredBackend::CPU:
            return "CPU";
        case PreferredBackend::GPU:
            return "GPU";
    }
    return "UNKNOWN";
}

} // namespace llmchat
