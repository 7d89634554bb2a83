#include "utils/utils.h"

#include "llmchat/common/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace utils {

namespace {

std::string dashed(std::string arg) {
    std::replace(arg.begin(), arg.end(), '_', '-');
    return arg;
}

std::string unescapeNewLines(const std::string& line) {
    static const std::string kEscaped = "\\n";
    std::string result;
    size_t pos = 0;
    for (auto found = line.find(kEscaped); found != std::string::npos;
         found = line.find(kEscaped, pos)) {
        result.append(line, pos, found - pos).push_back('\n');
        pos = found + kEscaped.size();
    }
    return result.append(line, pos, std::string::npos);
}

} // namespace

bool matchArgument(const std::string& target, const std::string& argPattern,
                   const std::string& argPatternShort, bool normalizeUnderscore) {
    if (!normalizeUnderscore)
        return target == argPattern || (!argPatternShort.empty() && target == argPatternShort);
    const auto arg = dashed(target);
    return arg == dashed(argPattern) ||
           (!argPatternShort.empty() && arg == dashed(argPatternShort));
}

size_t UTF8CharResolver::utf8Len(const char leadByte) {
    const auto byte = static_cast<uint8_t>(leadByte);
    if (byte >= 0xF0)
        return 4;
    if (byte >= 0xE0)
        return 3;
    if (byte >= 0xC0)
        return 2;
    return 1; // ASCII, or a stray continuation byte passed through as is
}

bool UTF8CharResolver::addBytes(const std::string& byteStr) {
    mPending += byteStr;

    size_t completeSize = 0;
    while (completeSize < mPending.size()) {
        const size_t charLength = utf8Len(mPending[completeSize]);
        if (completeSize + charLength > mPending.size())
            break;
        completeSize += charLength;
    }

    DCHECK_LE(completeSize, mPending.size());
    mResolved = mPending.substr(0, completeSize);
    mPending.erase(0, completeSize);
    DLOG(DEBUG) << "UTF8: resolved=" << mResolved.size() << ", pending=" << mPending.size();
    return completeSize > 0 || mPending.empty();
}

std::string UTF8CharResolver::flush() {
    std::string pending;
    pending.swap(mPending);
    mResolved.clear();
    return pending;
}

std::string trim(const std::string& str) {
    const auto isSpace = [](const unsigned char c) { return std::isspace(c) != 0; };
    size_t begin = 0;
    size_t end = str.size();
    while (begin < end && isSpace(str[begin]))
        begin++;
    while (end > begin && isSpace(str[end - 1]))
        end--;
    return str.substr(begin, end - begin);
}

std::vector<std::string> split(const std::string& str, const std::string& sep) {
    std::vector<std::string> pieces;
    size_t begin = str.find_first_not_of(sep);
    while (begin != std::string::npos) {
        const size_t end = str.find_first_of(sep, begin);
        pieces.push_back(str.substr(begin, end - begin));
        begin = str.find_first_not_of(sep, end);
    }
    return pieces;
}

std::vector<std::string> readPromptFiles(const std::vector<std::string>& promptPaths,
                                         const bool onePromptPerLine) {
    std::vector<std::string> prompts;
    for (const auto& path : promptPaths) {
        std::ifstream fin(path);
        if (!fin) {
            LOG(ERROR) << "Unable to open the prompt file: " << path;
            continue;
        }
        LOG(INFO) << "Reading prompt from file: " << path;

        if (!onePromptPerLine) {
            std::ostringstream content;
            content << fin.rdbuf();
            prompts.push_back(content.str());
            continue;
        }
        for (std::string line; std::getline(fin, line);) {
            if (trim(line).empty())
                continue;
            prompts.push_back(unescapeNewLines(line));
        }
    }
    return prompts;
}

} // namespace utils
