#pragma once

#include <iostream>
#include <string>
#include <vector>

#define ENSURE_NEXT_ARG_EXISTS(curArgIdx)                                          \
    if (curArgIdx + 1 >= argc) {                                                   \
        std::cout << "No value provided for argument '" << argv[curArgIdx] << "'." \
                  << std::endl;                                                    \
        continue;                                                                  \
    }

namespace utils {

// True if `target` is the long or the short form of an option. Underscores count as dashes
// unless `normalizeUnderscore` is false.
bool matchArgument(const std::string& target, const std::string& argPattern,
                   const std::string& argPatternShort = "", bool normalizeUnderscore = true);

// Accumulates streamed byte fragments and only releases them once they form whole UTF-8 code
// points. Native engines may split a multibyte character across two callbacks.
class UTF8CharResolver {
public:
    // Returns false if every byte seen so far belongs to an incomplete character.
    bool addBytes(const std::string& byteStr);
    bool hasResolved() const { return !mResolved.empty(); }
    const std::string& getResolvedStr() const { return mResolved; }
    // Returns whatever is still buffered, even if incomplete, and resets the resolver.
    std::string flush();

    // Byte length of the code point starting with `leadByte`.
    static size_t utf8Len(char leadByte);

private:
    std::string mPending;
    std::string mResolved;
};

std::string trim(const std::string& str);

// Splits on any character of `sep`, dropping empty pieces.
std::vector<std::string> split(const std::string& str, const std::string& sep);

// Missing files are logged and skipped. With `onePromptPerLine`, blank lines are skipped and a
// literal "\n" inside a line becomes a newline.
std::vector<std::string> readPromptFiles(const std::vector<std::string>& promptPaths,
                                         const bool onePromptPerLine);

} // namespace utils
