#pragma once

#include <fragmenter/split/fragment_stream.h>

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fragmenter::split {

/**
 * Split text into trimmed sentences. A boundary is a run of whitespace preceded
 * by '.', '!' or '?'. Whitespace-only sentences are dropped.
 */
std::vector<std::string_view> splitIntoSentences(std::string_view text);

// Whitespace-separated words
std::vector<std::string_view> splitIntoWords(std::string_view text);

/**
 * @brief Lazily packs plain text into fragments of at most maxLength bytes
 *
 * Whole sentences are packed greedily, joined by single spaces. A sentence that
 * alone exceeds the budget is broken on word boundaries; only a single word longer
 * than the budget can produce an oversized fragment.
 */
class TextSplitter : public FragmentSource {
public:
    TextSplitter(std::string source, int64_t maxLength);

    // Sentence views point into source_
    TextSplitter(const TextSplitter&) = delete;
    TextSplitter& operator=(const TextSplitter&) = delete;
    TextSplitter(TextSplitter&&) = delete;
    TextSplitter& operator=(TextSplitter&&) = delete;

    std::optional<std::string> next() override;

private:
    void packSentence(std::string_view sentence);
    void packWords(std::string_view sentence);
    void flushRunning();

    std::string source_;
    int64_t maxLength_;
    std::vector<std::string_view> sentences_;
    size_t sentenceIndex_ = 0;
    bool prepared_ = false;

    // Sentences of the fragment being assembled
    std::vector<std::string_view> running_;
    size_t runningLength_ = 0;

    // Finished fragments not yet handed out
    std::deque<std::string> ready_;
    size_t emitted_ = 0;
    bool finished_ = false;
};

} // namespace fragmenter::split
