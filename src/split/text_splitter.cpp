#include <spdlog/spdlog.h>
#include <fragmenter/profiling.h>
#include <fragmenter/split/text_splitter.h>

#include <cctype>

namespace fragmenter::split {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isSentenceEnd(char c) {
    return c == '.' || c == '!' || c == '?';
}

std::string_view trimView(std::string_view text) {
    size_t start = 0;
    while (start < text.size() && isSpace(text[start])) {
        ++start;
    }
    size_t end = text.size();
    while (end > start && isSpace(text[end - 1])) {
        --end;
    }
    return text.substr(start, end - start);
}

std::string joinWithSpaces(const std::vector<std::string_view>& parts) {
    std::string joined;
    for (const auto& part : parts) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += part;
    }
    return joined;
}

} // namespace

std::vector<std::string_view> splitIntoSentences(std::string_view text) {
    std::vector<std::string_view> sentences;

    auto push = [&sentences](std::string_view piece) {
        auto trimmed = trimView(piece);
        if (!trimmed.empty()) {
            sentences.push_back(trimmed);
        }
    };

    size_t start = 0;
    size_t i = 0;
    while (i < text.size()) {
        if (isSpace(text[i]) && i > 0 && isSentenceEnd(text[i - 1])) {
            push(text.substr(start, i - start));
            while (i < text.size() && isSpace(text[i])) {
                ++i;
            }
            start = i;
            continue;
        }
        ++i;
    }
    push(text.substr(start));

    return sentences;
}

std::vector<std::string_view> splitIntoWords(std::string_view text) {
    std::vector<std::string_view> words;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && isSpace(text[i])) {
            ++i;
        }
        size_t start = i;
        while (i < text.size() && !isSpace(text[i])) {
            ++i;
        }
        if (i > start) {
            words.push_back(text.substr(start, i - start));
        }
    }
    return words;
}

TextSplitter::TextSplitter(std::string source, int64_t maxLength)
    : source_(std::move(source)), maxLength_(maxLength) {}

std::optional<std::string> TextSplitter::next() {
    FRAGMENTER_ZONE_SCOPED_N("TextSplitter::next");

    if (finished_) {
        return std::nullopt;
    }
    if (maxLength_ <= 0 || source_.empty()) {
        finished_ = true;
        return std::nullopt;
    }

    if (!prepared_) {
        prepared_ = true;
        sentences_ = splitIntoSentences(source_);
        spdlog::debug("TextSplitter: {} bytes, {} sentence(s), budget {}", source_.size(),
                      sentences_.size(), maxLength_);
    }

    while (ready_.empty() && sentenceIndex_ < sentences_.size()) {
        packSentence(sentences_[sentenceIndex_++]);
    }

    if (ready_.empty()) {
        flushRunning();
    }

    if (ready_.empty()) {
        finished_ = true;
        spdlog::debug("TextSplitter: finished with {} fragment(s)", emitted_);
        return std::nullopt;
    }

    auto fragment = std::move(ready_.front());
    ready_.pop_front();
    ++emitted_;
    spdlog::trace("TextSplitter: fragment #{} ({} bytes)", emitted_, fragment.size());
    return fragment;
}

void TextSplitter::packSentence(std::string_view sentence) {
    const auto budget = static_cast<size_t>(maxLength_);

    if (sentence.size() > budget) {
        // Keep source order: what was gathered so far goes out first
        flushRunning();
        packWords(sentence);
        return;
    }

    const size_t separator = running_.empty() ? 0 : 1;
    if (runningLength_ + separator + sentence.size() > budget) {
        flushRunning();
    }

    runningLength_ += (running_.empty() ? 0 : 1) + sentence.size();
    running_.push_back(sentence);
}

void TextSplitter::packWords(std::string_view sentence) {
    const auto budget = static_cast<size_t>(maxLength_);

    std::vector<std::string_view> words;
    size_t length = 0;

    for (auto word : splitIntoWords(sentence)) {
        // Each word is accounted with one trailing separator byte
        const size_t wordSize = word.size() + 1;
        if (length + wordSize > budget) {
            if (!words.empty()) {
                ready_.push_back(joinWithSpaces(words));
            }
            if (word.size() > budget) {
                spdlog::debug("TextSplitter: {}-byte word exceeds budget of {}", word.size(),
                              budget);
            }
            words.assign(1, word);
            length = wordSize;
        } else {
            words.push_back(word);
            length += wordSize;
        }
    }

    if (!words.empty()) {
        ready_.push_back(joinWithSpaces(words));
    }
}

void TextSplitter::flushRunning() {
    if (running_.empty()) {
        return;
    }
    ready_.push_back(joinWithSpaces(running_));
    running_.clear();
    runningLength_ = 0;
}

} // namespace fragmenter::split
