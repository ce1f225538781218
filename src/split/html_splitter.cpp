#include <spdlog/spdlog.h>
#include <fragmenter/profiling.h>
#include <fragmenter/split/html_splitter.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace fragmenter::split {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// First whitespace-delimited word, leading whitespace skipped
std::string_view firstWord(std::string_view text) {
    size_t start = 0;
    while (start < text.size() && isSpace(text[start])) {
        ++start;
    }
    size_t end = start;
    while (end < text.size() && !isSpace(text[end])) {
        ++end;
    }
    return text.substr(start, end - start);
}

bool hasNonSpace(std::string_view text) {
    return std::any_of(text.begin(), text.end(), [](char c) { return !isSpace(c); });
}

} // namespace

bool isVoidElement(std::string_view name) {
    static constexpr std::array<std::string_view, 14> kVoidElements = {
        "area", "base", "br",   "col",   "embed",  "hr",    "img",
        "input", "link", "meta", "param", "source", "track", "wbr"};

    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return std::find(kVoidElements.begin(), kVoidElements.end(), lower) != kVoidElements.end();
}

ParsedTag parseTag(std::string_view raw, const SplitConfig& config) {
    ParsedTag tag;
    tag.raw = raw;

    std::string_view content = raw.size() >= 2 ? raw.substr(1, raw.size() - 2) : std::string_view{};

    if (config.skipMarkupDeclarations && !content.empty() &&
        (content.front() == '!' || content.front() == '?')) {
        tag.kind = TagKind::Declaration;
        return tag;
    }

    if (!content.empty() && content.front() == '/') {
        tag.kind = TagKind::Closing;
        auto word = firstWord(content);
        tag.name = word.substr(std::min<size_t>(1, word.size()));
        return tag;
    }

    tag.name = firstWord(content);
    if (tag.name.empty()) {
        // Nameless tags ("<>", "< >") never touch the stack
        tag.kind = TagKind::SelfClosing;
    } else if (content.back() == '/') {
        tag.kind = TagKind::SelfClosing;
    } else if (config.voidElementsSelfClose && isVoidElement(tag.name)) {
        tag.kind = TagKind::SelfClosing;
    } else {
        tag.kind = TagKind::Opening;
    }
    return tag;
}

HtmlSplitter::HtmlSplitter(std::string source, SplitConfig config)
    : source_(std::move(source)), config_(config), tracker_(config.maxLength) {}

std::optional<std::string> HtmlSplitter::next() {
    FRAGMENTER_ZONE_SCOPED_N("HtmlSplitter::next");

    if (finished_) {
        return std::nullopt;
    }
    if (config_.maxLength <= 0 || source_.empty()) {
        finished_ = true;
        return std::nullopt;
    }

    while (!scanDone_ && pos_ < source_.size()) {
        auto fragment = source_[pos_] == '<' ? consumeTag() : consumeText();
        if (fragment) {
            ++emitted_;
            spdlog::trace("HtmlSplitter: fragment #{} ({} bytes, depth {})", emitted_,
                          fragment->size(), tracker_.depth());
            return fragment;
        }
    }

    finished_ = true;
    if (tracker_.empty()) {
        return std::nullopt;
    }

    auto last = tracker_.flush();
    ++emitted_;
    spdlog::debug("HtmlSplitter: finished {} bytes into {} fragment(s) (budget {})",
                  source_.size(), emitted_, config_.maxLength);
    return last;
}

std::optional<std::string> HtmlSplitter::consumeTag() {
    const size_t tagEnd = source_.find('>', pos_);
    if (tagEnd == std::string::npos) {
        spdlog::debug("HtmlSplitter: discarding truncated tag at offset {}", pos_);
        scanDone_ = true;
        return std::nullopt;
    }

    std::string_view raw(source_.data() + pos_, tagEnd - pos_ + 1);
    pos_ = tagEnd + 1;

    const auto tag = parseTag(raw, config_);
    auto rolled = rollOverIfNeeded(raw);

    switch (tag.kind) {
        case TagKind::Closing:
            tracker_.onClosingTag(tag.name);
            break;
        case TagKind::Opening:
            tracker_.onOpeningTag(raw, tag.name);
            break;
        case TagKind::SelfClosing:
        case TagKind::Declaration:
            break;
    }
    tracker_.addContent(raw);

    return rolled;
}

std::optional<std::string> HtmlSplitter::consumeText() {
    const size_t nextTag = source_.find('<', pos_);
    const size_t end = nextTag == std::string::npos ? source_.size() : nextTag;

    std::string_view text(source_.data() + pos_, end - pos_);
    pos_ = end;

    if (!hasNonSpace(text)) {
        return std::nullopt;
    }

    auto rolled = rollOverIfNeeded(text);
    tracker_.addContent(text);
    return rolled;
}

std::optional<std::string> HtmlSplitter::rollOverIfNeeded(std::string_view unit) {
    if (static_cast<int64_t>(unit.size()) > config_.maxLength) {
        spdlog::debug("HtmlSplitter: {}-byte unit exceeds budget of {}, emitting it whole",
                      unit.size(), config_.maxLength);
    }

    if (!tracker_.wouldExceed(unit) || tracker_.empty()) {
        return std::nullopt;
    }

    auto fragment = tracker_.flush();
    tracker_.startFragment();
    return fragment;
}

} // namespace fragmenter::split
