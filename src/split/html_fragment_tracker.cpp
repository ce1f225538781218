#include <spdlog/spdlog.h>
#include <fragmenter/split/html_fragment_tracker.h>

#include <numeric>

namespace fragmenter::split {

HtmlFragmentTracker::HtmlFragmentTracker(int64_t maxLength) : maxLength_(maxLength) {}

TagHierarchy HtmlFragmentTracker::tagHierarchy() const {
    TagHierarchy hierarchy;
    for (const auto& saved : savedTags_) {
        hierarchy.opening += saved.rawTag;
    }
    hierarchy.closing = closingMarkup();
    return hierarchy;
}

std::string HtmlFragmentTracker::closingMarkup() const {
    std::string closing;
    for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
        closing += "</";
        closing += *it;
        closing += '>';
    }
    return closing;
}

bool HtmlFragmentTracker::wouldExceed(std::string_view content) const {
    const auto projected = static_cast<int64_t>(currentLength_ + content.size() +
                                                closingMarkup().size());
    return projected > maxLength_;
}

std::string HtmlFragmentTracker::flush() {
    if (pieces_.empty()) {
        return "";
    }

    pieces_.push_back(closingMarkup());

    const size_t total =
        std::accumulate(pieces_.begin(), pieces_.end(), size_t{0},
                        [](size_t sum, const std::string& piece) { return sum + piece.size(); });
    std::string fragment;
    fragment.reserve(total);
    for (const auto& piece : pieces_) {
        fragment += piece;
    }
    return fragment;
}

void HtmlFragmentTracker::startFragment() {
    auto hierarchy = tagHierarchy();
    currentLength_ = hierarchy.opening.size();
    pieces_.clear();
    pieces_.push_back(std::move(hierarchy.opening));
}

void HtmlFragmentTracker::addContent(std::string_view text) {
    pieces_.emplace_back(text);
    currentLength_ += text.size();
}

void HtmlFragmentTracker::onClosingTag(std::string_view name) {
    if (stack_.empty() || stack_.back() != name) {
        spdlog::debug("HtmlFragmentTracker: ignoring unmatched closing tag </{}> (open: {})", name,
                      stack_.empty() ? std::string("none") : stack_.back());
        return;
    }
    stack_.pop_back();
    if (!savedTags_.empty()) {
        savedTags_.pop_back();
    }
}

void HtmlFragmentTracker::onOpeningTag(std::string_view rawTag, std::string_view name) {
    stack_.emplace_back(name);
    savedTags_.push_back(SavedTag{std::string(rawTag), std::string(name)});
}

} // namespace fragmenter::split
