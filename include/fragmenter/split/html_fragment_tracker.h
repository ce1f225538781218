#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fragmenter::split {

/**
 * @brief Raw opening tag kept so it can be re-emitted verbatim (attributes included)
 */
struct SavedTag {
    std::string rawTag; // e.g. <div class="content">
    std::string name;   // e.g. div

    bool operator==(const SavedTag&) const = default;
};

/**
 * @brief Opening and closing markup for the currently open tags
 */
struct TagHierarchy {
    std::string opening; // outermost first
    std::string closing; // innermost first
};

/**
 * @brief Tag-nesting and fragment-buffer state for one HTML split operation
 *
 * Keeps the stack of open tags, their raw opening markup, and the fragment under
 * construction. A fragment produced by flush() is always closed with the
 * synthesized closing tags of every open element, and startFragment() seeds the
 * next one with their original opening tags.
 *
 * Not thread-safe; owned by exactly one splitter.
 */
class HtmlFragmentTracker {
public:
    explicit HtmlFragmentTracker(int64_t maxLength);

    HtmlFragmentTracker(const HtmlFragmentTracker&) = delete;
    HtmlFragmentTracker& operator=(const HtmlFragmentTracker&) = delete;
    HtmlFragmentTracker(HtmlFragmentTracker&&) noexcept = default;
    HtmlFragmentTracker& operator=(HtmlFragmentTracker&&) noexcept = default;

    TagHierarchy tagHierarchy() const;

    // True when content plus the closing markup would not fit in the budget
    bool wouldExceed(std::string_view content) const;

    // Close the current fragment and return it; "" when nothing was started
    std::string flush();

    // Reset the buffer to the re-opened ancestor tags
    void startFragment();

    void addContent(std::string_view text);

    // Pops only when name matches the innermost open tag
    void onClosingTag(std::string_view name);

    void onOpeningTag(std::string_view rawTag, std::string_view name);

    bool empty() const { return pieces_.empty(); }
    int64_t maxLength() const { return maxLength_; }
    size_t currentLength() const { return currentLength_; }
    size_t depth() const { return stack_.size(); }
    const std::vector<std::string>& stack() const { return stack_; }
    const std::vector<SavedTag>& savedTags() const { return savedTags_; }

private:
    std::string closingMarkup() const;

    int64_t maxLength_;
    std::vector<std::string> stack_;
    std::vector<SavedTag> savedTags_;
    std::vector<std::string> pieces_;
    size_t currentLength_ = 0;
};

} // namespace fragmenter::split
