#pragma once

#include <fragmenter/split/fragment_stream.h>
#include <fragmenter/split/html_fragment_tracker.h>
#include <fragmenter/split/split_config.h>

#include <optional>
#include <string>
#include <string_view>

namespace fragmenter::split {

/**
 * @brief Kind of a complete tag as seen by the splitter
 */
enum class TagKind {
    Opening,
    Closing,
    SelfClosing,
    Declaration // <!DOCTYPE>, <!-- -->, <?xml ?>
};

/**
 * @brief A tag lifted out of the source: its raw text and element name
 */
struct ParsedTag {
    TagKind kind = TagKind::Opening;
    std::string_view raw;
    std::string_view name;
};

/**
 * @brief Parse the raw text of one tag ("<...>")
 *
 * The name is the first whitespace-delimited word after '<' (or "</"). A tag
 * ending in "/>" is self-closing. Declarations are only reported when
 * config.skipMarkupDeclarations is set; void elements are reported as
 * self-closing only when config.voidElementsSelfClose is set.
 */
ParsedTag parseTag(std::string_view raw, const SplitConfig& config);

bool isVoidElement(std::string_view name);

/**
 * @brief Lazily splits HTML markup into structurally valid fragments
 *
 * Scans the source left to right, one tag or text run at a time. When the next
 * unit would push the fragment (plus its closing tags) over the budget, the
 * current fragment is closed and returned, and a new one is opened with the
 * ancestors' original opening tags. A single unit larger than the budget is
 * still emitted whole. A trailing tag with no '>' ends the scan.
 */
class HtmlSplitter : public FragmentSource {
public:
    HtmlSplitter(std::string source, SplitConfig config);

    HtmlSplitter(const HtmlSplitter&) = delete;
    HtmlSplitter& operator=(const HtmlSplitter&) = delete;
    HtmlSplitter(HtmlSplitter&&) = delete;
    HtmlSplitter& operator=(HtmlSplitter&&) = delete;

    std::optional<std::string> next() override;

    const HtmlFragmentTracker& tracker() const { return tracker_; }

    // Bytes of source consumed so far
    size_t scannedBytes() const { return pos_; }

private:
    // Returns a finished fragment when consuming the unit forced a flush
    std::optional<std::string> consumeTag();
    std::optional<std::string> consumeText();

    std::optional<std::string> rollOverIfNeeded(std::string_view unit);

    std::string source_;
    SplitConfig config_;
    HtmlFragmentTracker tracker_;
    size_t pos_ = 0;
    size_t emitted_ = 0;
    bool scanDone_ = false;
    bool finished_ = false;
};

} // namespace fragmenter::split
