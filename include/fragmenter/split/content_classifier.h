#pragma once

#include <string_view>

namespace fragmenter::split {

enum class ContentKind { PlainText, Html };

constexpr const char* contentKindToString(ContentKind kind) {
    switch (kind) {
        case ContentKind::Html: return "html";
        case ContentKind::PlainText: return "text";
    }
    return "text";
}

/**
 * @brief Check whether the text contains at least one complete HTML tag
 *
 * Recognizes <name ...>, <name/> and </name> where name starts with an ASCII
 * letter. Comments, doctypes, "a < b" and an unterminated "<div" do not count.
 */
bool containsHtmlElement(std::string_view text);

ContentKind detectContentKind(std::string_view text);

} // namespace fragmenter::split
