#include <fragmenter/split/content_classifier.h>

#include <cctype>

namespace fragmenter::split {

namespace {

bool isNameStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '_' ||
           c == ':' || c == '.';
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Length of a well-formed tag starting at text[pos] == '<', or 0
size_t matchTag(std::string_view text, size_t pos) {
    size_t i = pos + 1;
    bool closing = false;
    if (i < text.size() && text[i] == '/') {
        closing = true;
        ++i;
    }

    if (i >= text.size() || !isNameStart(text[i])) {
        return 0;
    }
    while (i < text.size() && isNameChar(text[i])) {
        ++i;
    }
    if (i >= text.size()) {
        return 0;
    }

    if (text[i] == '>') {
        return i - pos + 1;
    }
    if (!closing && text[i] == '/' && i + 1 < text.size() && text[i + 1] == '>') {
        return i - pos + 2;
    }
    if (!isSpace(text[i]) && (closing || text[i] != '/')) {
        return 0;
    }

    // Attributes (or trailing whitespace): run up to '>', honoring quotes
    char quote = 0;
    for (; i < text.size(); ++i) {
        char c = text[i];
        if (quote != 0) {
            if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '>') {
            return i - pos + 1;
        } else if (c == '<') {
            return 0;
        }
    }
    return 0;
}

} // namespace

bool containsHtmlElement(std::string_view text) {
    size_t pos = text.find('<');
    while (pos != std::string_view::npos) {
        if (matchTag(text, pos) > 0) {
            return true;
        }
        pos = text.find('<', pos + 1);
    }
    return false;
}

ContentKind detectContentKind(std::string_view text) {
    return containsHtmlElement(text) ? ContentKind::Html : ContentKind::PlainText;
}

} // namespace fragmenter::split
