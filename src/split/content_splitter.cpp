#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fragmenter/profiling.h>
#include <fragmenter/split/content_splitter.h>
#include <fragmenter/split/html_splitter.h>
#include <fragmenter/split/text_splitter.h>

#include <memory>

namespace fragmenter::split {

Result<FragmentStream> splitContent(std::string source, int64_t maxLength) {
    SplitConfig config;
    config.maxLength = maxLength;
    return splitContent(std::move(source), config);
}

Result<FragmentStream> splitContent(std::string source, const SplitConfig& config) {
    FRAGMENTER_SPLIT_ZONE("Content", source.size());

    if (source.empty() || config.maxLength <= 0) {
        return FragmentStream{};
    }

    // detectContentKind only scans; this guards failures escaping the scanner
    ContentKind kind;
    try {
        kind = detectContentKind(source);
    } catch (const std::exception& e) {
        spdlog::error("Content classification failed: {}", e.what());
        return Error{ErrorCode::InvalidInputFormat,
                     std::string("Invalid input format: ") + e.what()};
    }

    spdlog::debug("Splitting {} bytes as {} (budget {})", source.size(),
                  contentKindToString(kind), config.maxLength);

    if (kind == ContentKind::Html) {
        return splitHtmlContent(std::move(source), config);
    }
    return splitTextContent(std::move(source), config.maxLength);
}

Result<FragmentStream> splitContent(const char* source, int64_t maxLength) {
    return splitContent(std::string(source ? source : ""), maxLength);
}

Result<FragmentStream> splitContent(const char* source, const SplitConfig& config) {
    return splitContent(std::string(source ? source : ""), config);
}

Result<FragmentStream> splitContent(const nlohmann::json& source, int64_t maxLength) {
    if (!source.is_string()) {
        return Error{ErrorCode::InvalidInputType,
                     std::string("Input must be a string, got ") + source.type_name()};
    }
    return splitContent(source.get<std::string>(), maxLength);
}

FragmentStream splitHtmlContent(std::string source, int64_t maxLength) {
    SplitConfig config;
    config.maxLength = maxLength;
    return splitHtmlContent(std::move(source), config);
}

FragmentStream splitHtmlContent(std::string source, const SplitConfig& config) {
    if (source.empty() || config.maxLength <= 0) {
        return FragmentStream{};
    }
    return FragmentStream(std::make_unique<HtmlSplitter>(std::move(source), config));
}

FragmentStream splitTextContent(std::string source, int64_t maxLength) {
    if (source.empty() || maxLength <= 0) {
        return FragmentStream{};
    }
    return FragmentStream(std::make_unique<TextSplitter>(std::move(source), maxLength));
}

} // namespace fragmenter::split
