#pragma once

#include <fragmenter/core/types.h>
#include <fragmenter/split/content_classifier.h>
#include <fragmenter/split/fragment_stream.h>
#include <fragmenter/split/split_config.h>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>

namespace fragmenter::split {

/**
 * @brief Split HTML or plain text into fragments of at most maxLength bytes
 *
 * Classifies the source and dispatches to the HTML or text splitter. Errors are
 * reported before any fragment is produced. An empty source or a non-positive
 * budget yields an empty stream.
 *
 * @return The lazy fragment stream, or InvalidInputFormat if classification failed
 */
Result<FragmentStream> splitContent(std::string source, int64_t maxLength);
Result<FragmentStream> splitContent(std::string source, const SplitConfig& config);

// String literals bind here rather than to the json overload
Result<FragmentStream> splitContent(const char* source, int64_t maxLength);
Result<FragmentStream> splitContent(const char* source, const SplitConfig& config);

/**
 * @brief Split a dynamically typed value
 *
 * @return InvalidInputType unless source holds a string
 */
Result<FragmentStream> splitContent(const nlohmann::json& source, int64_t maxLength);

FragmentStream splitHtmlContent(std::string source, int64_t maxLength);
FragmentStream splitHtmlContent(std::string source, const SplitConfig& config);

FragmentStream splitTextContent(std::string source, int64_t maxLength);

} // namespace fragmenter::split
