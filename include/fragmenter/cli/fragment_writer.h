#pragma once

#include <fragmenter/core/types.h>
#include <fragmenter/split/content_classifier.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fragmenter::cli {

/**
 * One fragment as written to disk
 */
struct WrittenFragment {
    size_t index = 0; // 1-based
    std::filesystem::path file;
    size_t bytes = 0;
    size_t chars = 0;
};

/**
 * @brief Writes fragments into an output directory
 *
 * Files are named fragment_html_<i>.html or fragment_text_<i>.txt depending on
 * the detected content kind. Optionally records a manifest.json describing every
 * fragment written.
 */
class FragmentWriter {
public:
    FragmentWriter(std::filesystem::path outputDir, split::ContentKind kind);

    static std::string fileNameFor(size_t index, split::ContentKind kind);

    // Create the output directory if missing
    Result<void> prepare();

    Result<WrittenFragment> write(std::string_view fragment);

    Result<std::filesystem::path> writeManifest(int64_t maxLength, size_t sourceBytes) const;

    const std::vector<WrittenFragment>& written() const { return written_; }
    const std::filesystem::path& outputDir() const { return outputDir_; }

private:
    std::filesystem::path outputDir_;
    split::ContentKind kind_;
    std::vector<WrittenFragment> written_;
};

} // namespace fragmenter::cli
