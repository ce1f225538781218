#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fragmenter/cli/fragment_writer.h>
#include <fragmenter/common/utf8_utils.h>

#include <fstream>

namespace fragmenter::cli {

using json = nlohmann::json;

FragmentWriter::FragmentWriter(std::filesystem::path outputDir, split::ContentKind kind)
    : outputDir_(std::move(outputDir)), kind_(kind) {}

std::string FragmentWriter::fileNameFor(size_t index, split::ContentKind kind) {
    const bool html = kind == split::ContentKind::Html;
    return std::string("fragment_") + split::contentKindToString(kind) + "_" +
           std::to_string(index) + (html ? ".html" : ".txt");
}

Result<void> FragmentWriter::prepare() {
    std::error_code ec;
    std::filesystem::create_directories(outputDir_, ec);
    if (ec) {
        return Error{ErrorCode::WriteError,
                     "Cannot create output directory " + outputDir_.string() + ": " + ec.message()};
    }
    if (!std::filesystem::is_directory(outputDir_, ec)) {
        return Error{ErrorCode::WriteError, "Not a directory: " + outputDir_.string()};
    }
    return Result<void>();
}

Result<WrittenFragment> FragmentWriter::write(std::string_view fragment) {
    WrittenFragment entry;
    entry.index = written_.size() + 1;
    entry.file = outputDir_ / fileNameFor(entry.index, kind_);
    entry.bytes = fragment.size();
    entry.chars = common::countCodepoints(fragment);

    std::ofstream out(entry.file, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::WriteError, "Cannot open " + entry.file.string()};
    }
    out.write(fragment.data(), static_cast<std::streamsize>(fragment.size()));
    if (!out) {
        return Error{ErrorCode::WriteError, "Failed writing " + entry.file.string()};
    }

    spdlog::debug("Wrote {} ({} bytes)", entry.file.string(), entry.bytes);
    written_.push_back(entry);
    return entry;
}

Result<std::filesystem::path> FragmentWriter::writeManifest(int64_t maxLength,
                                                            size_t sourceBytes) const {
    json manifest;
    manifest["kind"] = split::contentKindToString(kind_);
    manifest["max_length"] = maxLength;
    manifest["source_bytes"] = sourceBytes;
    manifest["fragments"] = json::array();
    for (const auto& entry : written_) {
        manifest["fragments"].push_back({{"index", entry.index},
                                         {"file", entry.file.filename().string()},
                                         {"bytes", entry.bytes},
                                         {"chars", entry.chars}});
    }

    auto path = outputDir_ / "manifest.json";
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::WriteError, "Cannot open " + path.string()};
    }
    out << manifest.dump(2) << '\n';
    if (!out) {
        return Error{ErrorCode::WriteError, "Failed writing " + path.string()};
    }
    return path;
}

} // namespace fragmenter::cli
