#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fragmenter/cli/fragment_writer.h>
#include <fragmenter/config/config_helpers.h>
#include <fragmenter/split/content_splitter.h>

#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

using namespace fragmenter;

namespace {

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

Result<std::string> readInput(const std::string& file) {
    if (file.empty() || file == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open file: " + file};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_level(spdlog::level::warn);

    CLI::App app{"Split HTML or plain text into size-bounded fragments", "fragmenter"};

    std::string file = "-";
    std::string configPath;
    std::optional<int64_t> maxLen;
    std::optional<std::string> outputDir;
    bool manifest = false;
    bool voidElements = false;
    bool skipDeclarations = false;
    bool verbose = false;

    app.add_option("file", file, "Input file, or - for standard input")->default_val("-");
    app.add_option("--max-len", maxLen, "Maximum fragment length in bytes (default 4096)");
    app.add_option("-o,--output-dir", outputDir, "Directory receiving fragment files");
    app.add_option("-c,--config", configPath, "Config file (TOML, [split] section)");
    app.add_flag("--manifest", manifest, "Write manifest.json next to the fragments");
    app.add_flag("--void-elements", voidElements, "Treat <br>, <img>, ... as self-closing");
    app.add_flag("--skip-declarations", skipDeclarations,
                 "Keep <!DOCTYPE>, comments and <?...?> off the tag stack");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    // Precedence: env FRAGMENTER_LOG_LEVEL > --verbose > default
    if (const char* envLvl = std::getenv("FRAGMENTER_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
        }
    } else if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    try {
        auto settingsResult = config::resolve_cli_settings(config::get_config_path(configPath));
        if (!settingsResult) {
            spdlog::error("{}", settingsResult.error().message);
            return 1;
        }
        auto settings = std::move(settingsResult).value();
        if (maxLen) {
            settings.maxLength = *maxLen;
        }
        if (outputDir) {
            settings.outputDir = config::expand_tilde(*outputDir);
        }
        settings.writeManifest = settings.writeManifest || manifest;

        auto input = readInput(file);
        if (!input) {
            spdlog::error("{}", input.error().message);
            return 1;
        }
        std::string content = std::move(input).value();
        const size_t sourceBytes = content.size();
        const auto kind = split::detectContentKind(content);

        split::SplitConfig splitConfig;
        splitConfig.maxLength = settings.maxLength;
        splitConfig.voidElementsSelfClose = voidElements;
        splitConfig.skipMarkupDeclarations = skipDeclarations;

        auto stream = split::splitContent(std::move(content), splitConfig);
        if (!stream) {
            spdlog::error("Split failed: {} ({})", stream.error().message, stream.error().code);
            return 1;
        }

        cli::FragmentWriter writer(settings.outputDir, kind);
        if (auto prepared = writer.prepare(); !prepared) {
            spdlog::error("{}", prepared.error().message);
            return 1;
        }

        for (const auto& fragment : stream.value()) {
            auto written = writer.write(fragment);
            if (!written) {
                spdlog::error("{}", written.error().message);
                return 1;
            }
            const auto& entry = written.value();
            std::cout << "fragment #" << entry.index << ": " << entry.bytes << " bytes, "
                      << entry.chars << " chars." << std::endl;
            std::cout << std::string(20, '-') << std::endl;
        }

        if (settings.writeManifest) {
            auto path = writer.writeManifest(settings.maxLength, sourceBytes);
            if (!path) {
                spdlog::error("{}", path.error().message);
                return 1;
            }
            spdlog::info("Manifest written to {}", path.value().string());
        }

        spdlog::info("{} fragment(s) written to {}", writer.written().size(),
                     settings.outputDir.string());
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}
