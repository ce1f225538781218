#include <spdlog/spdlog.h>
#include <fragmenter/config/config_helpers.h>

#include <charconv>
#include <fstream>

namespace fragmenter::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments
        size_t comment = v.find('#');
        if (comment != std::string::npos) {
            v = v.substr(0, comment);
            trim(v);
        }

        // Support both "split.max_length" and "[split] max_length"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "fragmenter" / "config.toml";
    }

    return configHome / "fragmenter" / "config.toml";
}

Result<int64_t> parse_int(const std::string& raw) {
    std::string value = raw;
    trim(value);
    if (value.empty()) {
        return Error{ErrorCode::InvalidArgument, "Expected an integer, got an empty value"};
    }

    int64_t parsed = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc{} || ptr != last) {
        return Error{ErrorCode::InvalidArgument, "Expected an integer, got '" + value + "'"};
    }
    return parsed;
}

Result<CliSettings> resolve_cli_settings(const std::filesystem::path& config_path) {
    CliSettings settings;

    std::error_code ec;
    const bool haveConfig = !config_path.empty() && std::filesystem::exists(config_path, ec);
    if (haveConfig) {
        spdlog::debug("Reading settings from {}", config_path.string());
    }

    auto lookup = [&](const char* envName, const std::string& key) -> std::string {
        if (const char* env = std::getenv(envName); env && *env) {
            return env;
        }
        return haveConfig ? parse_config_value(config_path, "split", key) : std::string{};
    };

    if (auto raw = lookup("FRAGMENTER_MAX_LENGTH", "max_length"); !raw.empty()) {
        auto parsed = parse_int(raw);
        if (!parsed) {
            return Error{ErrorCode::InvalidArgument,
                         "Invalid max_length: " + parsed.error().message};
        }
        settings.maxLength = parsed.value();
    }

    if (auto raw = lookup("FRAGMENTER_OUTPUT_DIR", "output_dir"); !raw.empty()) {
        settings.outputDir = expand_tilde(raw);
    }

    if (haveConfig) {
        auto manifest = parse_config_value(config_path, "split", "manifest");
        settings.writeManifest = (manifest == "true" || manifest == "1" || manifest == "yes");
    }

    return settings;
}

} // namespace fragmenter::config
