#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace clawbridge::client
{

    struct ClientConfig
    {
        std::string url;
        std::string token;
        std::optional<std::filesystem::path> notes_path;
        std::optional<std::filesystem::path> log_path;
        std::optional<std::filesystem::path> config_path;
        bool enabled{true};
        bool verbose{false};
        bool probe{false};
        bool show_help{false};
    };

    // Command line flags override values loaded from --config; the token falls back to CLAWBRIDGE_TOKEN.
    ClientConfig parse_arguments(int argc, char *argv[]);

    // Reads {"url", "token", "notes_path", "log", "enabled"} from a JSON file into config.
    void load_config_file(const std::filesystem::path &path, ClientConfig &config);

    bool is_configured(const ClientConfig &config);

    std::string usage(const std::string &program_name);

} // namespace clawbridge::client
