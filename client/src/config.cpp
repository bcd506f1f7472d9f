#include "clawbridge/client/config.hpp"

#include <cstdlib>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "clawbridge/error_codes.hpp"

namespace clawbridge::client
{

    namespace
    {

        bool is_blank(const std::string &value)
        {
            return value.find_first_not_of(" \t\r\n") == std::string::npos;
        }

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw BridgeError(ErrorCode::InvalidConfig, flag + " requires a value");
            }
            return argv[index++];
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;

        for (int i = 1; i + 1 < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                config.config_path = std::filesystem::path(argv[i + 1]);
            }
        }
        if (config.config_path)
        {
            load_config_file(*config.config_path, config);
        }

        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--token")
            {
                config.token = require_value(index, argc, argv, arg);
            }
            else if (arg == "--notes")
            {
                config.notes_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--config")
            {
                (void)require_value(index, argc, argv, arg);
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--probe")
            {
                config.probe = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
            }
            else if (!arg.empty() && arg.front() != '-')
            {
                // A positional url replaces the one from the config file.
                config.url = arg;
            }
            else
            {
                throw BridgeError(ErrorCode::InvalidConfig, "Unknown argument: " + arg);
            }
        }

        if (config.token.empty())
        {
            if (const char *token = std::getenv("CLAWBRIDGE_TOKEN"))
            {
                config.token = token;
            }
        }
        return config;
    }

    void load_config_file(const std::filesystem::path &path, ClientConfig &config)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw BridgeError(ErrorCode::InvalidConfig, "Unable to open config file: " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw BridgeError(ErrorCode::InvalidConfig, "Invalid config file " + path.string() + ": " + ex.what());
        }
        if (!json.is_object())
        {
            throw BridgeError(ErrorCode::InvalidConfig, "Config file must contain a JSON object: " + path.string());
        }

        try
        {
            config.url = json.value("url", config.url);
            config.token = json.value("token", config.token);
            config.enabled = json.value("enabled", true);
            if (auto it = json.find("notes_path"); it != json.end())
            {
                config.notes_path = std::filesystem::path(it->get<std::string>());
            }
            if (auto it = json.find("log"); it != json.end())
            {
                config.log_path = std::filesystem::path(it->get<std::string>());
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw BridgeError(ErrorCode::InvalidConfig, "Invalid config file " + path.string() + ": " + ex.what());
        }
    }

    bool is_configured(const ClientConfig &config)
    {
        return !is_blank(config.url) && !is_blank(config.token);
    }

    std::string usage(const std::string &program_name)
    {
        return "Usage: " + program_name +
               " <url> [--token <token>] [--notes <dir>] [--log <file>] [--config <file.json>] [--verbose] [--probe]\n"
               "  <url>              Base address of the desktop app, e.g. http://127.0.0.1:3777\n"
               "  --token <token>    Shared secret (default: $CLAWBRIDGE_TOKEN)\n"
               "  --notes <dir>      Notes directory to keep in sync\n"
               "  --log <file>       Append logs to file\n"
               "  --config <file>    Load url/token/notes_path/log/enabled from a JSON file\n"
               "  --verbose          Debug logging\n"
               "  --probe            Check <url>/health and exit\n";
    }

} // namespace clawbridge::client
