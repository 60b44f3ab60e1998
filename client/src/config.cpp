#include "tinyftp/client/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

#include "tinyftp/protocol.hpp"

namespace tinyftp::client
{

    namespace
    {

        constexpr std::string_view kExampleInput =
            "\n - Example input: tinyftp-client <domain/ip> <port> <put filename|get filename|list>";

        struct FileSettings
        {
            std::optional<std::filesystem::path> log_path;
            std::optional<bool> overwrite_existing;
            std::optional<bool> quiet;
        };

        std::string to_lower(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        std::string check_host(const std::string &host)
        {
            if (to_lower(host) == "localhost")
            {
                return host;
            }
            const auto allowed = [](char ch)
            {
                const auto c = static_cast<unsigned char>(ch);
                return std::isalnum(c) || ch == '_' || ch == '.' || ch == '-';
            };
            if (host.empty() || !std::all_of(host.begin(), host.end(), allowed))
            {
                throw std::runtime_error("The domain/IP address provided contains spaces and/or special characters. "
                                         "Allowed characters: letters, numbers, periods, dashes and underscores.");
            }
            return host;
        }

        std::uint16_t check_port(const std::string &port)
        {
            const bool digits = std::all_of(port.begin(), port.end(), [](char ch)
                                            { return ch >= '0' && ch <= '9'; });
            if (!digits || port.empty() || port.size() > 5)
            {
                throw std::runtime_error(
                    "The port parameter that has been provided is too short/long or is not a numerical value");
            }
            const auto value = std::stoul(port);
            if (value > 65535)
            {
                throw std::runtime_error("The port parameter that has been provided is outside the range 0-65535");
            }
            return static_cast<std::uint16_t>(value);
        }

        CommandRequest check_command(const std::vector<std::string> &words)
        {
            const auto command = tinyftp::protocol::command_from_string(words.front());
            if (!command)
            {
                throw std::runtime_error("The parameter " + to_lower(words.front()) +
                                         " is not supported by this client. Try: " + std::string(kExampleInput));
            }

            const auto name = to_lower(words.front());
            if (*command == tinyftp::protocol::Command::List)
            {
                if (words.size() != 1)
                {
                    throw std::runtime_error("The \"list\" command does not take a <filename> field. Try: " +
                                             std::string(kExampleInput));
                }
                return ListCommand{};
            }

            if (words.size() != 2 || words[1].empty())
            {
                throw std::runtime_error("The \"" + name + "\" command must be followed by the <filename> field. Try: " +
                                         std::string(kExampleInput));
            }
            if (*command == tinyftp::protocol::Command::Put)
            {
                return PutCommand{.filename = words[1]};
            }
            return GetCommand{.filename = words[1]};
        }

        FileSettings load_config_file(const std::filesystem::path &path)
        {
            std::ifstream in(path);
            if (!in.is_open())
            {
                throw std::runtime_error("Cannot open config file: " + path.string());
            }

            FileSettings settings;
            try
            {
                const auto json = nlohmann::json::parse(in);
                if (!json.is_object())
                {
                    throw std::runtime_error("Config file must contain a JSON object: " + path.string());
                }
                if (auto it = json.find("log_file"); it != json.end())
                {
                    settings.log_path = std::filesystem::path(it->get<std::string>());
                }
                if (auto it = json.find("overwrite_existing"); it != json.end())
                {
                    settings.overwrite_existing = it->get<bool>();
                }
                if (auto it = json.find("quiet"); it != json.end())
                {
                    settings.quiet = it->get<bool>();
                }
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw std::runtime_error("Invalid config file " + path.string() + ": " + ex.what());
            }
            return settings;
        }

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index + 1 >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[++index];
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        std::vector<std::string> positional;
        std::optional<std::filesystem::path> config_path;
        FileSettings cli;

        for (int index = 1; index < argc; ++index)
        {
            const std::string arg = argv[index];
            if (arg == "--log")
            {
                cli.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--config")
            {
                config_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--overwrite")
            {
                cli.overwrite_existing = true;
            }
            else if (arg == "--quiet")
            {
                cli.quiet = true;
            }
            else if (arg.rfind("--", 0) == 0)
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                positional.push_back(arg);
            }
        }

        if (positional.size() < 3)
        {
            throw std::runtime_error("The domain/IP and port parameters are required:\n" + std::string(kExampleInput));
        }

        ClientConfig config;
        config.host = check_host(positional[0]);
        config.port = check_port(positional[1]);
        config.command = check_command(std::vector<std::string>(positional.begin() + 2, positional.end()));

        if (config_path)
        {
            const auto file = load_config_file(*config_path);
            config.log_path = file.log_path.value_or(config.log_path);
            config.overwrite_existing = file.overwrite_existing.value_or(config.overwrite_existing);
            config.quiet = file.quiet.value_or(config.quiet);
        }
        config.log_path = cli.log_path.value_or(config.log_path);
        config.overwrite_existing = cli.overwrite_existing.value_or(config.overwrite_existing);
        config.quiet = cli.quiet.value_or(config.quiet);

        return config;
    }

    std::string usage(std::string_view program_name)
    {
        std::ostringstream oss;
        oss << "Usage: " << program_name << " <host> <port> <put|get|list> [filename] [options]\n"
            << "Options:\n"
            << "  --log <file>     Append the event log to file (default client.log)\n"
            << "  --config <file>  Read defaults from a JSON config file\n"
            << "  --overwrite      Let GET replace an existing local file\n"
            << "  --quiet          Do not echo log entries to the console\n"
            << "  --help           Show this help\n";
        return oss.str();
    }

} // namespace tinyftp::client
