#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <magic_enum/magic_enum.hpp>

#include <nlohmann/json.hpp>

#include <igm/util/log.hpp>

#include <igm/config.hpp>
#include <igm/constants.hpp>
#include <igm/grid_settings.hpp>
#include <igm/json_util.hpp>
#include <igm/version.hpp>

#include <igm/pdf/generate.hpp>

using SettingsOverrides = std::unordered_map<std::string, std::string>;

struct CommandLineOptions
{
    bool m_Valid{ true };
    bool m_HelpDisplayed{ false };
    bool m_VersionDisplayed{ false };

    bool m_Deterministic{ false };
    std::optional<PdfBackend> m_Backend{ std::nullopt };

    std::optional<fs::path> m_SettingsFile{ std::nullopt };
    std::vector<fs::path> m_Images{};
    fs::path m_Output{ c_DefaultOutputFile };
    SettingsOverrides m_SettingsOverrides{};
};

constexpr const char c_HelpStr[]{
    R"(
Command Line Interface for Image Grid Maker

    --help                  Display this information.
    --version               Display the version and quit.
    --settings <file>       Load the grid settings from this file,
                            defaults are used if it is missing.
    --image <file>          Add an image to the grid, may be repeated.
    --image_dir <dir>       Add all images in this folder, sorted by name.
    --output <file>         Write the document to this file,
                            defaults to output.pdf.
    --backend <name>        Either PoDoFo or Png.
    --deterministic         Omit the creation date from the document.
    --grid                  Take all following commands and override
                            grid settings with them.

Grid Overrides are formatted as follows:
    --<name> <value>    Will override the setting <name> with the
                        value <value> as if parsed as json, where
                        <name> refers to the names seen in
                        grid_settings.json files.
                        For example:
                            --col_width_mm 25.4
                            --grid_color "#ff0000"
                            --page_size A3
)"
};

class OverridesProvider : public JsonProvider
{
  public:
    OverridesProvider(const SettingsOverrides& overrides)
        : m_Overrides{ overrides }
    {
    }

    virtual nlohmann::json GetJsonValue(std::string_view path_view) const override
    {
        const std::string path{ path_view };
        if (m_Overrides.contains(path))
        {
            const auto& value{ m_Overrides.at(path) };
            try
            {
                // Try parsing the override as a literal ...
                return nlohmann::json::parse(value);
            }
            catch (const nlohmann::json::parse_error&)
            {
                // ... and keep it as a string if that's not possible.
                return value;
            }
        }

        return nlohmann::json{};
    }

  private:
    const SettingsOverrides& m_Overrides;
};

CommandLineOptions ParseCommandLine(int argc, char** raw_argv)
{
    using namespace std::string_view_literals;

    std::span argv{ raw_argv, static_cast<size_t>(argc) };

    CommandLineOptions cli;

    if (std::ranges::contains(argv, "--help"sv))
    {
        fmt::print("{}", c_HelpStr);
        cli.m_HelpDisplayed = true;
        return cli;
    }

    if (std::ranges::contains(argv, "--version"sv))
    {
        fmt::print("Image Grid Maker {}\n", ImageGridVersion());
        cli.m_VersionDisplayed = true;
        return cli;
    }

    const auto invalid{
        [&cli]()
        {
            cli.m_Valid = false;
            return cli;
        }
    };

    size_t i{ 1 };
    const auto next_param{
        [&](std::string_view arg) -> std::optional<std::string_view>
        {
            if (i + 1 >= argv.size())
            {
                LogError("Command line option {} expects a value", arg);
                return std::nullopt;
            }
            return std::string_view{ argv[++i] };
        }
    };

    for (; i < argv.size(); i++)
    {
        const std::string_view arg{ argv[i] };
        if (arg == "--deterministic")
        {
            cli.m_Deterministic = true;
        }
        else if (arg == "--grid")
        {
            // Parse overrides from now on out
            ++i;
            break;
        }
        else if (arg == "--settings" || arg == "--image" || arg == "--image_dir" ||
                 arg == "--output" || arg == "--backend")
        {
            const auto param{ next_param(arg) };
            if (!param.has_value())
            {
                return invalid();
            }

            if (arg == "--settings")
            {
                cli.m_SettingsFile = fs::path{ param.value() };
            }
            else if (arg == "--image")
            {
                cli.m_Images.push_back(fs::path{ param.value() });
            }
            else if (arg == "--image_dir")
            {
                const fs::path image_dir{ param.value() };
                if (!fs::is_directory(image_dir))
                {
                    LogError("Image folder {} does not exist", image_dir.string());
                    return invalid();
                }

                for (auto& image : ListFiles(image_dir) | std::views::filter(HasImageExtension))
                {
                    cli.m_Images.push_back(std::move(image));
                }
            }
            else if (arg == "--output")
            {
                cli.m_Output = fs::path{ param.value() };
            }
            else
            {
                cli.m_Backend = magic_enum::enum_cast<PdfBackend>(param.value());
                if (!cli.m_Backend.has_value())
                {
                    LogError("Unknown backend {}, expected one of {}",
                             param.value(),
                             fmt::join(magic_enum::enum_names<PdfBackend>(), ", "));
                    return invalid();
                }
            }
        }
        else
        {
            LogError("Unknown command line option {}", arg);
            return invalid();
        }
    }

    for (; i < argv.size(); i += 2)
    {
        const std::string_view arg{ argv[i] };
        if (!arg.starts_with("--") || i + 1 >= argv.size())
        {
            LogError("Error while parsing grid overrides. Expected --<name> <value> but got {}", arg);
            return invalid();
        }

        const std::string_view param{ argv[i + 1] };
        cli.m_SettingsOverrides[std::string{ arg.substr(2) }] = param;
    }

    return cli;
}

int main(int argc, char** argv)
{
    Log::RegisterThreadName("MainThread");

    LogFlags log_flags{
        LogFlags::Console |
        LogFlags::File |
        LogFlags::FatalQuit |
        LogFlags::DetailFile |
        LogFlags::DetailLine |
        LogFlags::DetailColumn |
        LogFlags::DetailThread |
        LogFlags::DetailStacktrace
    };
    Log main_log{ log_flags, Log::c_MainLogName };

    CommandLineOptions cli{ ParseCommandLine(argc, argv) };
    if (cli.m_HelpDisplayed || cli.m_VersionDisplayed)
    {
        return 0;
    }
    if (!cli.m_Valid)
    {
        fmt::print("{}", c_HelpStr);
        return 1;
    }

    if (cli.m_Deterministic)
    {
        g_Cfg.m_DeterministicPdfOutput = true;
    }
    if (cli.m_Backend.has_value())
    {
        g_Cfg.m_Backend = cli.m_Backend.value();
    }

    OverridesProvider overrides_provider{
        cli.m_SettingsOverrides
    };

    GridSettings settings{};
    if (cli.m_SettingsFile.has_value())
    {
        if (!settings.Load(cli.m_SettingsFile.value(), &overrides_provider))
        {
            LogWarning("Settings in {} were incomplete, see above...", cli.m_SettingsFile.value().string());
        }
    }
    else if (!cli.m_SettingsOverrides.empty())
    {
        LogInfo("Starting from default settings with overrides...");
        if (!settings.LoadFromJson(settings.DumpToJson(), &overrides_provider))
        {
            LogWarning("Some grid overrides were invalid, see above...");
        }
    }
    else
    {
        LogInfo("Starting from default settings...");
    }

    if (cli.m_Images.empty())
    {
        LogWarning("No images given, the document will only contain the grid...");
    }

    try
    {
        const auto progress{
            [](int percent)
            {
                LogDebug("Rendering progress {}%", percent);
            }
        };

        if (const auto output{ GeneratePdf(cli.m_Images, settings, cli.m_Output, progress) })
        {
            LogInfo("Rendered {}", output.value().string());
            return 0;
        }

        LogError("Rendering was cancelled");
        return 1;
    }
    catch (const std::exception& e)
    {
        LogError("Failure while creating pdf: {}", e.what());
        return 1;
    }
}
