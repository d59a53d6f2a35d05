#include <iostream>
#include <optional>

#include <fmt/format.h>
#include <lyra/lyra.hpp>

#include "inspect.hpp"
#include "serve.hpp"

struct ServeProgram
{
    bool showHelp = false;
    std::string configPath;
    std::string deviceAddress;
    std::string logLevel = "info";
    int exitCode = 0;

    void addCommand(lyra::group& g)
    {
        g.add_argument(lyra::command("serve", [this](const lyra::group& f) { run(f); })
                           .add_argument(lyra::help(showHelp))
                           .add_argument(lyra::opt(configPath, "config")
                                             .name("--config")
                                             .name("-c")
                                             .required()
                                             .help("Path to the configuration file"))
                           .add_argument(lyra::opt(deviceAddress, "device")
                                             .name("--device")
                                             .name("-d")
                                             .help("Serial device, overrides [device] address"))
                           .add_argument(lyra::opt(logLevel, "level")
                                             .name("--log-level")
                                             .name("-l")
                                             .help("trace, debug, info, warn, error or off")));
    }

    void run(const lyra::group& g)
    {
        if (showHelp)
        {
            std::cout << g;
            return;
        }

        auto device = deviceAddress.empty() ? std::nullopt : std::optional(deviceAddress);
        exitCode = votebridge_cli::serve(configPath, device, logLevel);
    }
};

struct StatusProgram
{
    bool showHelp = false;
    std::string configPath;
    int exitCode = 0;

    void addCommand(lyra::group& g)
    {
        g.add_argument(lyra::command("status", [this](const lyra::group& f) { run(f); })
                           .add_argument(lyra::help(showHelp))
                           .add_argument(lyra::opt(configPath, "config")
                                             .name("--config")
                                             .name("-c")
                                             .required()
                                             .help("Path to the configuration file")));
    }

    void run(const lyra::group& g)
    {
        if (showHelp)
        {
            std::cout << g;
            return;
        }

        exitCode = votebridge_cli::status(configPath);
    }
};

struct ExportAuditProgram
{
    bool showHelp = false;
    std::string configPath;
    std::string outputPath;
    int exitCode = 0;

    void addCommand(lyra::group& g)
    {
        g.add_argument(lyra::command("export-audit", [this](const lyra::group& f) { run(f); })
                           .add_argument(lyra::help(showHelp))
                           .add_argument(lyra::opt(configPath, "config")
                                             .name("--config")
                                             .name("-c")
                                             .required()
                                             .help("Path to the configuration file"))
                           .add_argument(lyra::opt(outputPath, "output")
                                             .name("--output")
                                             .name("-o")
                                             .required()
                                             .help("Path of the CSV file to write")));
    }

    void run(const lyra::group& g)
    {
        if (showHelp)
        {
            std::cout << g;
            return;
        }

        exitCode = votebridge_cli::exportAudit(configPath, outputPath);
    }
};

int main(int argc, char** argv)
{
    bool showHelp = false;
    lyra::group global;
    global.add_argument(lyra::help(showHelp));

    lyra::group subcommands;
    subcommands.require(1, 1);

    ServeProgram serve;
    serve.addCommand(subcommands);
    StatusProgram status;
    status.addCommand(subcommands);
    ExportAuditProgram exportAudit;
    exportAudit.addCommand(subcommands);

    auto cli = lyra::cli().add_argument(global).add_argument(subcommands);
    auto result = cli.parse({argc, argv});
    if (!result)
    {
        std::cerr << result.message() << '\n';
        return 1;
    }
    if (showHelp)
    {
        std::cout << cli;
        return 0;
    }

    return serve.exitCode != 0 ? serve.exitCode
        : status.exitCode != 0 ? status.exitCode
                               : exportAudit.exitCode;
}
