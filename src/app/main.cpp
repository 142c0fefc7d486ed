// casement: desktop shell entry point.
//
// Usage:
//   casement [--dev [url]] [--content <dir>] [--settings <file>]
//            [--socket <path>] [--log-level <level>] [--log-file <path>]

#include <casement/logger.hpp>
#include "shell.hpp"

#include "../ipc/transport.hpp"
#include "../window/content_source.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

namespace
{

std::atomic<bool> g_running{true};

void signal_handler(int /*sig*/)
{
    g_running.store(false, std::memory_order_relaxed);
}

void print_usage(const char* argv0)
{
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --dev [url]          Load UI pages from a dev server (default "
              << casement::DEFAULT_DEV_SERVER << ")\n"
              << "  --content <dir>      Load packaged UI pages from <dir>\n"
              << "  --settings <file>    Settings file\n"
              << "  --socket <path>      Renderer socket\n"
              << "  --log-level <level>  trace|debug|info|warning|error|critical\n"
              << "  --log-file <path>    Also append log output to <path>\n"
              << "  --help               Show this help\n";
}

// Packaged UI pages sit in ui/ next to the binary.
std::string default_content_dir(const char* argv0)
{
    std::string self(argv0);
    auto        slash = self.rfind('/');
    if (slash != std::string::npos)
        return self.substr(0, slash + 1) + "ui";
    return "ui";
}

bool parse_level(const std::string& text, casement::LogLevel& out)
{
    auto level = casement::Logger::level_from_string(text);
    if (!level)
    {
        std::cerr << "casement: unknown log level '" << text << "'\n";
        return false;
    }
    out = *level;
    return true;
}

}   // namespace

int main(int argc, char* argv[])
{
    casement::ShellConfig config;

    if (const char* env = std::getenv("CASEMENT_DEV_SERVER"); env && env[0] != '\0')
        config.dev_server_url = env;
    if (const char* env = std::getenv("CASEMENT_LOG_LEVEL"); env && env[0] != '\0')
    {
        if (!parse_level(env, config.log_level))
            return 2;
    }

    for (int i = 1; i < argc; ++i)
    {
        std::string arg  = argv[i];
        auto        next = [&]() -> const char* { return i + 1 < argc ? argv[++i] : nullptr; };

        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg == "--dev")
        {
            // The URL is optional.
            if (i + 1 < argc && argv[i + 1][0] != '-')
                config.dev_server_url = argv[++i];
            else
                config.dev_server_url = casement::DEFAULT_DEV_SERVER;
        }
        else if (arg == "--content" || arg == "--settings" || arg == "--socket" || arg == "--log-level"
                 || arg == "--log-file")
        {
            const char* value = next();
            if (!value)
            {
                std::cerr << "casement: " << arg << " needs a value\n";
                return 2;
            }
            if (arg == "--content")
            {
                config.content_dir = value;
                config.dev_server_url.clear();
            }
            else if (arg == "--settings")
                config.settings_path = value;
            else if (arg == "--socket")
                config.socket_path = value;
            else if (arg == "--log-level")
            {
                if (!parse_level(value, config.log_level))
                    return 2;
            }
            else
                config.log_file = value;
        }
        else
        {
            std::cerr << "casement: unknown option '" << arg << "'\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    if (config.content_dir.empty())
        config.content_dir = default_content_dir(argv[0]);
    if (config.socket_path.empty())
        config.socket_path = casement::ipc::default_socket_path();

    // ─── Logging ─────────────────────────────────────────────────────────────
    auto& logger = casement::Logger::instance();
    logger.set_level(config.log_level);
    logger.add_sink(casement::sinks::console_sink());
    if (!config.log_file.empty())
        logger.add_sink(casement::sinks::file_sink(config.log_file));

    // ─── Single instance ─────────────────────────────────────────────────────
    if (casement::forward_to_running_instance(config.socket_path))
        return 0;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    casement::Shell shell(config);
    if (!shell.init_runtime())
    {
        CASEMENT_LOG_CRITICAL("shell", "Startup failed");
        shell.shutdown_runtime();
        return 1;
    }

    while (g_running.load(std::memory_order_relaxed) && shell.step(0.05))
    {
    }

    shell.shutdown_runtime();
    CASEMENT_LOG_INFO("shell", "Exited cleanly");
    return 0;
}
