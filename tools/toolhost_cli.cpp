/**
 * toolhost_cli.cpp - Diagnostic front end for a wrapped tool process
 *
 * Starts a supervisor, runs one command against the tool process, prints the
 * JSON result and stops again.
 *
 *   toolhost_cli [--config FILE] [--exe PATH] [--arg A]... [--env K=V]...
 *                [--timeout MS] [--verbose] (tools | call NAME JSON_ARGS | status)
 *
 * Exit codes: 0 success, 1 toolhost error, 2 usage error.
 */

#include <iostream>
#include <optional>
#include <string>
#include <toolhost/toolhost.hpp>
#include <vector>

namespace
{

constexpr int EXIT_TOOLHOST_ERROR = 1;
constexpr int EXIT_USAGE = 2;

struct UsageError : std::runtime_error
{
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

struct CommandLine
{
    std::optional<std::string> config_file;
    std::optional<std::string> executable;
    std::vector<std::string> args;
    toolhost::EnvironmentBundle environment;
    std::optional<int> timeout_ms;
    bool verbose = false;

    std::string command;
    std::vector<std::string> operands;
};

void print_usage(std::ostream& out)
{
    out << "Usage: toolhost_cli [--config FILE] [--exe PATH] [--arg A]... [--env K=V]...\n"
           "                    [--timeout MS] [--verbose] (tools | call NAME JSON_ARGS | status)\n";
}

CommandLine parse_command_line(int argc, char** argv)
{
    CommandLine cl;

    auto value_of = [&](int& i, const std::string& flag) -> std::string
    {
        if (i + 1 >= argc)
            throw UsageError(flag + " requires a value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (!cl.command.empty())
        {
            cl.operands.push_back(arg);
            continue;
        }

        if (arg == "--config")
        {
            cl.config_file = value_of(i, arg);
        }
        else if (arg == "--exe")
        {
            cl.executable = value_of(i, arg);
        }
        else if (arg == "--arg")
        {
            cl.args.push_back(value_of(i, arg));
        }
        else if (arg == "--env")
        {
            std::string pair = value_of(i, arg);
            auto eq = pair.find('=');
            if (eq == std::string::npos || eq == 0)
                throw UsageError("--env expects KEY=VALUE, got '" + pair + "'");
            cl.environment[pair.substr(0, eq)] = pair.substr(eq + 1);
        }
        else if (arg == "--timeout")
        {
            std::string value = value_of(i, arg);
            try
            {
                size_t consumed = 0;
                int ms = std::stoi(value, &consumed);
                if (consumed != value.size() || ms <= 0)
                    throw UsageError("--timeout expects a positive number of milliseconds");
                cl.timeout_ms = ms;
            }
            catch (const std::logic_error&)
            {
                throw UsageError("--timeout expects a positive number of milliseconds");
            }
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            cl.verbose = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            cl.command = "help";
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            throw UsageError("Unknown option: " + arg);
        }
        else
        {
            cl.command = arg;
        }
    }

    if (cl.command.empty())
        throw UsageError("No command given");
    if (cl.command == "call" && cl.operands.size() != 2)
        throw UsageError("call expects NAME and JSON_ARGS");
    if ((cl.command == "tools" || cl.command == "status") && !cl.operands.empty())
        throw UsageError(cl.command + " takes no arguments");
    if (cl.command != "tools" && cl.command != "call" && cl.command != "status" &&
        cl.command != "help")
        throw UsageError("Unknown command: " + cl.command);

    return cl;
}

toolhost::SupervisorOptions build_options(const CommandLine& cl)
{
    toolhost::SupervisorOptions options =
        cl.config_file ? toolhost::load_options_file(*cl.config_file) : toolhost::SupervisorOptions{};

    if (cl.executable)
        options.executable = *cl.executable;
    if (!cl.args.empty())
        options.args = cl.args;
    for (const auto& [key, value] : cl.environment)
        options.environment[key] = value;
    if (cl.timeout_ms)
    {
        options.handshake_timeout_ms = *cl.timeout_ms;
        options.request_timeout_ms = *cl.timeout_ms;
    }

    if (cl.verbose)
    {
        options.log_level = toolhost::LogLevel::Debug;
        options.stderr_callback = [](const std::string& line)
        { std::cerr << "[tool stderr] " << line << "\n"; };
    }

    return options;
}

toolhost::json status_json(const toolhost::ToolSupervisor& supervisor)
{
    toolhost::json status = {{"state", toolhost::to_string(supervisor.state())},
                             {"tier", toolhost::to_string(supervisor.active_tier())},
                             {"alive", supervisor.is_alive()},
                             {"pid", supervisor.get_pid()},
                             {"version", toolhost::version_string()}};
    if (auto info = supervisor.server_info())
        status["server"] = *info;
    return status;
}

int run(const CommandLine& cl)
{
    toolhost::json args;
    if (cl.command == "call")
    {
        args = toolhost::json::parse(cl.operands[1], nullptr, false);
        if (args.is_discarded() || !args.is_object())
            throw UsageError("JSON_ARGS must be a JSON object");
    }

    toolhost::ToolSupervisor supervisor(build_options(cl));
    supervisor.start().get();

    toolhost::json output;
    if (cl.command == "tools")
    {
        output = toolhost::json::array();
        for (const auto& tool : supervisor.list_tools().get())
            output.push_back(tool.to_json());
    }
    else if (cl.command == "call")
    {
        auto result = supervisor.call_tool(cl.operands[0], args).get();
        output = result.raw;
    }
    else
    {
        output = status_json(supervisor);
    }

    supervisor.stop().get();

    std::cout << output.dump(2) << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    CommandLine cl;
    try
    {
        cl = parse_command_line(argc, argv);
        if (cl.command == "help")
        {
            print_usage(std::cout);
            return 0;
        }
        return run(cl);
    }
    catch (const UsageError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(std::cerr);
        return EXIT_USAGE;
    }
    catch (const toolhost::LaunchError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        for (const auto& attempt : e.attempts())
            std::cerr << "  " << attempt.strategy << " (" << attempt.tier << "): " << attempt.reason
                      << "\n";
        return EXIT_TOOLHOST_ERROR;
    }
    catch (const toolhost::RemoteError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        if (e.data())
            std::cerr << "  data: " << e.data()->dump() << "\n";
        return EXIT_TOOLHOST_ERROR;
    }
    catch (const toolhost::ConfigurationError& e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return EXIT_TOOLHOST_ERROR;
    }
    catch (const toolhost::ToolhostError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_TOOLHOST_ERROR;
    }
}
