#include <chrono>
#include <cstdlib>
#include <iostream>
#include <toolhost/toolhost.hpp>

// Usage: quick_start [EXECUTABLE]   (or set TOOLHOST_EXECUTABLE)
//
// Credentials are taken from TENANT_ID, CLIENT_ID and ACCESS_TOKEN when set.

int main(int argc, char** argv)
{
    std::cout << "toolhost version: " << toolhost::version_string() << "\n\n";

    toolhost::SupervisorOptions opts;
    if (argc > 1)
        opts.executable = argv[1];
    opts.log_level = toolhost::LogLevel::Info;
    opts.default_environment = {{"USE_CLIENT_TOKEN", "true"}};
    opts.stderr_callback = [](const std::string& line) { std::cerr << "[tool] " << line << "\n"; };

    for (const char* name : {"TENANT_ID", "CLIENT_ID", "ACCESS_TOKEN"})
        if (const char* value = std::getenv(name))
            opts.environment[name] = value;

    toolhost::ToolSupervisor supervisor(opts);

    try
    {
        auto start = std::chrono::steady_clock::now();
        supervisor.start().get();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        std::cout << "Ready on tier " << toolhost::to_string(supervisor.active_tier()) << " (pid "
                  << supervisor.get_pid() << ", " << elapsed.count() << "ms)\n\n";

        auto tools = supervisor.list_tools().get();
        std::cout << tools.size() << " tools:\n";
        for (const auto& tool : tools)
            std::cout << "  " << tool.name << " - " << tool.description << "\n";

        std::cout << "\nQuerying /me through the generic 'query' tool...\n";
        auto result = supervisor.call_tool("query", {{"endpoint", "/me"}, {"method", "GET"}}).get();
        std::cout << (result.is_error ? "Tool reported an error:\n" : "Result:\n")
                  << result.text() << "\n";
    }
    catch (const toolhost::LaunchError& e)
    {
        std::cerr << "Could not start the tool: " << e.what() << "\n";
        for (const auto& attempt : e.attempts())
            std::cerr << "  " << attempt.strategy << ": " << attempt.reason << "\n";
        return 1;
    }
    catch (const toolhost::ConfigurationError& e)
    {
        std::cerr << "Configuration problem: " << e.what() << "\n";
        for (const auto& name : e.missing_variables())
            std::cerr << "  missing: " << name << "\n";
        return 1;
    }
    catch (const toolhost::ToolhostError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    supervisor.stop().get();
    return 0;
}
