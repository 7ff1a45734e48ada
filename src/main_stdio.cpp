#include "core/AudioFileWriter.hpp"
#include "core/DeepgramClient.hpp"
#include "core/Logging.hpp"
#include "core/ServerConfig.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/RequestDispatcher.hpp"
#include "mcp/ShutdownSignal.hpp"
#include "mcp/StdioTransport.hpp"
#include "mcp/ToolRegistry.hpp"
#include "tools/TextToSpeechTool.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    // Parse command-line arguments
    CLI::App app{"Deepgram MCP Server - text-to-speech over stdio JSON-RPC"};

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("info");

    std::string api_url = dg_mcp::ServerConfig::DEFAULT_API_URL;
    app.add_option("--api-url", api_url, "Base URL of the Deepgram API")
        ->default_val(dg_mcp::ServerConfig::DEFAULT_API_URL);

    std::string model = dg_mcp::ServerConfig::DEFAULT_MODEL;
    app.add_option("-m,--model", model, "Deepgram voice model")
        ->default_val(dg_mcp::ServerConfig::DEFAULT_MODEL);

    int timeout_seconds = dg_mcp::ServerConfig::DEFAULT_TIMEOUT_SECONDS;
    app.add_option("-t,--timeout", timeout_seconds, "HTTP timeout in seconds for Deepgram requests")
        ->default_val(dg_mcp::ServerConfig::DEFAULT_TIMEOUT_SECONDS)
        ->check(CLI::PositiveNumber);

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << dg_mcp::RequestDispatcher::SERVER_NAME << " version "
                  << dg_mcp::RequestDispatcher::SERVER_VERSION << std::endl;
        return 0;
    }

    // stdout carries protocol traffic only; all logging goes to stderr
    if (!dg_mcp::configure_logging(log_level)) {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return 1;
    }

    spdlog::info("Starting Deepgram MCP Server");
    spdlog::info("Log level: {}", log_level);

    try {
        auto config = dg_mcp::ServerConfig::from_environment(api_url, model, timeout_seconds);

        // Create core components
        auto synthesizer = std::make_shared<dg_mcp::DeepgramClient>(config);
        auto sink = std::make_shared<dg_mcp::AudioFileWriter>();
        auto tts_tool = std::make_shared<dg_mcp::TextToSpeechTool>(synthesizer, sink);

        auto registry = std::make_shared<dg_mcp::ToolRegistry>();
        registry->register_tool(
            dg_mcp::TextToSpeechTool::get_info(),
            [tts_tool](const dg_mcp::ToolArguments& args) {
                return tts_tool->execute(args);
            }
        );

        auto dispatcher = std::make_shared<dg_mcp::RequestDispatcher>(registry);
        auto transport = std::make_unique<dg_mcp::StdioTransport>();
        auto server = std::make_unique<dg_mcp::MCPServer>(std::move(transport), dispatcher);

        // SIGINT/SIGTERM end the loop, even while it waits for input
        dg_mcp::ShutdownSignal::install(server.get());

        spdlog::info("All tools registered, starting server");

        // Run server (blocks until input ends or stopped)
        bool clean = server->run();

        bool signalled = dg_mcp::ShutdownSignal::requested();
        dg_mcp::ShutdownSignal::uninstall();
        if (!clean) {
            spdlog::error("Server stopped after a stream failure");
            return 1;
        }
        spdlog::info("Server stopped cleanly{}", signalled ? " (signal)" : "");
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
