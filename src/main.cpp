#include <iostream>
#include <string>
#include <vector>
#include "config.hpp"
#include "errors.hpp"
#include "factory.hpp"
#include "state.hpp"
#include "tool_registry.hpp"

static void print_usage() {
    std::cout << "Usage: arena <command> [options]\n\n"
              << "Commands:\n"
              << "  run [--config PATH] [--strategy NAME] [--model MODEL] [--logs] -m MSG\n"
              << "                              Process one message with a configured agent\n"
              << "  tools                       List the built-in tools\n"
              << "  graph --strategy NAME       Print a strategy's step graph as JSON\n";
}

static int cmd_run(const std::vector<std::string>& args) {
    std::string message;
    std::string config_path;
    std::string strategy;
    std::string model_override;
    bool logs = false;
    for (size_t i = 0; i < args.size(); i++) {
        if ((args[i] == "-m" || args[i] == "--message") && i + 1 < args.size()) {
            message = args[++i];
        } else if (args[i] == "--config" && i + 1 < args.size()) {
            config_path = args[++i];
        } else if (args[i] == "--strategy" && i + 1 < args.size()) {
            strategy = args[++i];
        } else if (args[i] == "--model" && i + 1 < args.size()) {
            model_override = args[++i];
        } else if (args[i] == "--logs") {
            logs = true;
        }
    }
    if (message.empty()) {
        std::cerr << "run: -m MESSAGE is required\n";
        return 1;
    }

    try {
        arena::AgentConfig cfg = config_path.empty() ? arena::AgentConfig{}
                                                     : arena::AgentConfig::load(config_path);
        if (!strategy.empty()) cfg.strategy = strategy;
        if (!model_override.empty()) cfg.model = model_override;
        if (logs) cfg.verbose = true;

        auto agent = arena::AgentFactory::create_agent(cfg.strategy, cfg);
        std::cout << agent->process(message) << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

static int cmd_tools() {
    std::cout << arena::ToolRegistry::global().help_text();
    return 0;
}

static int cmd_graph(const std::vector<std::string>& args) {
    std::string strategy;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--strategy" && i + 1 < args.size()) strategy = args[++i];
    }
    if (strategy.empty()) {
        std::cerr << "graph: --strategy NAME is required\n";
        return 1;
    }
    try {
        std::cout << arena::describe_graph(arena::parse_strategy(strategy)).dump(2) << "\n";
        return 0;
    } catch (const arena::UnknownStrategyError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    if (cmd == "run") {
        return cmd_run(args);
    }
    else if (cmd == "tools") {
        return cmd_tools();
    }
    else if (cmd == "graph") {
        return cmd_graph(args);
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
