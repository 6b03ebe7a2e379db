#include "config.hpp"
#include "commands.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "memory_system.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>

static void print_usage() {
    std::cout << "Usage: substrate [options]\n"
              << "\n"
              << "Options:\n"
              << "  -m, --message MSG      Process a single input and exit\n"
              << "  --stm-capacity N       Short-term memory capacity\n"
              << "  --ltm-capacity N       Long-term memory capacity\n"
              << "  --trace                Log memory events to stderr\n"
              << "  -h, --help             Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /store [importance] text, /recall text [stm|ltm|all],\n"
              << "  /stm, /ltm, /reinforce, /clear [stm|ltm|all], /status,\n"
              << "  /help, /quit\n"
              << "\n"
              << "Environment variables:\n"
              << "  SUBSTRATE_CONFIG               Config file (default: ~/.substrate/config.json)\n"
              << "  SUBSTRATE_STM_CAPACITY         Short-term memory capacity\n"
              << "  SUBSTRATE_LTM_CAPACITY         Long-term memory capacity\n"
              << "  SUBSTRATE_PROMOTION_THRESHOLD  Importance needed for consolidation\n";
}

static void trace_event(const substrate::Event& e) {
    using namespace substrate;
    std::string tag = e.type_tag;
    std::cerr << "[trace] " << tag;
    if (tag == ItemStoredEvent::TAG) {
        const auto& ev = static_cast<const ItemStoredEvent&>(e);
        std::cerr << " " << content_key(ev.content) << " (importance " << ev.importance << ")";
    } else if (tag == ItemPromotedEvent::TAG) {
        const auto& ev = static_cast<const ItemPromotedEvent&>(e);
        std::cerr << " " << content_key(ev.content) << " (importance " << ev.importance << ")";
    } else if (tag == ItemDiscardedEvent::TAG) {
        const auto& ev = static_cast<const ItemDiscardedEvent&>(e);
        std::cerr << " " << content_key(ev.content) << " (importance " << ev.importance << ")";
    } else if (tag == ItemEvictedEvent::TAG) {
        const auto& ev = static_cast<const ItemEvictedEvent&>(e);
        std::cerr << " " << content_key(ev.content) << " (score " << ev.score << ")";
    } else if (tag == MemoryClearedEvent::TAG) {
        const auto& ev = static_cast<const MemoryClearedEvent&>(e);
        std::cerr << " " << scope_to_string(ev.scope) << " (" << ev.removed << " removed)";
    } else if (tag == MemoryReinforcedEvent::TAG) {
        const auto& ev = static_cast<const MemoryReinforcedEvent&>(e);
        std::cerr << " (" << ev.reinforced << " items)";
    }
    std::cerr << "\n";
}

int main(int argc, char* argv[]) try {
    std::string message;
    std::string stm_arg;
    std::string ltm_arg;
    bool trace = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--stm-capacity") == 0 && i + 1 < argc) {
            stm_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--ltm-capacity") == 0 && i + 1 < argc) {
            ltm_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--trace") == 0) {
            trace = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = substrate::Config::load();

    // Override config with CLI args
    if (!stm_arg.empty()) {
        auto n = substrate::parse_uint(stm_arg);
        if (!n) {
            std::cerr << "Error: --stm-capacity expects a number, got " << stm_arg << "\n";
            return 1;
        }
        config.memory.stm_capacity = *n;
    }
    if (!ltm_arg.empty()) {
        auto n = substrate::parse_uint(ltm_arg);
        if (!n) {
            std::cerr << "Error: --ltm-capacity expects a number, got " << ltm_arg << "\n";
            return 1;
        }
        config.memory.ltm_capacity = *n;
    }

    auto status = substrate::validate(config.memory);
    if (!status.ok()) {
        std::cerr << "Error: invalid configuration: " << status.message << "\n";
        return 1;
    }

    substrate::EventBus bus;
    substrate::MemorySystem memory(config);
    if (trace) {
        bus.subscribe_any(trace_event);
        memory.set_event_bus(&bus);
    }

    // Single message mode
    if (!message.empty()) {
        std::cout << substrate::cmd_process(message, memory) << '\n';
        return 0;
    }

    // Interactive REPL
    std::cout << "Substrate memory shell\n"
              << "Module: " << memory.name()
              << " | STM " << config.memory.stm_capacity
              << " | LTM " << config.memory.ltm_capacity << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    while (true) {
        std::cout << "substrate> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        if (substrate::trim(line).empty()) continue;

        bool quit = false;
        std::string output = substrate::dispatch_command(line, memory, quit);
        if (quit) break;
        std::cout << output << "\n";
    }

    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
