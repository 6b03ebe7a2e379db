#include "commands.hpp"
#include "memory_system.hpp"
#include "util.hpp"
#include <sstream>

namespace substrate {

static std::string render_items(const std::string& title,
                                const std::vector<MemoryItem>& items) {
    std::ostringstream ss;
    ss << title << " (" << items.size() << ")\n";
    for (size_t i = 0; i < items.size(); i++) {
        ss << "  " << i + 1 << ". " << content_key(items[i].content)
           << "  [importance " << items[i].importance
           << ", accessed " << items[i].access_count << "]\n";
    }
    return ss.str();
}

std::string cmd_status(const MemorySystem& memory) {
    auto s = memory.status();
    return "Module: " + s["name"].get<std::string>() + "\n"
        + "State: " + s["state"].get<std::string>() + "\n"
        + "Short-term: " + std::to_string(s["stm_size"].get<size_t>())
        + "/" + std::to_string(s["stm_capacity"].get<size_t>()) + "\n"
        + "Long-term: " + std::to_string(s["ltm_size"].get<size_t>())
        + "/" + std::to_string(s["ltm_capacity"].get<size_t>()) + "\n";
}

std::string cmd_stm(const MemorySystem& memory) {
    return render_items("Short-term memory", memory.stm_snapshot());
}

std::string cmd_ltm(const MemorySystem& memory) {
    return render_items("Long-term memory", memory.ltm_snapshot());
}

std::string cmd_store(const std::string& args_str, MemorySystem& memory) {
    auto args = trim(args_str);
    if (args.empty()) return "Usage: /store [importance] text";

    std::optional<double> importance;
    std::string text = args;
    auto space = args.find(' ');
    if (space != std::string::npos) {
        auto value = parse_double(args.substr(0, space));
        if (value && *value >= 0.0 && *value <= 1.0) {
            importance = value;
            text = trim(args.substr(space + 1));
        }
    }

    memory.store(text, importance);
    std::ostringstream ss;
    ss << "Stored (importance " << importance.value_or(memory.config().default_importance) << ")";
    return ss.str();
}

std::string cmd_recall(const std::string& args_str, MemorySystem& memory) {
    auto args = trim(args_str);
    if (args.empty()) return "Usage: /recall text [stm|ltm|all]";

    MemoryScope scope = MemoryScope::All;
    std::string query = args;
    auto space = args.rfind(' ');
    if (space != std::string::npos) {
        if (auto parsed = scope_from_string(args.substr(space + 1))) {
            scope = *parsed;
            query = trim(args.substr(0, space));
        }
    }

    auto results = memory.retrieve(query, scope);
    if (results.empty()) return "No matching memories.";

    std::string out = "Found " + std::to_string(results.size()) + " ("
        + scope_to_string(scope) + "):\n";
    for (const auto& content : results) {
        out += "  - " + content_key(content) + "\n";
    }
    return out;
}

std::string cmd_reinforce(MemorySystem& memory) {
    memory.update({{"reinforce", true}});
    return "Reinforced the " + std::to_string(memory.config().reinforce_window)
        + " most recent short-term memories.";
}

std::string cmd_clear(const std::string& args_str, MemorySystem& memory) {
    auto args = trim(args_str);
    auto scope = args.empty() ? std::optional<MemoryScope>(MemoryScope::All)
                              : scope_from_string(args);
    if (!scope) return "Usage: /clear [stm|ltm|all]";

    if (*scope != MemoryScope::LongTerm) memory.clear_stm();
    if (*scope != MemoryScope::ShortTerm) memory.clear_ltm();
    return "Cleared " + scope_to_string(*scope) + " memory.";
}

std::string cmd_process(const std::string& line, MemorySystem& memory) {
    return memory.process(line).to_json().dump(2, ' ', false,
                                                nlohmann::json::error_handler_t::replace);
}

std::string cmd_help() {
    return "Commands:\n"
           "  /store [importance] text   Store text (importance 0..1)\n"
           "  /recall text [stm|ltm|all] Search memories\n"
           "  /stm                       Show short-term memory\n"
           "  /ltm                       Show long-term memory\n"
           "  /reinforce                 Boost the most recent memories\n"
           "  /clear [stm|ltm|all]       Clear memory\n"
           "  /status                    Show current status\n"
           "  /quit                      Exit\n"
           "  /help                      Show this help\n"
           "Any other line is processed by the memory module.";
}

std::string dispatch_command(const std::string& line, MemorySystem& memory, bool& quit) {
    quit = false;
    if (line.empty() || line[0] != '/') return cmd_process(line, memory);

    auto space = line.find(' ');
    std::string cmd = line.substr(0, space);
    std::string args = space == std::string::npos ? "" : line.substr(space + 1);

    if (cmd == "/quit" || cmd == "/exit") {
        quit = true;
        return {};
    }
    if (cmd == "/store")     return cmd_store(args, memory);
    if (cmd == "/recall")    return cmd_recall(args, memory);
    if (cmd == "/stm")       return cmd_stm(memory);
    if (cmd == "/ltm")       return cmd_ltm(memory);
    if (cmd == "/reinforce") return cmd_reinforce(memory);
    if (cmd == "/clear")     return cmd_clear(args, memory);
    if (cmd == "/status")    return cmd_status(memory);
    if (cmd == "/help")      return cmd_help();
    return "Unknown command: " + cmd;
}

} // namespace substrate
