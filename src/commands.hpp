#pragma once
#include <string>

namespace substrate {

class MemorySystem;

// Command handlers for the interactive shell. Each returns the text to
// print; argument errors come back as a usage line, never as an exception.

std::string cmd_status(const MemorySystem& memory);
std::string cmd_stm(const MemorySystem& memory);
std::string cmd_ltm(const MemorySystem& memory);

// "/store [importance] text": a leading number in [0, 1] is the importance.
std::string cmd_store(const std::string& args, MemorySystem& memory);

// "/recall text [stm|ltm|all]"
std::string cmd_recall(const std::string& args, MemorySystem& memory);

std::string cmd_reinforce(MemorySystem& memory);

// "/clear [stm|ltm|all]", default all
std::string cmd_clear(const std::string& args, MemorySystem& memory);

// Plain input: runs process() and renders the response as JSON.
std::string cmd_process(const std::string& line, MemorySystem& memory);

std::string cmd_help();

// Routes one REPL line. Sets `quit` for /quit and /exit.
std::string dispatch_command(const std::string& line, MemorySystem& memory, bool& quit);

} // namespace substrate
