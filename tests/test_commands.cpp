#include <catch2/catch.hpp>
#include "commands.hpp"
#include "memory_system.hpp"

using namespace substrate;

static MemoryConfig shell_config() {
    MemoryConfig cfg;
    cfg.stm_capacity = 2;
    cfg.ltm_capacity = 5;
    return cfg;
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

TEST_CASE("cmd_store: plain text uses the default importance", "[commands]") {
    MemorySystem mem(shell_config());
    auto out = cmd_store("remember the milk", mem);
    REQUIRE(contains(out, "0.5"));

    auto snap = mem.stm_snapshot();
    REQUIRE(snap.size() == 1);
    REQUIRE(snap[0].content == "remember the milk");
    REQUIRE(snap[0].importance == 0.5);
}

TEST_CASE("cmd_store: leading number is the importance", "[commands]") {
    MemorySystem mem(shell_config());
    cmd_store("0.9 the launch code", mem);

    auto snap = mem.stm_snapshot();
    REQUIRE(snap[0].content == "the launch code");
    REQUIRE(snap[0].importance == 0.9);
}

TEST_CASE("cmd_store: out-of-range number is part of the text", "[commands]") {
    MemorySystem mem(shell_config());
    cmd_store("42 is the answer", mem);
    REQUIRE(mem.stm_snapshot()[0].content == "42 is the answer");
}

TEST_CASE("cmd_store: empty arguments show usage", "[commands]") {
    MemorySystem mem(shell_config());
    REQUIRE(contains(cmd_store("   ", mem), "Usage"));
    REQUIRE(mem.get_stm_contents().empty());
}

TEST_CASE("cmd_recall: searches with optional scope", "[commands]") {
    MemorySystem mem(shell_config());
    mem.store("old fact", 0.9);
    mem.store("new fact");
    mem.store("newest fact");      // "old fact" promoted

    auto all = cmd_recall("fact", mem);
    REQUIRE(contains(all, "Found 3 (all)"));

    auto ltm = cmd_recall("fact ltm", mem);
    REQUIRE(contains(ltm, "Found 1 (ltm)"));
    REQUIRE(contains(ltm, "old fact"));

    REQUIRE(cmd_recall("nothing here", mem) == "No matching memories.");
}

TEST_CASE("cmd_clear: clears the requested scope", "[commands]") {
    MemorySystem mem(shell_config());
    mem.store("a", 0.9);
    mem.store("b");
    mem.store("c");

    REQUIRE(cmd_clear("stm", mem) == "Cleared stm memory.");
    REQUIRE(mem.get_stm_contents().empty());
    REQUIRE(mem.get_ltm_contents().size() == 1);

    REQUIRE(cmd_clear("", mem) == "Cleared all memory.");
    REQUIRE(mem.get_ltm_contents().empty());

    REQUIRE(contains(cmd_clear("sideways", mem), "Usage"));
}

TEST_CASE("cmd_reinforce: applies reinforce feedback", "[commands]") {
    MemorySystem mem(shell_config());
    mem.store("x", 0.5);
    cmd_reinforce(mem);
    REQUIRE(mem.stm_snapshot()[0].importance > 0.5);
}

TEST_CASE("cmd_status and listings describe the tiers", "[commands]") {
    MemorySystem mem(shell_config());
    mem.store("alpha", 0.8);

    auto status = cmd_status(mem);
    REQUIRE(contains(status, "Module: MemorySystem"));
    REQUIRE(contains(status, "Short-term: 1/2"));
    REQUIRE(contains(status, "Long-term: 0/5"));

    REQUIRE(contains(cmd_stm(mem), "alpha"));
    REQUIRE(contains(cmd_ltm(mem), "Long-term memory (0)"));
}

TEST_CASE("dispatch_command: routes slash commands and plain input", "[commands]") {
    MemorySystem mem(shell_config());
    bool quit = false;

    auto out = dispatch_command("hello there", mem, quit);
    REQUIRE_FALSE(quit);
    auto j = nlohmann::json::parse(out);
    REQUIRE(j["content"]["stored"] == "hello there");
    REQUIRE(j["source_module"] == "MemorySystem");

    REQUIRE(contains(dispatch_command("/help", mem, quit), "/recall"));
    REQUIRE(dispatch_command("/bogus", mem, quit) == "Unknown command: /bogus");

    dispatch_command("/quit", mem, quit);
    REQUIRE(quit);
}

TEST_CASE("cmd_process: invalid UTF-8 input still renders a response", "[commands]") {
    MemorySystem mem(shell_config());
    mem.store(nlohmann::json::array({"caf\xe9"}), 0.9);

    std::string out;
    REQUIRE_NOTHROW(out = cmd_process("caf\xe9", mem));
    REQUIRE(contains(out, "\"confidence\""));
    REQUIRE(contains(out, "\xEF\xBF\xBD"));   // U+FFFD replacement
    REQUIRE(mem.get_stm_contents().size() == 2);
}
