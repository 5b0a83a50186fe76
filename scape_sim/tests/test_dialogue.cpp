#include <catch2/catch_test_macros.hpp>
#include "memory/DialogueExtractor.hpp"
#include "memory/MemoryLog.hpp"
#include "agents/Trader.hpp"
#include <map>

using namespace scape;

namespace {
    MemoryEntry dialogueEntry(Step step, Sender sender, const std::string& text) {
        MemoryEntry e;
        e.step = step;
        e.type = "message";
        e.text = text;
        e.message = DialogueMessage{ std::move(sender), text };
        return e;
    }

    MemoryEntry plainEntry(Step step, const std::string& text) {
        MemoryEntry e;
        e.step = step;
        e.type = "observation";
        e.text = text;
        return e;
    }

    // 20 entries; indices with i % 5 in {1, 3} are not dialogue
    void fillInterleaved(MemoryLog& memory) {
        for (int i = 0; i < 20; ++i) {
            if (i % 5 == 1 || i % 5 == 3) {
                memory.record(plainEntry(i, "saw something " + std::to_string(i)));
            }
            else {
                memory.record(dialogueEntry(i, ResolvedSender{ "Trader", static_cast<AgentId>(i) },
                    "msg " + std::to_string(i)));
            }
        }
    }

    class FakeDirectory : public AgentDirectory {
    public:
        std::map<AgentId, std::string> kinds;

        std::optional<std::string> kindOf(AgentId id) const override {
            auto it = kinds.find(id);
            if (it == kinds.end()) return std::nullopt;
            return it->second;
        }
    };
}

TEST_CASE("DialogueExtractor: Most recent dialogue in chronological order", "[dialogue]") {
    DialogueExtractor extractor;

    SECTION("short-term memory") {
        ShortTermMemory memory(50);
        fillInterleaved(memory);

        auto lines = extractor.extract(memory, 5);
        REQUIRE(lines.has_value());
        REQUIRE(*lines == std::vector<std::string>{
            "- Trader 12: msg 12",
            "- Trader 14: msg 14",
            "- Trader 15: msg 15",
            "- Trader 17: msg 17",
            "- Trader 19: msg 19"
        });
    }

    SECTION("episodic memory gives the same digest") {
        EpisodicMemory memory;
        fillInterleaved(memory);

        auto lines = extractor.extract(memory, 5);
        REQUIRE(lines.has_value());
        REQUIRE(lines->size() == 5);
        REQUIRE(lines->front() == "- Trader 12: msg 12");
        REQUIRE(lines->back() == "- Trader 19: msg 19");
    }
}

TEST_CASE("DialogueExtractor: Only the last 2 * max entries are scanned", "[dialogue]") {
    EpisodicMemory memory;
    memory.record(dialogueEntry(0, ResolvedSender{ "Trader", 1 }, "old news"));
    for (int i = 1; i <= 4; ++i) {
        memory.record(plainEntry(i, "noise"));
    }

    DialogueExtractor extractor;
    REQUIRE_FALSE(extractor.extract(memory, 2).has_value());

    auto wider = extractor.extract(memory, 3);
    REQUIRE(wider.has_value());
    REQUIRE(*wider == std::vector<std::string>{ "- Trader 1: old news" });
}

TEST_CASE("DialogueExtractor: No dialogue yields the sentinel", "[dialogue]") {
    ShortTermMemory memory;
    memory.record(plainEntry(1, "moved to (1, 2)"));
    memory.record(plainEntry(2, "harvested 3 sugar"));

    DialogueExtractor extractor;
    auto lines = extractor.extract(memory, 5);
    REQUIRE_FALSE(lines.has_value());
    REQUIRE(DialogueExtractor::render(lines) == "No recent dialogue.");

    ShortTermMemory empty;
    REQUIRE_FALSE(extractor.extract(empty, 5).has_value());

    fillInterleaved(memory);
    REQUIRE_FALSE(extractor.extract(memory, 0).has_value());
}

TEST_CASE("DialogueExtractor: Raw sender ids are resolved at read time", "[dialogue]") {
    FakeDirectory directory;
    directory.kinds[4] = "Trader";

    ShortTermMemory memory;
    memory.record(dialogueEntry(1, RawSenderId{ 4 }, "hello"));
    memory.record(dialogueEntry(2, RawSenderId{ 99 }, "who am I"));

    DialogueExtractor withDirectory(&directory);
    auto lines = withDirectory.extract(memory, 5);
    REQUIRE(lines.has_value());
    REQUIRE(*lines == std::vector<std::string>{ "- Trader 4: hello", "- Agent 99: who am I" });

    DialogueExtractor bare;
    REQUIRE(bare.senderLabel(RawSenderId{ 4 }) == "Agent 4");
    REQUIRE(bare.senderLabel(ResolvedSender{ "Resource", 8 }) == "Resource 8");
}

TEST_CASE("DialogueExtractor: Digest joins lines", "[dialogue]") {
    Trader trader(1, 10, 10, 1, 1, 1, std::make_unique<EpisodicMemory>());
    DialogueExtractor extractor;
    REQUIRE(extractor.digest(trader) == "No recent dialogue.");

    trader.getMemory().record(dialogueEntry(1, ResolvedSender{ "Trader", 2 }, "hi"));
    trader.getMemory().record(dialogueEntry(2, ResolvedSender{ "Trader", 3 }, "hey"));
    REQUIRE(extractor.digest(trader) == "- Trader 2: hi\n- Trader 3: hey");
}

TEST_CASE("MemoryLog: Short-term memory drops the oldest entry", "[memory]") {
    ShortTermMemory memory(3);
    for (int i = 0; i < 5; ++i) {
        memory.record(plainEntry(i, std::to_string(i)));
    }

    REQUIRE(memory.size() == 3);
    auto recent = memory.recent(10);
    REQUIRE(recent.size() == 3);
    REQUIRE(recent.front().text == "2");
    REQUIRE(recent.back().text == "4");

    auto lastTwo = memory.recent(2);
    REQUIRE(lastTwo.front().text == "3");

    ShortTermMemory disabled(0);
    disabled.record(plainEntry(0, "dropped"));
    REQUIRE(disabled.size() == 0);
}

TEST_CASE("MemoryLog: Episodic memory keeps everything", "[memory]") {
    EpisodicMemory memory;
    for (int i = 0; i < 100; ++i) {
        memory.record(plainEntry(i, std::to_string(i)));
    }
    REQUIRE(memory.size() == 100);
    REQUIRE(memory.entries().front().text == "0");
    REQUIRE(memory.recent(1).front().text == "99");
}

TEST_CASE("MemoryLog: Factory picks the backend by name", "[memory]") {
    REQUIRE(createMemory("episodic", 5)->getKind() == "episodic");

    auto st = createMemory("short_term", 5);
    REQUIRE(st->getKind() == "short_term");
    REQUIRE(static_cast<ShortTermMemory&>(*st).capacity() == 5);

    REQUIRE(createMemory("vector_store", 5)->getKind() == "short_term");
}
