#pragma once

#include "core/Types.hpp"
#include "memory/MemoryLog.hpp"
#include <optional>
#include <string>
#include <vector>

namespace scape {

    class Trader;

    // Read-only lookup of an agent's kind by id
    class AgentDirectory {
    public:
        virtual ~AgentDirectory() = default;
        virtual std::optional<std::string> kindOf(AgentId id) const = 0;
    };

    // Builds a chronological digest of the most recent dialogue in an
    // agent's memory. Only the last 2 * maxMessages entries are scanned, so
    // the cost does not grow with the size of the memory.
    class DialogueExtractor {
    public:
        static constexpr const char* NO_DIALOGUE = "No recent dialogue.";

        explicit DialogueExtractor(const AgentDirectory* directory = nullptr)
            : directory_(directory) {}

        // Formatted lines ("- Trader 3: hello"), oldest first; nullopt when
        // no dialogue entry was found
        std::optional<std::vector<std::string>> extract(const MemoryLog& memory, size_t maxMessages = 5) const;
        std::optional<std::vector<std::string>> extract(const Trader& agent, size_t maxMessages = 5) const;

        // Lines joined by newlines, or NO_DIALOGUE
        static std::string render(const std::optional<std::vector<std::string>>& lines);

        std::string digest(const Trader& agent, size_t maxMessages = 5) const {
            return render(extract(agent, maxMessages));
        }

        // "<Kind> <id>"; an unknown bare id degrades to "Agent <id>"
        std::string senderLabel(const Sender& sender) const;

    private:
        const AgentDirectory* directory_;
    };

} // namespace scape
