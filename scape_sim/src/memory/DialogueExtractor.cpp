#include "DialogueExtractor.hpp"
#include "agents/Trader.hpp"
#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace scape {

    std::string DialogueExtractor::senderLabel(const Sender& sender) const {
        if (const auto* resolved = std::get_if<ResolvedSender>(&sender)) {
            return fmt::format("{} {}", resolved->kind, resolved->id);
        }

        const auto& raw = std::get<RawSenderId>(sender);
        if (directory_) {
            if (auto kind = directory_->kindOf(raw.id)) {
                return fmt::format("{} {}", *kind, raw.id);
            }
        }
        return fmt::format("Agent {}", raw.id);
    }

    std::optional<std::vector<std::string>> DialogueExtractor::extract(const MemoryLog& memory, size_t maxMessages) const {
        std::vector<std::string> dialogue;
        if (maxMessages == 0) return std::nullopt;

        auto window = memory.recent(maxMessages * 2);

        // Newest first, stopping once enough messages are collected
        for (auto it = window.rbegin(); it != window.rend(); ++it) {
            if (dialogue.size() >= maxMessages) break;
            if (!it->message) continue;

            dialogue.push_back(fmt::format("- {}: {}", senderLabel(it->message->sender), it->message->text));
        }

        if (dialogue.empty()) return std::nullopt;

        std::reverse(dialogue.begin(), dialogue.end());
        return dialogue;
    }

    std::optional<std::vector<std::string>> DialogueExtractor::extract(const Trader& agent, size_t maxMessages) const {
        return extract(agent.getMemory(), maxMessages);
    }

    std::string DialogueExtractor::render(const std::optional<std::vector<std::string>>& lines) {
        if (!lines || lines->empty()) return NO_DIALOGUE;

        std::string out;
        for (size_t i = 0; i < lines->size(); ++i) {
            if (i > 0) out += '\n';
            out += (*lines)[i];
        }
        return out;
    }

} // namespace scape
