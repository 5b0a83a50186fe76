#include "ToolRegistry.hpp"

namespace scape {

    void ToolRegistry::add(ActionKind kind, std::string description) {
        tools_[kind] = std::move(description);
    }

    void ToolRegistry::remove(ActionKind kind) {
        tools_.erase(kind);
    }

    std::vector<ActionKind> ToolRegistry::kinds() const {
        std::vector<ActionKind> result;
        result.reserve(tools_.size());
        for (const auto& [kind, _] : tools_) {
            result.push_back(kind);
        }
        return result;
    }

    std::vector<ToolSpec> ToolRegistry::specs() const {
        std::vector<ToolSpec> result;
        for (const auto& [kind, description] : tools_) {
            result.push_back({ kind, description });
        }
        return result;
    }

    ToolRegistry ToolRegistry::traderDefaults() {
        ToolRegistry registry;
        registry.add(ActionKind::MOVE, "Move to an adjacent cell (Chebyshev distance 1)");
        registry.add(ActionKind::HARVEST, "Harvest resources on the current cell for goods you are short of");
        registry.add(ActionKind::TRADE, "Negotiate sugar/spice exchanges with visible traders");
        registry.add(ActionKind::SPEAK, "Send a message to visible agents");
        registry.add(ActionKind::IDLE, "Do nothing this step");
        return registry;
    }

} // namespace scape
