#pragma once

#include "core/Types.hpp"
#include <map>
#include <string>
#include <vector>

namespace scape {

    struct ToolSpec {
        ActionKind kind;
        std::string description;
    };

    // Action kinds one agent may request. Each agent owns its registry;
    // there is no shared process-wide instance.
    class ToolRegistry {
    public:
        ToolRegistry() = default;

        void add(ActionKind kind, std::string description);
        void remove(ActionKind kind);
        bool allows(ActionKind kind) const { return tools_.count(kind) > 0; }
        bool empty() const { return tools_.empty(); }

        std::vector<ActionKind> kinds() const;
        std::vector<ToolSpec> specs() const;

        // Everything a trader can do on the grid
        static ToolRegistry traderDefaults();

    private:
        std::map<ActionKind, std::string> tools_;
    };

} // namespace scape
