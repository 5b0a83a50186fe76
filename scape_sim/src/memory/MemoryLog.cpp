#include "MemoryLog.hpp"
#include "utils/Logger.hpp"
#include <algorithm>

namespace scape {

    void ShortTermMemory::record(MemoryEntry entry) {
        if (capacity_ == 0) return;
        entries_.push_back(std::move(entry));
        if (entries_.size() > capacity_) {
            entries_.pop_front();
        }
    }

    std::vector<MemoryEntry> ShortTermMemory::recent(size_t count) const {
        size_t n = std::min(count, entries_.size());
        return std::vector<MemoryEntry>(entries_.end() - n, entries_.end());
    }

    void EpisodicMemory::record(MemoryEntry entry) {
        entries_.push_back(std::move(entry));
    }

    std::vector<MemoryEntry> EpisodicMemory::recent(size_t count) const {
        size_t n = std::min(count, entries_.size());
        return std::vector<MemoryEntry>(entries_.end() - n, entries_.end());
    }

    std::unique_ptr<MemoryLog> createMemory(const std::string& kind, size_t shortTermCapacity) {
        if (kind == "episodic") {
            return std::make_unique<EpisodicMemory>();
        }
        if (kind != "short_term") {
            Logger::warn("Unknown memory kind '{}', using short_term", kind);
        }
        return std::make_unique<ShortTermMemory>(shortTermCapacity);
    }

} // namespace scape
