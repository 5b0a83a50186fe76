#pragma once

#include "core/Types.hpp"
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace scape {

    // Recency-queryable log of an agent's memory entries
    class MemoryLog {
    public:
        virtual ~MemoryLog() = default;

        virtual void record(MemoryEntry entry) = 0;

        // Up to `count` most recent entries, oldest first
        virtual std::vector<MemoryEntry> recent(size_t count) const = 0;

        virtual size_t size() const = 0;
        virtual std::string getKind() const = 0;
    };

    // Bounded sequential buffer; the oldest entry is dropped on overflow
    class ShortTermMemory : public MemoryLog {
    public:
        explicit ShortTermMemory(size_t capacity = 20) : capacity_(capacity) {}

        void record(MemoryEntry entry) override;
        std::vector<MemoryEntry> recent(size_t count) const override;
        size_t size() const override { return entries_.size(); }
        std::string getKind() const override { return "short_term"; }

        size_t capacity() const { return capacity_; }

    private:
        size_t capacity_;
        std::deque<MemoryEntry> entries_;
    };

    // Unbounded list of episodes
    class EpisodicMemory : public MemoryLog {
    public:
        void record(MemoryEntry entry) override;
        std::vector<MemoryEntry> recent(size_t count) const override;
        size_t size() const override { return entries_.size(); }
        std::string getKind() const override { return "episodic"; }

        const std::vector<MemoryEntry>& entries() const { return entries_; }

    private:
        std::vector<MemoryEntry> entries_;
    };

    // "short_term" or "episodic"; anything else falls back to short_term
    std::unique_ptr<MemoryLog> createMemory(const std::string& kind, size_t shortTermCapacity);

} // namespace scape
