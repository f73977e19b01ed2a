#pragma once

#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <plotscale/engine.hpp>
#include <span>
#include <unordered_map>
#include <vector>

namespace plotscale
{

// FNV-1a over the bit patterns of every projected coordinate, in order.
uint64_t content_hash(std::span<const ProjectedPoint> points);

// Optional memo for render loops that re-normalize unchanged data on every
// draw. Keyed by (dataset content, geometry, chart kind, engine config); a
// hash match is confirmed against the stored points before it counts as a hit.
// Least-recently-used entries are evicted past capacity.
// Thread-safe via internal mutex. The engine is never called under the lock.
class ScaleCache
{
   public:
    explicit ScaleCache(size_t capacity = 64);

    ScaleCache(const ScaleCache&)            = delete;
    ScaleCache& operator=(const ScaleCache&) = delete;

    // Exceptions from the engine propagate and nothing is cached.
    std::shared_ptr<const NormalizedChart> get_or_compute(const NormalizationEngine&      engine,
                                                          ChartKind                       kind,
                                                          std::span<const ProjectedPoint> points,
                                                          const Geometry&                 geometry);

    size_t   size() const;
    size_t   capacity() const { return capacity_; }
    uint64_t hits() const;
    uint64_t misses() const;
    void     clear();

   private:
    struct Key
    {
        uint64_t  content = 0;
        uint64_t  config  = 0;
        size_t    count   = 0;
        Geometry  geometry;
        ChartKind kind = ChartKind::Line;

        bool operator==(const Key&) const = default;
    };

    struct KeyHash
    {
        size_t operator()(const Key& k) const;
    };

    struct Entry
    {
        Key                                    key;
        std::vector<ProjectedPoint>            points;
        std::shared_ptr<const NormalizedChart> chart;
    };

    using EntryList = std::list<Entry>;

    size_t                                                    capacity_;
    mutable std::mutex                                        mutex_;
    EntryList                                                 lru_;   // front = most recent
    std::unordered_map<Key, EntryList::iterator, KeyHash>     index_;
    uint64_t                                                  hits_   = 0;
    uint64_t                                                  misses_ = 0;

    std::shared_ptr<const NormalizedChart> find_locked(const Key&                      key,
                                                       std::span<const ProjectedPoint> points);
};

}   // namespace plotscale
