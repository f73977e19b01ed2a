#include <plotscale/cache.hpp>

#include <algorithm>
#include <plotscale/logger.hpp>

#include "core/hash.hpp"

namespace plotscale
{

uint64_t content_hash(std::span<const ProjectedPoint> points)
{
    detail::Fnv1a h;
    for (const auto& p : points)
    {
        h.mix(p.x);
        h.mix(p.y);
    }
    return h.value();
}

size_t ScaleCache::KeyHash::operator()(const Key& k) const
{
    detail::Fnv1a h;
    h.mix(k.content);
    h.mix(k.config);
    h.mix(static_cast<uint64_t>(k.count));
    h.mix(k.geometry.width);
    h.mix(k.geometry.height);
    h.mix(static_cast<uint64_t>(k.kind));
    return static_cast<size_t>(h.value());
}

ScaleCache::ScaleCache(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

std::shared_ptr<const NormalizedChart> ScaleCache::find_locked(
    const Key& key, std::span<const ProjectedPoint> points)
{
    auto it = index_.find(key);
    if (it == index_.end())
        return nullptr;

    const Entry& entry = *it->second;
    if (!std::equal(entry.points.begin(), entry.points.end(), points.begin(), points.end()))
    {
        PLOTSCALE_LOG_DEBUG("cache", "hash collision on {} points", points.size());
        return nullptr;
    }

    lru_.splice(lru_.begin(), lru_, it->second);
    return entry.chart;
}

std::shared_ptr<const NormalizedChart> ScaleCache::get_or_compute(
    const NormalizationEngine&      engine,
    ChartKind                       kind,
    std::span<const ProjectedPoint> points,
    const Geometry&                 geometry)
{
    Key key;
    key.content  = content_hash(points);
    key.config   = engine.config().hash();
    key.count    = points.size();
    key.geometry = geometry;
    key.kind     = kind;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto cached = find_locked(key, points))
        {
            ++hits_;
            return cached;
        }
        ++misses_;
    }

    auto chart = std::make_shared<const NormalizedChart>(engine.normalize(kind, points, geometry));

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it != index_.end())
    {
        // Same key computed concurrently or a collision: the newest result wins.
        lru_.erase(it->second);
        index_.erase(it);
    }

    lru_.push_front(Entry{key, std::vector<ProjectedPoint>(points.begin(), points.end()), chart});
    index_[key] = lru_.begin();

    while (lru_.size() > capacity_)
    {
        index_.erase(lru_.back().key);
        lru_.pop_back();
    }
    return chart;
}

size_t ScaleCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
}

uint64_t ScaleCache::hits() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

uint64_t ScaleCache::misses() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

void ScaleCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    lru_.clear();
    index_.clear();
    hits_   = 0;
    misses_ = 0;
}

}   // namespace plotscale
