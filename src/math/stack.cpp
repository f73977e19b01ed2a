#include <plotscale/stack.hpp>

#include <cmath>
#include <plotscale/errors.hpp>
#include <plotscale/extent.hpp>
#include <plotscale/logger.hpp>
#include <unordered_map>

namespace plotscale
{

double StackAggregator::quantize(double x) const
{
    if (key_quantum_ <= 0.0)
        return x;
    double steps = x / key_quantum_;
    double q     = std::round(steps) * key_quantum_;
    if (!std::isfinite(q))
        return x;   // too far out to snap: group on the exact key
    return q == 0.0 ? 0.0 : q;   // fold -0.0
}

std::vector<StackedGroup> StackAggregator::group(std::span<const ProjectedPoint> points) const
{
    if (points.empty())
    {
        PLOTSCALE_LOG_ERROR("stack", "stack: empty input");
        throw EmptyDatasetError("stack");
    }

    std::vector<StackedGroup>          groups;
    std::unordered_map<double, size_t> slot_of_key;

    for (size_t i = 0; i < points.size(); ++i)
    {
        double key = quantize(points[i].x);
        auto [it, inserted] = slot_of_key.try_emplace(key, groups.size());
        if (inserted)
        {
            StackedGroup g;
            g.key = key;
            groups.push_back(std::move(g));
        }

        StackedGroup& g = groups[it->second];
        double        v = points[i].y;

        StackSegment seg;
        seg.index = i;
        seg.value = v;
        if (v >= 0.0)
        {
            seg.start = g.positive_total;
            g.positive_total += v;
            seg.end = g.positive_total;
        }
        else
        {
            seg.start = g.negative_total;
            g.negative_total += v;
            seg.end = g.negative_total;
        }
        g.sum += v;
        g.segments.push_back(seg);

        if (!std::isfinite(seg.end))
        {
            PLOTSCALE_LOG_ERROR("stack", "stacked total for key {} overflows at index {}", key, i);
            throw NormalizeError(ErrorCode::InvalidValue,
                                 Logger::format_message("stacked total for key {} is not finite",
                                                        key));
        }
    }

    if (key_quantum_ > 0.0)
    {
        PLOTSCALE_LOG_DEBUG("stack",
                            "{} points quantized (quantum {}) into {} groups",
                            points.size(),
                            key_quantum_,
                            groups.size());
    }
    return groups;
}

std::vector<StackedGroup> StackAggregator::stack(std::span<const ProjectedPoint> points) const
{
    auto   groups = group(points);
    double width  = 1.0 / static_cast<double>(groups.size());
    for (size_t i = 0; i < groups.size(); ++i)
    {
        groups[i].width  = width;
        groups[i].offset = (static_cast<double>(i) + 0.5) * width;
    }
    return groups;
}

std::vector<StackedGroup> StackAggregator::stack(std::span<const ProjectedPoint> points,
                                                 std::span<const double>         key_weights) const
{
    if (key_weights.empty())
        return stack(points);

    auto groups = group(points);
    if (key_weights.size() != groups.size())
    {
        PLOTSCALE_LOG_ERROR("stack",
                            "{} key weights supplied for {} groups",
                            key_weights.size(),
                            groups.size());
        throw NormalizeError(ErrorCode::InvalidConfig,
                             Logger::format_message("expected {} key weights, got {}",
                                                    groups.size(),
                                                    key_weights.size()));
    }

    double total = 0.0;
    for (double w : key_weights)
    {
        if (!std::isfinite(w) || w <= 0.0)
        {
            PLOTSCALE_LOG_ERROR("stack", "invalid key weight {}", w);
            throw NormalizeError(ErrorCode::InvalidConfig,
                                 Logger::format_message("key weight must be positive, got {}", w));
        }
        total += w;
    }

    double slot_start = 0.0;
    for (size_t i = 0; i < groups.size(); ++i)
    {
        groups[i].width  = key_weights[i] / total;
        groups[i].offset = slot_start + groups[i].width * 0.5;
        slot_start += groups[i].width;
    }
    return groups;
}

Extent StackAggregator::stacked_extent(std::span<const StackedGroup> groups)
{
    Extent e{0.0, 0.0};
    for (const auto& g : groups)
        e = merge_extents(e, {g.negative_total, g.positive_total});
    return e;
}

}   // namespace plotscale
