#pragma once

#include <plotscale/results.hpp>
#include <plotscale/types.hpp>
#include <span>
#include <vector>

namespace plotscale
{

class StackAggregator
{
   public:
    // key_quantum > 0 snaps x-keys to the nearest multiple before grouping;
    // 0 groups on exact equality of the projection.
    explicit StackAggregator(double key_quantum = 0.0) : key_quantum_(key_quantum) {}

    // Keys whose snapped value would not be finite are returned unchanged.
    double quantize(double x) const;

    // Groups in first-seen key order, slots subdivided equally.
    // Throws EmptyDatasetError on empty input, NormalizeError(InvalidValue)
    // when a cumulative total overflows.
    [[nodiscard]] std::vector<StackedGroup> stack(std::span<const ProjectedPoint> points) const;

    // Same, with one relative slot weight per group (first-seen order).
    // Throws NormalizeError(InvalidConfig) when the weight count does not
    // match the group count or a weight is not a positive finite number.
    [[nodiscard]] std::vector<StackedGroup> stack(std::span<const ProjectedPoint> points,
                                                  std::span<const double>         key_weights) const;

    // Cumulative range covered by the groups; always contains 0.
    static Extent stacked_extent(std::span<const StackedGroup> groups);

   private:
    double key_quantum_;

    std::vector<StackedGroup> group(std::span<const ProjectedPoint> points) const;
};

}   // namespace plotscale
