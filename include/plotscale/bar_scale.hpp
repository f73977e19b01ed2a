#pragma once

#include <plotscale/results.hpp>
#include <plotscale/types.hpp>

namespace plotscale
{

// Scales each sign within its own sub-range: positive values share the space
// above the baseline, negative values the space below it. A large outlier of
// one sign does not flatten the bars of the other.
class SignAwareBarScaler
{
   public:
    SignAwareBarScaler(const Extent& y_extent,
                       double        height,
                       double        baseline,
                       double        epsilon = DEFAULT_EPSILON);

    BarSpan scale(double value) const;

    double positive_scale() const { return positive_scale_; }
    double negative_scale() const { return negative_scale_; }
    double baseline() const { return baseline_; }

   private:
    double baseline_;
    double positive_scale_;
    double negative_scale_;
};

}   // namespace plotscale
