#pragma once

#include <cstdint>
#include <plotscale/types.hpp>
#include <string>

namespace plotscale
{

// Numeric policy for one normalization call. Carries no styling: colors,
// strokes and fonts belong to the rendering layer.
struct NormalizeConfig
{
    // Minimum range floor, in domain units. A single-valued axis maps to the
    // midpoint of its target extent instead of dividing by zero.
    double epsilon = DEFAULT_EPSILON;

    // Fraction of each slot covered by a bar or stacked group, in (0, 1].
    double bar_width_ratio = 0.8;

    // Uniform inset of the drawing area, in screen units.
    double padding = 0.0;

    // When > 0, stacked x-keys are snapped to the nearest multiple before
    // grouping. 0 groups by exact equality.
    double stack_key_quantum = 0.0;

    // Throws NormalizeError(InvalidConfig).
    void validate() const;

    // Stable across runs; feeds the ScaleCache key.
    uint64_t hash() const;

    // JSON persistence (~/.config/plotscale/normalize.json by default).
    std::string serialize() const;

    // Missing keys keep their current value. Returns false on empty input,
    // an unsupported version, or a value that fails validate().
    bool deserialize(const std::string& json);

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    static std::string default_path();

    bool operator==(const NormalizeConfig&) const = default;
};

}   // namespace plotscale
