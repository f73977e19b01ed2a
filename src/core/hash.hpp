#pragma once

#include <bit>
#include <cstdint>

namespace plotscale::detail
{

// FNV-1a over the bit pattern of each mixed-in value.
class Fnv1a
{
   public:
    static constexpr uint64_t OFFSET_BASIS = 14695981039346656037ull;
    static constexpr uint64_t PRIME        = 1099511628211ull;

    void mix(uint64_t word)
    {
        for (int i = 0; i < 8; ++i)
        {
            state_ ^= (word >> (i * 8)) & 0xffu;
            state_ *= PRIME;
        }
    }

    // -0.0 and 0.0 compare equal, so they must hash equal too.
    void mix(double value) { mix(std::bit_cast<uint64_t>(value == 0.0 ? 0.0 : value)); }

    uint64_t value() const { return state_; }

   private:
    uint64_t state_ = OFFSET_BASIS;
};

}   // namespace plotscale::detail
