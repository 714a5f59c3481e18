#pragma once

#include "sim/entity.hpp" // Vector2

namespace kuf::sim {

/// Expanding blast ring left by a detonated mine. Damage is dealt once at
/// detonation; the record only drives presentation.
struct Explosion {
    Vector2 position;
    f32 radius = 0;
    f32 max_radius = 0;
    f32 life = 0;
    f32 max_life = 0;
};

} // namespace kuf::sim
