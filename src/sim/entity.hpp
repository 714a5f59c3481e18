#pragma once

#include "core/types.hpp"

#include <algorithm>
#include <cmath>

namespace kuf::sim {

struct Vector2 {
    f32 x = 0, y = 0;
};

inline f32 distance_squared(const Vector2& a, const Vector2& b) {
    f32 dx = b.x - a.x;
    f32 dy = b.y - a.y;
    return dx * dx + dy * dy;
}

inline f32 distance(const Vector2& a, const Vector2& b) {
    return std::sqrt(distance_squared(a, b));
}

class Entity {
public:
    Entity() = default;
    virtual ~Entity() = default;

    u32 entity_id() const { return entity_id_; }
    void set_entity_id(u32 id) { entity_id_ = id; }

    const Vector2& position() const { return position_; }
    void set_position(const Vector2& p) { position_ = p; }
    f32 x() const { return position_.x; }
    f32 y() const { return position_.y; }

    f32 radius() const { return radius_; }
    void set_radius(f32 r) { radius_ = std::max(0.0f, r); }

    f32 health() const { return health_; }
    void set_health(f32 h) { health_ = std::max(0.0f, h); }

    f32 max_health() const { return max_health_; }
    void set_max_health(f32 h) { max_health_ = std::max(0.0f, h); }

    bool alive() const { return health_ > 0; }
    bool damaged() const { return health_ < max_health_; }

    void apply_damage(f32 amount) { set_health(health_ - amount); }
    void heal(f32 amount) {
        if (health_ <= 0) return;
        health_ = std::min(max_health_, health_ + std::max(0.0f, amount));
    }

    virtual bool is_marine() const { return false; }
    virtual bool is_turret() const { return false; }
    virtual bool is_drone() const { return false; }
    virtual bool is_core_ship() const { return false; }
    virtual bool is_projectile() const { return false; }

private:
    u32 entity_id_ = 0;
    Vector2 position_;
    f32 radius_ = 0;
    f32 health_ = 0;
    f32 max_health_ = 0;
};

} // namespace kuf::sim
