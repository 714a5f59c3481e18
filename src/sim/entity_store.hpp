#pragma once

#include "core/types.hpp"
#include "sim/core_ship.hpp"
#include "sim/drone.hpp"
#include "sim/explosion.hpp"
#include "sim/marine.hpp"
#include "sim/projectile.hpp"
#include "sim/turret.hpp"

#include <algorithm>
#include <memory>
#include <unordered_map>
#include <vector>

namespace kuf::sim {

/// Owns every live entity of a battle, one pool per kind. Pools keep
/// registration order, which is also ascending id order.
class EntityStore {
public:
    EntityStore();
    ~EntityStore();

    EntityStore(const EntityStore&) = delete;
    EntityStore& operator=(const EntityStore&) = delete;

    /// Register an entity, assigning it a fresh id. Returns the stored entity.
    Marine& add_marine(std::unique_ptr<Marine> marine);
    Turret& add_turret(std::unique_ptr<Turret> turret);
    Drone& add_drone(std::unique_ptr<Drone> drone);
    Projectile& add_projectile(std::unique_ptr<Projectile> projectile);

    /// Install the singleton core ship, replacing any previous one.
    CoreShip& set_core_ship(std::unique_ptr<CoreShip> ship);
    CoreShip* core_ship() const { return core_ship_.get(); }

    void add_explosion(const Explosion& explosion) {
        explosions_.push_back(explosion);
    }

    /// Look up an entity by ID. Returns nullptr if not found.
    Entity* find(u32 id) const;
    Marine* find_marine(u32 id) const;
    Turret* find_turret(u32 id) const;

    const std::vector<std::unique_ptr<Marine>>& marines() const { return marines_; }
    const std::vector<std::unique_ptr<Turret>>& turrets() const { return turrets_; }
    const std::vector<std::unique_ptr<Drone>>& drones() const { return drones_; }
    const std::vector<std::unique_ptr<Projectile>>& projectiles() const {
        return projectiles_;
    }
    std::vector<Explosion>& explosions() { return explosions_; }
    const std::vector<Explosion>& explosions() const { return explosions_; }

    /// Removal passes. Each drops the matching entities and their index
    /// entries, preserving the order of the rest. Returns the count removed.
    template <typename Pred>
    size_t remove_marines_if(Pred&& pred) { return remove_if(marines_, pred); }
    template <typename Pred>
    size_t remove_turrets_if(Pred&& pred) { return remove_if(turrets_, pred); }
    template <typename Pred>
    size_t remove_drones_if(Pred&& pred) { return remove_if(drones_, pred); }
    template <typename Pred>
    size_t remove_projectiles_if(Pred&& pred) {
        return remove_if(projectiles_, pred);
    }

    /// Number of registered entities (core ship included).
    size_t count() const { return index_.size(); }

    /// Drop everything. Ids keep increasing across clears.
    void clear();

private:
    u32 register_entity(Entity& entity);

    template <typename T, typename Pred>
    size_t remove_if(std::vector<std::unique_ptr<T>>& pool, Pred& pred) {
        auto it = std::stable_partition(
            pool.begin(), pool.end(),
            [&](const std::unique_ptr<T>& e) { return !pred(*e); });
        size_t removed = static_cast<size_t>(pool.end() - it);
        for (auto dead = it; dead != pool.end(); ++dead)
            index_.erase((*dead)->entity_id());
        pool.erase(it, pool.end());
        return removed;
    }

    std::vector<std::unique_ptr<Marine>> marines_;
    std::vector<std::unique_ptr<Turret>> turrets_;
    std::vector<std::unique_ptr<Drone>> drones_;
    std::vector<std::unique_ptr<Projectile>> projectiles_;
    std::unique_ptr<CoreShip> core_ship_;
    std::vector<Explosion> explosions_;
    std::unordered_map<u32, Entity*> index_;
    u32 next_id_ = 1;
};

} // namespace kuf::sim
