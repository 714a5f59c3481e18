#include "sim/entity_store.hpp"

namespace kuf::sim {

EntityStore::EntityStore() = default;
EntityStore::~EntityStore() = default;

u32 EntityStore::register_entity(Entity& entity) {
    u32 id = next_id_++;
    entity.set_entity_id(id);
    index_[id] = &entity;
    return id;
}

Marine& EntityStore::add_marine(std::unique_ptr<Marine> marine) {
    register_entity(*marine);
    marines_.push_back(std::move(marine));
    return *marines_.back();
}

Turret& EntityStore::add_turret(std::unique_ptr<Turret> turret) {
    register_entity(*turret);
    turrets_.push_back(std::move(turret));
    return *turrets_.back();
}

Drone& EntityStore::add_drone(std::unique_ptr<Drone> drone) {
    register_entity(*drone);
    drones_.push_back(std::move(drone));
    return *drones_.back();
}

Projectile& EntityStore::add_projectile(std::unique_ptr<Projectile> projectile) {
    register_entity(*projectile);
    projectiles_.push_back(std::move(projectile));
    return *projectiles_.back();
}

CoreShip& EntityStore::set_core_ship(std::unique_ptr<CoreShip> ship) {
    if (core_ship_)
        index_.erase(core_ship_->entity_id());
    register_entity(*ship);
    core_ship_ = std::move(ship);
    return *core_ship_;
}

Entity* EntityStore::find(u32 id) const {
    auto it = index_.find(id);
    return it != index_.end() ? it->second : nullptr;
}

Marine* EntityStore::find_marine(u32 id) const {
    Entity* e = find(id);
    return e && e->is_marine() ? static_cast<Marine*>(e) : nullptr;
}

Turret* EntityStore::find_turret(u32 id) const {
    Entity* e = find(id);
    return e && e->is_turret() ? static_cast<Turret*>(e) : nullptr;
}

void EntityStore::clear() {
    marines_.clear();
    turrets_.clear();
    drones_.clear();
    projectiles_.clear();
    core_ship_.reset();
    explosions_.clear();
    index_.clear();
}

} // namespace kuf::sim
