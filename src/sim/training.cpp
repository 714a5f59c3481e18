#include "sim/training.hpp"
#include "sim/sim_config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace kuf::sim {

void Economy::award_kill(f32 gold_value) {
    gold += gold_value + income_per_kill;
    destroyed_turrets++;
}

bool Economy::spend(f32 amount) {
    if (!std::isfinite(amount) || amount < 0 || gold < amount)
        return false;
    gold = std::max(0.0f, gold - amount);
    return true;
}

void Economy::hire_worker() {
    worker_count++;
    income_per_kill += 1.0f;
}

namespace {

const TrainingCatalogEntry* find_entry(const SimConfig& config,
                                       const std::string& id) {
    for (const auto& entry : config.training_catalog) {
        if (entry.id == id) return &entry;
    }
    return nullptr;
}

} // namespace

void TrainingQueue::reset(const SimConfig& config) {
    slots_.clear();
    for (size_t i = 0; i < config.default_slot_units.size(); i++) {
        TrainingSlot slot;
        slot.slot_id = static_cast<u32>(i);
        slot.unit_id = config.default_slot_units[i];
        slot.equipable = i > 0;
        slots_.push_back(slot);
    }
}

std::optional<TrainingSpec> TrainingQueue::spec_for_slot(
    size_t index, const Economy& economy, const SimConfig& config) const {
    if (index >= slots_.size()) return std::nullopt;

    // Unknown ids train workers
    const TrainingCatalogEntry* entry = find_entry(config, slots_[index].unit_id);
    if (!entry) entry = find_entry(config, "worker");
    if (!entry) return std::nullopt;

    TrainingSpec plan{entry->id, entry->label, entry->cost, entry->duration};
    if (plan.unit_id == "worker")
        plan.cost = config.worker_base_cost +
                    static_cast<f32>(economy.worker_count) *
                        config.worker_cost_increment;
    return plan;
}

bool TrainingQueue::cycle_slot(size_t index, const SimConfig& config) {
    if (index >= slots_.size()) return false;
    TrainingSlot& slot = slots_[index];
    if (!slot.equipable || slot.is_training) return false;
    const auto& roster = config.equipable_unit_ids;
    if (roster.empty()) return false;

    auto it = std::find(roster.begin(), roster.end(), slot.unit_id);
    size_t next = it != roster.end()
                      ? (static_cast<size_t>(it - roster.begin()) + 1) % roster.size()
                      : 0;
    slot.unit_id = roster[next];
    return true;
}

TrainingResult TrainingQueue::try_start(size_t index, Economy& economy,
                                        const SimConfig& config) {
    if (index >= slots_.size())
        return {false, "No training slot " + std::to_string(index)};
    TrainingSlot& slot = slots_[index];
    if (slot.is_training)
        return {false, "Slot is already training"};

    auto plan = spec_for_slot(index, economy, config);
    if (!plan)
        return {false, "Nothing to train in this slot"};
    if (!economy.spend(plan->cost))
        return {false, "Not enough gold"};

    slot.is_training = true;
    slot.progress = 0;
    spdlog::debug("Training {} in slot {} for {:.0f} gold", plan->unit_id,
                  index, plan->cost);
    return {true, "Training " + plan->label};
}

void TrainingQueue::update(f64 dt, const Economy& economy,
                           const SimConfig& config, const SpawnFn& spawn) {
    for (size_t i = 0; i < slots_.size(); i++) {
        TrainingSlot& slot = slots_[i];
        if (!slot.is_training) continue;
        auto plan = spec_for_slot(i, economy, config);
        if (!plan) {
            slot.is_training = false;
            slot.progress = 0;
            continue;
        }
        slot.progress =
            std::min(plan->duration, slot.progress + static_cast<f32>(dt));
        if (slot.progress >= plan->duration) {
            slot.is_training = false;
            slot.progress = 0;
            spawn(plan->unit_id);
        }
    }
}

} // namespace kuf::sim
