#pragma once

#include "core/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace kuf::sim {

struct SimConfig;

/// In-run gold and kill bookkeeping.
struct Economy {
    f32 gold = 0;
    u32 destroyed_turrets = 0;
    u32 worker_count = 0;
    f32 income_per_kill = 1.0f;   // bonus on top of each turret's bounty

    /// Credit a destroyed turret worth `gold_value`.
    void award_kill(f32 gold_value);

    /// Deduct `amount` if affordable. Returns false (and spends nothing)
    /// for unaffordable or non-finite amounts.
    bool spend(f32 amount);

    /// A finished worker raises the per-kill bonus.
    void hire_worker();
};

struct TrainingSlot {
    u32 slot_id = 0;
    std::string unit_id;
    bool equipable = false;
    bool is_training = false;
    f32 progress = 0;             // seconds elapsed toward the duration
};

/// Resolved cost and duration of the unit a slot currently trains.
struct TrainingSpec {
    std::string unit_id;
    std::string label;
    f32 cost = 0;
    f32 duration = 1;
};

struct TrainingResult {
    bool success = false;
    std::string message;
};

/// Toolbar training queue: one slot per entry of
/// `SimConfig::default_slot_units`, slots other than the first cyclable
/// through the equipable roster.
class TrainingQueue {
public:
    using SpawnFn = std::function<void(const std::string& unit_id)>;

    void reset(const SimConfig& config);

    const std::vector<TrainingSlot>& slots() const { return slots_; }

    /// Cost and duration of what `index` would train now. Worker cost
    /// escalates with the current worker count.
    std::optional<TrainingSpec> spec_for_slot(size_t index,
                                              const Economy& economy,
                                              const SimConfig& config) const;

    /// Advance an idle equipable slot to the next roster unit.
    bool cycle_slot(size_t index, const SimConfig& config);

    /// Check gold, deduct the cost and begin training.
    TrainingResult try_start(size_t index, Economy& economy,
                             const SimConfig& config);

    /// Advance every training slot; `spawn` runs once per completed unit.
    void update(f64 dt, const Economy& economy, const SimConfig& config,
                const SpawnFn& spawn);

private:
    std::vector<TrainingSlot> slots_;
};

} // namespace kuf::sim
