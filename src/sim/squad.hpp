#pragma once

#include "sim/entity.hpp"

namespace otc::sim {

/// Unit of command and positioning on the combat grid.
/// Stats are filled in by whoever builds the squad; the combat core only
/// reads speed and range and lets the attack resolver change health.
class Squad : public Entity {
public:
    bool is_squad() const override { return true; }

    i32 movement_speed() const { return movement_speed_; }
    void set_movement_speed(i32 s) { movement_speed_ = s; }

    i32 attack_range() const { return attack_range_; }
    void set_attack_range(i32 r) { attack_range_ = r; }

    i32 health() const { return health_; }
    void set_health(i32 h) { health_ = h < 0 ? 0 : h; }

    i32 max_health() const { return max_health_; }
    void set_max_health(i32 h) { max_health_ = h; }

    /// Subtract damage (clamped at zero health). Returns damage applied.
    i32 apply_damage(i32 amount);

    bool is_dead() const { return destroyed() || health_ <= 0; }

private:
    i32 movement_speed_ = 0; // 0 = unknown, use the rules default
    i32 attack_range_ = 1;
    i32 health_ = 100;
    i32 max_health_ = 100;
};

} // namespace otc::sim
