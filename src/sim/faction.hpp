#pragma once

#include "sim/entity.hpp"

namespace otc::sim {

/// A side in combat. Owns squads through their map-position records.
class Faction : public Entity {
public:
    bool is_faction() const override { return true; }

    bool is_player_controlled() const { return is_player_; }
    void set_player_controlled(bool p) { is_player_ = p; }

private:
    bool is_player_ = false;
};

} // namespace otc::sim
