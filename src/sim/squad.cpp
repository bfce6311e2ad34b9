#include "sim/squad.hpp"

#include <algorithm>

namespace otc::sim {

i32 Squad::apply_damage(i32 amount) {
    if (amount <= 0 || health_ <= 0) return 0;
    i32 applied = std::min(amount, health_);
    health_ -= applied;
    return applied;
}

} // namespace otc::sim
