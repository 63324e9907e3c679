#pragma once

/// @file game_system.hpp
/// @brief System base and scheduler specialised for the simulation World.

#include "pacsim/ecs/system_scheduler.hpp"
#include "pacsim/game/world.hpp"

namespace pacsim::game {

using GameSystem = ecs::ISystem<World>;
using GameScheduler = ecs::SystemScheduler<World>;

} // namespace pacsim::game
