/**
 * @file wrong_capability.cpp
 * @brief Gate fixture: a lifecycle plugin placed in a handler directory
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Plugins/Plugin.hpp>

class WrongCapability : public Hookwarden::Plugins::LifecyclePlugin {};

HOOKWARDEN_PLUGIN(WrongCapability)
