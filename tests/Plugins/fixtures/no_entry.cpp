/**
 * @file no_entry.cpp
 * @brief Gate fixture: shared object without the plugin entry point
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Plugins/Plugin.hpp>

class NoEntry : public Hookwarden::Plugins::HandlerPlugin {
public:
    Hookwarden::Plugins::HandlerResponse call(const nlohmann::json&,
                                              const Hookwarden::Core::HeaderMap&,
                                              const nlohmann::json&,
                                              Hookwarden::Core::Logger&) override {
        return {};
    }
};

extern "C" HOOKWARDEN_PLUGIN_EXPORT int no_entry_marker() {
    return 1;
}
