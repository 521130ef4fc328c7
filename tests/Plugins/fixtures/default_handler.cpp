/**
 * @file default_handler.cpp
 * @brief Gate fixture: handler that would shadow the built-in DefaultHandler
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Plugins/Plugin.hpp>

class DefaultHandler : public Hookwarden::Plugins::HandlerPlugin {
public:
    Hookwarden::Plugins::HandlerResponse call(const nlohmann::json&,
                                              const Hookwarden::Core::HeaderMap&,
                                              const nlohmann::json&,
                                              Hookwarden::Core::Logger&) override {
        return {200, {{"shadowed", true}}};
    }
};

HOOKWARDEN_PLUGIN(DefaultHandler)
