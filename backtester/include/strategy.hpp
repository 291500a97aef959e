#pragma once

#include <string>

#include "engine.hpp"

namespace backtester {

    // --- Strategy Interface ---
    // Receives one window per engine tick. Decision logic, orders and positions live
    // entirely on the implementation side.
    class IStrategy {
    public:
        virtual ~IStrategy() = default;

        virtual std::string getName() const = 0;

        // The window is owned by the callee for the duration of the call
        virtual void onTick(engine::Window& window) = 0;
    };

    // Consumes windows without acting on them; dry runs and tests
    class EmptyStrategy : public IStrategy {
    public:
        std::string getName() const override { return "EmptyStrategy"; }
        void onTick(engine::Window&) override {}
    };

} // namespace backtester
