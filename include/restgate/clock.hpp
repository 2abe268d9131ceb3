#pragma once

#include "export.hpp"

#include <chrono>
#include <memory>

namespace restgate
{

    /**
     * @brief Wall-clock source shared by the rate limiter, block list and security log
     *
     * Limiter windows and persisted block records are expressed in system time so
     * that block expiries survive a restart.
     */
    class RESTGATE_SERVER_API Clock
    {
    public:
        using time_point = std::chrono::system_clock::time_point;

        virtual ~Clock() = default;
        virtual time_point now() const = 0;

        /**
         * @brief Process-wide clock backed by std::chrono::system_clock
         */
        static std::shared_ptr<const Clock> system();
    };

    class RESTGATE_SERVER_API SystemClock : public Clock
    {
    public:
        time_point now() const override { return std::chrono::system_clock::now(); }
    };

    inline std::shared_ptr<const Clock> Clock::system()
    {
        static std::shared_ptr<const Clock> instance = std::make_shared<SystemClock>();
        return instance;
    }

} // namespace restgate
