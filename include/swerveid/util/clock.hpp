#pragma once
#include "swerveid/units/units.hpp"

namespace swerveid::util
{
    /**
     * @brief Monotonic time source
     *
     * On the robot this wraps pros::millis(). Tests drive it by hand.
     */
    class IClock
    {
    public:
        virtual ~IClock() = default;
        virtual units::Time now() const = 0;
    };

    /**
     * @brief Stopwatch measured against an IClock
     */
    class Timer
    {
    private:
        const IClock *clock_;
        units::Time start_time_;
        units::Time accumulated_;
        bool running_;

    public:
        explicit Timer(const IClock *clock)
            : clock_(clock), start_time_(), accumulated_(), running_(false) {}

        void restart()
        {
            accumulated_ = units::Time::from_seconds(0);
            start_time_ = clock_->now();
            running_ = true;
        }

        void stop()
        {
            if (running_)
            {
                accumulated_ = accumulated_ + (clock_->now() - start_time_);
                running_ = false;
            }
        }

        units::Time get() const
        {
            if (running_)
            {
                return accumulated_ + (clock_->now() - start_time_);
            }
            return accumulated_;
        }

        bool has_elapsed(units::Time period) const { return get() >= period; }
    };
}
