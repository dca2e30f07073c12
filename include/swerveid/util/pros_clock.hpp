#pragma once

#include "swerveid/util/clock.hpp"

namespace swerveid::util
{
    // Brain system time (pros::millis)
    class ProsClock : public IClock
    {
    public:
        units::Time now() const override;
    };
}
