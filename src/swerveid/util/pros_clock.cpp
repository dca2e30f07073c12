#include "swerveid/util/pros_clock.hpp"
#include "api.h"

namespace swerveid::util
{
    units::Time ProsClock::now() const
    {
        return units::Time::from_millis(pros::millis());
    }
}
