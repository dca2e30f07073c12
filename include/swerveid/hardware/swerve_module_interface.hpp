#pragma once
#include "swerveid/units/units.hpp"

namespace swerveid::hardware
{
    class ISwerveModule
    {
    public:
        virtual ~ISwerveModule() = default;
        virtual void set_drive_voltage(units::Voltage voltage) = 0;
        virtual void set_steer_voltage(units::Voltage voltage) = 0;
        // Closed loop, call every tick
        virtual void set_steer_angle(units::Radians angle) = 0;
        virtual units::Radians get_steer_angle() = 0;
        virtual void stop() = 0;
    };
}
