#pragma once

#include "swerveid/units/units.hpp"
#include <variant>

namespace swerveid::swerve
{
    // Coast all modules, no output
    struct Idle
    {
    };

    // All modules point forward, drive motors at a fixed voltage
    struct SysIdSwerveTranslation
    {
        units::Voltage volts = units::Voltage::from_volts(0);

        SysIdSwerveTranslation with_volts(units::Voltage v) const
        {
            SysIdSwerveTranslation copy = *this;
            copy.volts = v;
            return copy;
        }
    };

    // Drive motors off, steer motors at a fixed voltage
    struct SysIdSwerveSteerGains
    {
        units::Voltage volts = units::Voltage::from_volts(0);

        SysIdSwerveSteerGains with_volts(units::Voltage v) const
        {
            SysIdSwerveSteerGains copy = *this;
            copy.volts = v;
            return copy;
        }
    };

    // Spin in place at a commanded rate, for heading controller tuning
    struct SysIdSwerveRotation
    {
        units::BodyAngularVelocity rotational_rate = units::BodyAngularVelocity(0);

        SysIdSwerveRotation with_rotational_rate(units::BodyAngularVelocity rate) const
        {
            SysIdSwerveRotation copy = *this;
            copy.rotational_rate = rate;
            return copy;
        }
    };

    using SwerveRequest = std::variant<Idle,
                                       SysIdSwerveTranslation,
                                       SysIdSwerveSteerGains,
                                       SysIdSwerveRotation>;

    const char *request_name(const SwerveRequest &request);

    /**
     * @brief Scalar carried by the request (volts or rad/s), 0 for Idle
     */
    double request_magnitude(const SwerveRequest &request);
}
