#pragma once

#include "api.h"
#include "swerveid/control/pid.hpp"
#include "swerveid/hardware/swerve_module_interface.hpp"
#include "swerveid/units/units.hpp"

namespace swerveid::hardware
{
    struct SwerveModuleConfig
    {
        int8_t drive_port;
        int8_t steer_port;
        int8_t encoder_port;
        pros::MotorGearset drive_gearset = pros::MotorGearset::blue;
        pros::MotorGearset steer_gearset = pros::MotorGearset::green;

        // Encoder reading when the wheel points forward
        units::Radians encoder_offset = units::Radians(0);

        control::PIDConstants steer_pid = {12.0, 0.0, 0.1, 1.0};
        units::Voltage max_steer_voltage = units::Voltage::from_volts(12.0);
        units::Time loop_period = units::Time::from_millis(10.0);
    };

    /**
     * @brief Swerve module on V5 hardware
     *
     * One drive motor, one steer motor, and a rotation sensor on the steering
     * axis for absolute wheel angle.
     */
    class ProsSwerveModule : public ISwerveModule
    {
    private:
        pros::Motor drive_motor_;
        pros::Motor steer_motor_;
        pros::Rotation steer_encoder_;
        control::PID steer_pid_;
        SwerveModuleConfig config_;

    public:
        explicit ProsSwerveModule(const SwerveModuleConfig &config);

        void set_drive_voltage(units::Voltage voltage) override;
        void set_steer_voltage(units::Voltage voltage) override;
        void set_steer_angle(units::Radians angle) override;
        units::Radians get_steer_angle() override;
        void stop() override;
    };
}
