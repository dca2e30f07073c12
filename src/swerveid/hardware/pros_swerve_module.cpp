#include "swerveid/hardware/pros_swerve_module.hpp"
#include "swerveid/math/angles.hpp"

namespace swerveid::hardware
{
    ProsSwerveModule::ProsSwerveModule(const SwerveModuleConfig &config)
        : drive_motor_(config.drive_port, config.drive_gearset),
          steer_motor_(config.steer_port, config.steer_gearset),
          steer_encoder_(config.encoder_port),
          steer_pid_(config.steer_pid, config.max_steer_voltage.volts),
          config_(config)
    {
        drive_motor_.set_brake_mode(pros::E_MOTOR_BRAKE_COAST);
        steer_motor_.set_brake_mode(pros::E_MOTOR_BRAKE_HOLD);
    }

    void ProsSwerveModule::set_drive_voltage(units::Voltage voltage)
    {
        drive_motor_.move(voltage.to_pros_units());
    }

    void ProsSwerveModule::set_steer_voltage(units::Voltage voltage)
    {
        // Open loop, so the closed loop must not resume with stale state
        steer_pid_.reset();
        steer_motor_.move(voltage.to_pros_units());
    }

    void ProsSwerveModule::set_steer_angle(units::Radians angle)
    {
        double error = math::angle_difference(angle.value, get_steer_angle().value);
        double output = steer_pid_.compute(error, config_.loop_period.to_seconds());
        steer_motor_.move(units::Voltage::from_volts(output).to_pros_units());
    }

    units::Radians ProsSwerveModule::get_steer_angle()
    {
        // Rotation sensor returns centidegrees
        double degrees = steer_encoder_.get_angle() / 100.0;
        units::Radians raw = units::Degrees(degrees).to_radians();
        return units::Radians(math::normalize_angle(raw.value - config_.encoder_offset.value));
    }

    void ProsSwerveModule::stop()
    {
        steer_pid_.reset();
        drive_motor_.brake();
        steer_motor_.brake();
    }
}
