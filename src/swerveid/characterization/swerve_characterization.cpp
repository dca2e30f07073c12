#include "swerveid/characterization/swerve_characterization.hpp"
#include <cmath>
#include <stdexcept>

namespace swerveid::characterization
{
    namespace
    {
        std::size_t index_of(RoutineType type)
        {
            return static_cast<std::size_t>(type);
        }

        const std::array<RoutineConfig, ROUTINE_COUNT> ROUTINE_TABLE = {{
            {
                .type = RoutineType::TRANSLATION,
                .mechanism_name = "swerve-translation",
                .state_log_key = "SysIdTranslation_State",
                .ramp_rate = std::nullopt,                         // default 1 V/s
                .step_voltage = units::Voltage::from_volts(4.0),   // 4 V keeps the battery out of brownout
                .timeout = std::nullopt,                           // default 10 s
            },
            {
                .type = RoutineType::STEER,
                .mechanism_name = "swerve-steer",
                .state_log_key = "SysIdSteer_State",
                .ramp_rate = std::nullopt,
                .step_voltage = units::Voltage::from_volts(7.0),
                .timeout = std::nullopt,
            },
            {
                .type = RoutineType::ROTATION,
                .mechanism_name = "swerve-rotation",
                .state_log_key = "SysIdRotation_State",
                // rad/s^2, carried as "V/s" because the routine only ramps volts
                .ramp_rate = units::VoltageRampRate::from_volts_per_sec(M_PI / 6.0),
                // rad/s, carried as "V"
                .step_voltage = units::Voltage::from_volts(M_PI),
                .timeout = std::nullopt,
            },
        }};
    }

    const RoutineConfig &routine_config(RoutineType type)
    {
        return ROUTINE_TABLE.at(index_of(type));
    }

    SwerveCharacterization::SwerveCharacterization(ApplyControl apply_control,
                                                   command::Subsystem *subsystem,
                                                   telemetry::ISignalLog *signal_log,
                                                   const util::IClock *clock)
        : apply_control_(std::move(apply_control)),
          signal_log_(signal_log),
          routines_(),
          active_type_(RoutineType::TRANSLATION)
    {
        if (!apply_control_)
        {
            throw std::invalid_argument("SwerveCharacterization: apply_control cannot be empty");
        }
        if (!subsystem)
        {
            throw std::invalid_argument("SwerveCharacterization: subsystem pointer cannot be null");
        }
        if (!signal_log_)
        {
            throw std::invalid_argument("SwerveCharacterization: signal_log pointer cannot be null");
        }
        if (!clock)
        {
            throw std::invalid_argument("SwerveCharacterization: clock pointer cannot be null");
        }

        for (const RoutineConfig &entry : ROUTINE_TABLE)
        {
            telemetry::ISignalLog *log = signal_log_;
            std::string state_key = entry.state_log_key;

            sysid::Config config{
                .ramp_rate = entry.ramp_rate,
                .step_voltage = entry.step_voltage,
                .timeout = entry.timeout,
                .record_state = [log, state_key](sysid::State state)
                {
                    log->write_string(state_key, sysid::state_to_string(state));
                },
            };

            sysid::Mechanism mechanism{
                .drive = make_emitter(entry.type),
                .log = nullptr,
                .subsystem = subsystem,
                .name = entry.mechanism_name,
            };

            routines_[index_of(entry.type)] = std::make_unique<sysid::SysIdRoutine>(config, std::move(mechanism), clock);
        }
    }

    std::function<void(units::Voltage)> SwerveCharacterization::make_emitter(RoutineType type) const
    {
        ApplyControl apply = apply_control_;
        telemetry::ISignalLog *log = signal_log_;

        switch (type)
        {
        case RoutineType::TRANSLATION:
            return [apply](units::Voltage output)
            {
                apply(swerve::SysIdSwerveTranslation{}.with_volts(output));
            };
        case RoutineType::STEER:
            return [apply](units::Voltage output)
            {
                apply(swerve::SysIdSwerveSteerGains{}.with_volts(output));
            };
        case RoutineType::ROTATION:
            return [apply, log](units::Voltage output)
            {
                // output is really rad/s
                apply(swerve::SysIdSwerveRotation{}.with_rotational_rate(
                    units::BodyAngularVelocity(output.volts)));
                log->write_double(ROTATIONAL_RATE_LOG_KEY, output.volts);
            };
        }
        throw std::invalid_argument("SwerveCharacterization: unknown routine type");
    }

    void SwerveCharacterization::set_active_routine(RoutineType type)
    {
        active_type_ = type;
    }

    std::unique_ptr<command::Command> SwerveCharacterization::quasistatic(sysid::Direction direction) const
    {
        return get_routine(active_type_).quasistatic(direction);
    }

    std::unique_ptr<command::Command> SwerveCharacterization::dynamic(sysid::Direction direction) const
    {
        return get_routine(active_type_).dynamic(direction);
    }

    const sysid::SysIdRoutine &SwerveCharacterization::get_routine(RoutineType type) const
    {
        return *routines_.at(index_of(type));
    }
}
