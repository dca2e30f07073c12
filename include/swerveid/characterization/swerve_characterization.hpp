#pragma once

#include "swerveid/command/command.hpp"
#include "swerveid/command/subsystem.hpp"
#include "swerveid/swerve/swerve_request.hpp"
#include "swerveid/sysid/sysid_routine.hpp"
#include "swerveid/telemetry/signal_log.hpp"
#include "swerveid/util/clock.hpp"
#include <array>
#include <functional>
#include <memory>
#include <optional>

namespace swerveid::characterization
{
    enum class RoutineType
    {
        TRANSLATION, // drive motor gains
        STEER,       // steer motor gains
        ROTATION     // heading controller gains
    };

    constexpr std::size_t ROUTINE_COUNT = 3;

    inline const char *routine_type_to_string(RoutineType type)
    {
        switch (type)
        {
        case RoutineType::TRANSLATION:
            return "TRANSLATION";
        case RoutineType::STEER:
            return "STEER";
        case RoutineType::ROTATION:
            return "ROTATION";
        default:
            return "UNKNOWN";
        }
    }

    /**
     * @brief Fixed parameters of one characterization routine
     */
    struct RoutineConfig
    {
        RoutineType type;
        const char *mechanism_name;
        const char *state_log_key;
        std::optional<units::VoltageRampRate> ramp_rate;
        std::optional<units::Voltage> step_voltage;
        std::optional<units::Time> timeout;
    };

    // Key the rotation routine mirrors its commanded rate under
    constexpr const char *ROTATIONAL_RATE_LOG_KEY = "Rotational_Rate";

    const RoutineConfig &routine_config(RoutineType type);

    using ApplyControl = std::function<void(const swerve::SwerveRequest &)>;

    /**
     * @brief SysId routines for a swerve drivetrain
     *
     * Holds three routines:
     * - TRANSLATION: drive motor gains, 4 V dynamic step (lower to avoid brownout)
     * - STEER: steer motor gains, 7 V dynamic step
     * - ROTATION: heading controller gains, rad/s carried in the voltage slot
     *
     * quasistatic() and dynamic() build commands for whichever routine is
     * active when they are called. Commands require the subsystem passed in.
     *
     * @example
     * SwerveCharacterization characterization(
     *     [&](const swerve::SwerveRequest &r) { drivetrain.set_control(r); },
     *     &drivetrain, &signal_logger, &clock);
     * characterization.set_active_routine(RoutineType::STEER);
     * scheduler.schedule(characterization.dynamic(sysid::Direction::FORWARD));
     */
    class SwerveCharacterization
    {
    public:
        /**
         * @param apply_control Applies a request to the drivetrain this tick
         * @param subsystem Subsystem the produced commands require (non-owning)
         * @param signal_log Receives state transitions and the rotational rate (non-owning)
         * @param clock Time source for the test ramps (non-owning)
         * @throws std::invalid_argument if any collaborator is null
         */
        SwerveCharacterization(ApplyControl apply_control,
                               command::Subsystem *subsystem,
                               telemetry::ISignalLog *signal_log,
                               const util::IClock *clock);

        SwerveCharacterization(const SwerveCharacterization &) = delete;
        SwerveCharacterization &operator=(const SwerveCharacterization &) = delete;

        void set_active_routine(RoutineType type);
        RoutineType get_active_routine_type() const { return active_type_; }

        /**
         * @brief Quasistatic test of the active routine
         * @return New command; later set_active_routine() calls don't affect it
         */
        std::unique_ptr<command::Command> quasistatic(sysid::Direction direction) const;

        /**
         * @brief Dynamic test of the active routine
         * @return New command; later set_active_routine() calls don't affect it
         */
        std::unique_ptr<command::Command> dynamic(sysid::Direction direction) const;

        const sysid::SysIdRoutine &get_routine(RoutineType type) const;
        const sysid::SysIdRoutine &get_translation_routine() const { return get_routine(RoutineType::TRANSLATION); }
        const sysid::SysIdRoutine &get_steer_routine() const { return get_routine(RoutineType::STEER); }
        const sysid::SysIdRoutine &get_rotation_routine() const { return get_routine(RoutineType::ROTATION); }

    private:
        ApplyControl apply_control_;
        telemetry::ISignalLog *signal_log_;
        std::array<std::unique_ptr<sysid::SysIdRoutine>, ROUTINE_COUNT> routines_;
        RoutineType active_type_;

        std::function<void(units::Voltage)> make_emitter(RoutineType type) const;
    };
}
