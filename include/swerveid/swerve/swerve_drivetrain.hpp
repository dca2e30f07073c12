#pragma once

#include "swerveid/characterization/swerve_characterization.hpp"
#include "swerveid/command/command.hpp"
#include "swerveid/command/subsystem.hpp"
#include "swerveid/hardware/swerve_module_interface.hpp"
#include "swerveid/swerve/swerve_kinematics.hpp"
#include "swerveid/swerve/swerve_request.hpp"
#include "swerveid/sysid/sysid_routine.hpp"
#include "swerveid/telemetry/signal_log.hpp"
#include "swerveid/util/clock.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace swerveid::swerve
{
    struct DrivetrainConfig
    {
        // Front-left, front-right, back-left, back-right
        std::vector<units::Translation> module_positions;
        units::WheelLinearVelocity max_speed = units::WheelLinearVelocity(60.0);
        units::Voltage max_voltage = units::Voltage::from_volts(12.0);
    };

    /**
     * @brief Swerve drivetrain subsystem
     *
     * set_control() reduces a SwerveRequest to per-module outputs for this
     * tick. Module order matches DrivetrainConfig::module_positions.
     */
    class SwerveDrivetrain : public command::Subsystem
    {
    public:
        /**
         * @param config Module geometry and output limits
         * @param modules One module per position (non-owning)
         * @param signal_log Sink for characterization state (non-owning)
         * @param clock Time source for characterization ramps (non-owning)
         */
        SwerveDrivetrain(const DrivetrainConfig &config,
                         const std::vector<hardware::ISwerveModule *> &modules,
                         telemetry::ISignalLog *signal_log,
                         const util::IClock *clock);

        void set_control(const SwerveRequest &request);

        /**
         * @brief Command that applies the supplied request every tick
         *
         * Never finishes on its own. Requires the drivetrain.
         */
        std::unique_ptr<command::Command> apply_request(std::function<SwerveRequest()> request_supplier);

        std::unique_ptr<command::Command> sysid_quasistatic(sysid::Direction direction);
        std::unique_ptr<command::Command> sysid_dynamic(sysid::Direction direction);

        characterization::SwerveCharacterization &get_characterization() { return characterization_; }
        const SwerveRequest &get_last_request() const { return last_request_; }
        std::size_t module_count() const { return modules_.size(); }

    private:
        DrivetrainConfig config_;
        std::vector<hardware::ISwerveModule *> modules_;
        SwerveKinematics kinematics_;
        SwerveRequest last_request_;
        characterization::SwerveCharacterization characterization_;

        void apply(const Idle &request);
        void apply(const SysIdSwerveTranslation &request);
        void apply(const SysIdSwerveSteerGains &request);
        void apply(const SysIdSwerveRotation &request);
    };
}
