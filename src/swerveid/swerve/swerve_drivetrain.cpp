#include "swerveid/swerve/swerve_drivetrain.hpp"
#include <stdexcept>

namespace swerveid::swerve
{
    SwerveDrivetrain::SwerveDrivetrain(const DrivetrainConfig &config,
                                       const std::vector<hardware::ISwerveModule *> &modules,
                                       telemetry::ISignalLog *signal_log,
                                       const util::IClock *clock)
        : command::Subsystem("drivetrain"),
          config_(config),
          modules_(modules),
          kinematics_(config.module_positions),
          last_request_(Idle{}),
          characterization_([this](const SwerveRequest &request)
                            { set_control(request); },
                            this, signal_log, clock)
    {
        if (modules_.size() != config_.module_positions.size())
        {
            throw std::invalid_argument("SwerveDrivetrain: need one module per module position");
        }
        for (hardware::ISwerveModule *module : modules_)
        {
            if (!module)
            {
                throw std::invalid_argument("SwerveDrivetrain: module pointer cannot be null");
            }
        }
        if (config_.max_speed.inches_per_sec <= 0.0)
        {
            throw std::invalid_argument("SwerveDrivetrain: max_speed must be positive");
        }
        if (config_.max_voltage.volts <= 0.0)
        {
            throw std::invalid_argument("SwerveDrivetrain: max_voltage must be positive");
        }
    }

    void SwerveDrivetrain::set_control(const SwerveRequest &request)
    {
        last_request_ = request;
        std::visit([this](const auto &r)
                   { apply(r); },
                   request);
    }

    void SwerveDrivetrain::apply(const Idle &)
    {
        for (hardware::ISwerveModule *module : modules_)
        {
            module->stop();
        }
    }

    void SwerveDrivetrain::apply(const SysIdSwerveTranslation &request)
    {
        for (hardware::ISwerveModule *module : modules_)
        {
            module->set_steer_angle(units::Radians(0));
            module->set_drive_voltage(request.volts);
        }
    }

    void SwerveDrivetrain::apply(const SysIdSwerveSteerGains &request)
    {
        for (hardware::ISwerveModule *module : modules_)
        {
            module->set_drive_voltage(units::Voltage::from_volts(0));
            module->set_steer_voltage(request.volts);
        }
    }

    void SwerveDrivetrain::apply(const SysIdSwerveRotation &request)
    {
        std::vector<ModuleState> states = kinematics_.to_module_states(
            units::BodyLinearVelocity(0), units::BodyLinearVelocity(0), request.rotational_rate);
        SwerveKinematics::desaturate(states, config_.max_speed);

        for (std::size_t i = 0; i < modules_.size(); ++i)
        {
            ModuleState target = optimize(states[i], modules_[i]->get_steer_angle());

            // Open loop: scale wheel speed into the voltage range
            units::Voltage drive_voltage =
                config_.max_voltage * (target.speed.inches_per_sec / config_.max_speed.inches_per_sec);

            modules_[i]->set_steer_angle(target.angle);
            modules_[i]->set_drive_voltage(drive_voltage);
        }
    }

    std::unique_ptr<command::Command> SwerveDrivetrain::apply_request(std::function<SwerveRequest()> request_supplier)
    {
        if (!request_supplier)
        {
            throw std::invalid_argument("SwerveDrivetrain: request supplier cannot be empty");
        }

        return std::make_unique<command::RunCommand>(
            [this, supplier = std::move(request_supplier)]()
            { set_control(supplier()); },
            std::initializer_list<command::Subsystem *>{this},
            "drivetrain-apply-request");
    }

    std::unique_ptr<command::Command> SwerveDrivetrain::sysid_quasistatic(sysid::Direction direction)
    {
        return characterization_.quasistatic(direction);
    }

    std::unique_ptr<command::Command> SwerveDrivetrain::sysid_dynamic(sysid::Direction direction)
    {
        return characterization_.dynamic(direction);
    }
}
