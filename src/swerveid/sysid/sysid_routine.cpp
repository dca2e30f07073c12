#include "swerveid/sysid/sysid_routine.hpp"
#include <stdexcept>

namespace swerveid::sysid
{
    State test_state(TestType type, Direction direction)
    {
        if (type == TestType::QUASISTATIC)
        {
            return direction == Direction::FORWARD ? State::QUASISTATIC_FORWARD
                                                   : State::QUASISTATIC_REVERSE;
        }
        return direction == Direction::FORWARD ? State::DYNAMIC_FORWARD
                                               : State::DYNAMIC_REVERSE;
    }

    SysIdRoutine::SysIdRoutine(const Config &config, Mechanism mechanism, const util::IClock *clock)
        : ramp_rate_(config.ramp_rate.value_or(DEFAULT_RAMP_RATE)),
          step_voltage_(config.step_voltage.value_or(DEFAULT_STEP_VOLTAGE)),
          timeout_(config.timeout.value_or(DEFAULT_TIMEOUT)),
          record_state_(config.record_state),
          mechanism_(std::move(mechanism)),
          clock_(clock)
    {
        if (!mechanism_.drive)
        {
            throw std::invalid_argument("SysIdRoutine: drive callback cannot be empty");
        }
        if (!mechanism_.subsystem)
        {
            throw std::invalid_argument("SysIdRoutine: subsystem pointer cannot be null");
        }
        if (!clock_)
        {
            throw std::invalid_argument("SysIdRoutine: clock pointer cannot be null");
        }
        if (ramp_rate_.volts_per_sec <= 0.0)
        {
            throw std::invalid_argument("SysIdRoutine: ramp rate must be positive");
        }
        if (step_voltage_.volts <= 0.0)
        {
            throw std::invalid_argument("SysIdRoutine: step voltage must be positive");
        }
        if (timeout_.seconds <= 0.0)
        {
            throw std::invalid_argument("SysIdRoutine: timeout must be positive");
        }

        if (mechanism_.name.empty())
        {
            mechanism_.name = mechanism_.subsystem->get_name();
        }
    }

    std::unique_ptr<command::Command> SysIdRoutine::quasistatic(Direction direction) const
    {
        return make_command(TestType::QUASISTATIC, direction);
    }

    std::unique_ptr<command::Command> SysIdRoutine::dynamic(Direction direction) const
    {
        return make_command(TestType::DYNAMIC, direction);
    }

    std::unique_ptr<command::Command> SysIdRoutine::make_command(TestType type, Direction direction) const
    {
        SysIdCommandParams params{
            .type = type,
            .direction = direction,
            .ramp_rate = ramp_rate_,
            .step_voltage = step_voltage_,
            .timeout = timeout_,
        };

        std::string name = "sysid-" + mechanism_.name + "-" +
                           state_to_string(test_state(type, direction));

        return std::make_unique<SysIdCommand>(params,
                                              mechanism_.drive,
                                              mechanism_.log,
                                              record_state_,
                                              mechanism_.subsystem,
                                              clock_,
                                              std::move(name));
    }

    SysIdCommand::SysIdCommand(const SysIdCommandParams &params,
                               std::function<void(units::Voltage)> drive,
                               std::function<void()> log,
                               std::function<void(State)> record_state,
                               command::Subsystem *subsystem,
                               const util::IClock *clock,
                               std::string name)
        : command::Command(std::move(name)),
          params_(params),
          drive_(std::move(drive)),
          log_(std::move(log)),
          record_state_(std::move(record_state)),
          timer_(clock)
    {
        add_requirement(subsystem);
    }

    void SysIdCommand::initialize()
    {
        timer_.restart();
        record(test_state(params_.type, params_.direction));
    }

    void SysIdCommand::execute()
    {
        drive_(compute_output());

        if (log_)
        {
            log_();
        }
    }

    void SysIdCommand::end(bool interrupted)
    {
        (void)interrupted;

        // Same safe state for timeout and cancellation
        drive_(units::Voltage::from_volts(0));

        timer_.stop();
        record(State::NONE);
    }

    bool SysIdCommand::is_finished() const
    {
        return timer_.has_elapsed(params_.timeout);
    }

    units::Voltage SysIdCommand::compute_output() const
    {
        double sign = direction_sign(params_.direction);

        if (params_.type == TestType::QUASISTATIC)
        {
            return (params_.ramp_rate * timer_.get()) * sign;
        }
        return params_.step_voltage * sign;
    }

    void SysIdCommand::record(State state) const
    {
        if (record_state_)
        {
            record_state_(state);
        }
    }
}
