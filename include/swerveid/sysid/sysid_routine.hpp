#pragma once

#include "swerveid/command/command.hpp"
#include "swerveid/command/subsystem.hpp"
#include "swerveid/units/units.hpp"
#include "swerveid/util/clock.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace swerveid::sysid
{
    enum class Direction
    {
        FORWARD,
        REVERSE
    };

    enum class TestType
    {
        QUASISTATIC,
        DYNAMIC
    };

    // Test phase reported to Config::record_state
    enum class State
    {
        QUASISTATIC_FORWARD,
        QUASISTATIC_REVERSE,
        DYNAMIC_FORWARD,
        DYNAMIC_REVERSE,
        NONE
    };

    inline const char *state_to_string(State state)
    {
        switch (state)
        {
        case State::QUASISTATIC_FORWARD:
            return "quasistatic-forward";
        case State::QUASISTATIC_REVERSE:
            return "quasistatic-reverse";
        case State::DYNAMIC_FORWARD:
            return "dynamic-forward";
        case State::DYNAMIC_REVERSE:
            return "dynamic-reverse";
        case State::NONE:
            return "none";
        default:
            return "unknown";
        }
    }

    inline double direction_sign(Direction direction)
    {
        return direction == Direction::FORWARD ? 1.0 : -1.0;
    }

    State test_state(TestType type, Direction direction);

    constexpr units::VoltageRampRate DEFAULT_RAMP_RATE = units::VoltageRampRate::from_volts_per_sec(1.0);
    constexpr units::Voltage DEFAULT_STEP_VOLTAGE = units::Voltage::from_volts(7.0);
    constexpr units::Time DEFAULT_TIMEOUT = units::Time::from_seconds(10.0);

    /**
     * @brief Test parameters. Empty optionals fall back to the defaults above.
     */
    struct Config
    {
        std::optional<units::VoltageRampRate> ramp_rate = std::nullopt;
        std::optional<units::Voltage> step_voltage = std::nullopt;
        std::optional<units::Time> timeout = std::nullopt;
        std::function<void(State)> record_state = nullptr;
    };

    /**
     * @brief What the routine drives
     */
    struct Mechanism
    {
        std::function<void(units::Voltage)> drive;
        std::function<void()> log = nullptr; // per-tick data capture, optional
        command::Subsystem *subsystem = nullptr;
        std::string name = "";               // defaults to subsystem name
    };

    /**
     * @brief Quasistatic / dynamic system identification tests for one mechanism
     *
     * Quasistatic: output = direction * ramp_rate * elapsed
     * Dynamic:     output = direction * step_voltage
     *
     * Both stop after the timeout, and always finish by driving 0 V and
     * recording State::NONE, whether they complete or are cancelled.
     */
    class SysIdRoutine
    {
    public:
        /**
         * @param config Ramp rate, step voltage, timeout, state recorder
         * @param mechanism Drive callback and the subsystem the commands require
         * @param clock Time source for ramp timing (non-owning)
         * @throws std::invalid_argument on missing drive/subsystem/clock or non-positive parameters
         */
        SysIdRoutine(const Config &config, Mechanism mechanism, const util::IClock *clock);

        /**
         * @brief Slow voltage ramp in the given direction
         * @return New command requiring the mechanism's subsystem
         */
        std::unique_ptr<command::Command> quasistatic(Direction direction) const;

        /**
         * @brief Voltage step in the given direction
         * @return New command requiring the mechanism's subsystem
         */
        std::unique_ptr<command::Command> dynamic(Direction direction) const;

        units::VoltageRampRate get_ramp_rate() const { return ramp_rate_; }
        units::Voltage get_step_voltage() const { return step_voltage_; }
        units::Time get_timeout() const { return timeout_; }
        const std::string &get_name() const { return mechanism_.name; }
        command::Subsystem *get_subsystem() const { return mechanism_.subsystem; }

    private:
        units::VoltageRampRate ramp_rate_;
        units::Voltage step_voltage_;
        units::Time timeout_;
        std::function<void(State)> record_state_;
        Mechanism mechanism_;
        const util::IClock *clock_;

        std::unique_ptr<command::Command> make_command(TestType type, Direction direction) const;
    };

    struct SysIdCommandParams
    {
        TestType type;
        Direction direction;
        units::VoltageRampRate ramp_rate;
        units::Voltage step_voltage;
        units::Time timeout;
    };

    /**
     * @brief One run of a SysIdRoutine test
     */
    class SysIdCommand : public command::Command
    {
    public:
        SysIdCommand(const SysIdCommandParams &params,
                     std::function<void(units::Voltage)> drive,
                     std::function<void()> log,
                     std::function<void(State)> record_state,
                     command::Subsystem *subsystem,
                     const util::IClock *clock,
                     std::string name);

        void initialize() override;
        void execute() override;
        void end(bool interrupted) override;
        bool is_finished() const override;

    private:
        SysIdCommandParams params_;
        std::function<void(units::Voltage)> drive_;
        std::function<void()> log_;
        std::function<void(State)> record_state_;
        util::Timer timer_;

        units::Voltage compute_output() const;
        void record(State state) const;
    };
}
