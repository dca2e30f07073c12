#pragma once

#include "swerveid/command/command.hpp"
#include "swerveid/command/subsystem.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

namespace swerveid::command
{
    /**
     * @brief Identifies one scheduling of a command
     *
     * Ids are never reused, so an id outlives the command it named:
     * is_scheduled() reports false and cancel() does nothing once that run ended.
     */
    using CommandId = std::uint32_t;

    constexpr CommandId NO_COMMAND = 0;

    /**
     * @brief Cooperative, tick-driven command runner
     *
     * Owns every command handed to schedule(). A subsystem is held by at
     * most one running command; scheduling a command that needs a busy
     * subsystem interrupts the command currently holding it.
     *
     * Not thread safe. Call everything from the control loop task.
     *
     * @example
     * CommandScheduler scheduler;
     * scheduler.register_subsystem(&drivetrain);
     * scheduler.schedule(drivetrain.sysid_quasistatic(sysid::Direction::FORWARD));
     * while (true) {
     *     scheduler.run();
     *     pros::delay(10);
     * }
     */
    class CommandScheduler
    {
    public:
        CommandScheduler() = default;
        ~CommandScheduler();

        CommandScheduler(const CommandScheduler &) = delete;
        CommandScheduler &operator=(const CommandScheduler &) = delete;

        /**
         * @brief Take ownership of a command and start it
         * @return Id usable with cancel(), is_scheduled() and find()
         */
        CommandId schedule(std::unique_ptr<Command> command);

        /**
         * @brief Run one tick: subsystem periodic(), command execute(), finish checks, default commands
         */
        void run();

        void cancel(CommandId id);
        void cancel_all();

        bool is_scheduled(CommandId id) const;

        /**
         * @brief The running command with this id, or nullptr once it ended
         */
        Command *find(CommandId id) const;

        /**
         * @brief Command currently holding the subsystem, or nullptr
         */
        Command *requiring(const Subsystem *subsystem) const;

        void register_subsystem(Subsystem *subsystem);
        void unregister_all_subsystems();

        /**
         * @brief Command scheduled whenever the subsystem has no other command
         *
         * Must require the subsystem. The scheduler keeps it across interruptions.
         */
        void set_default_command(Subsystem *subsystem, std::unique_ptr<Command> command);

        std::size_t size() const { return scheduled_.size(); }

    private:
        struct ScheduledCommand
        {
            CommandId id;
            Command *command;
            std::unique_ptr<Command> owned; // empty for default commands
        };

        CommandId next_id_ = NO_COMMAND + 1;

        std::vector<ScheduledCommand> scheduled_;
        std::vector<Subsystem *> subsystems_;
        std::map<Subsystem *, std::unique_ptr<Command>> default_commands_;

        CommandId start(Command *command, std::unique_ptr<Command> owned);
        void finish(std::size_t index, bool interrupted);
        std::size_t index_of(const Command *command) const;
        std::size_t index_of(CommandId id) const;
        void schedule_default_commands();
    };
}
