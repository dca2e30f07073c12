#include "swerveid/command/scheduler.hpp"
#include <algorithm>
#include <stdexcept>

namespace swerveid::command
{
    CommandScheduler::~CommandScheduler()
    {
        cancel_all();
    }

    CommandId CommandScheduler::schedule(std::unique_ptr<Command> command)
    {
        if (!command)
        {
            throw std::invalid_argument("CommandScheduler: cannot schedule a null command");
        }

        Command *raw = command.get();
        return start(raw, std::move(command));
    }

    CommandId CommandScheduler::start(Command *command, std::unique_ptr<Command> owned)
    {
        std::size_t existing = index_of(command);
        if (existing < scheduled_.size())
        {
            return scheduled_[existing].id;
        }

        // Interrupt everything that shares a requirement with the incoming command
        for (Subsystem *requirement : command->get_requirements())
        {
            Command *holder = requiring(requirement);
            if (holder)
            {
                finish(index_of(holder), true);
            }
        }

        CommandId id = next_id_++;
        scheduled_.push_back(ScheduledCommand{id, command, std::move(owned)});
        command->initialize();
        return id;
    }

    void CommandScheduler::run()
    {
        for (Subsystem *subsystem : subsystems_)
        {
            subsystem->periodic();
        }

        // Snapshot so commands ended during this tick are not touched again
        std::vector<CommandId> snapshot;
        snapshot.reserve(scheduled_.size());
        for (const auto &entry : scheduled_)
        {
            snapshot.push_back(entry.id);
        }

        for (CommandId id : snapshot)
        {
            Command *command = find(id);
            if (!command)
            {
                continue;
            }

            // Exceptions from execute() leave the command scheduled
            command->execute();

            if (command->is_finished())
            {
                finish(index_of(id), false);
            }
        }

        schedule_default_commands();
    }

    void CommandScheduler::cancel(CommandId id)
    {
        std::size_t index = index_of(id);
        if (index < scheduled_.size())
        {
            finish(index, true);
        }
    }

    void CommandScheduler::cancel_all()
    {
        while (!scheduled_.empty())
        {
            finish(scheduled_.size() - 1, true);
        }
    }

    bool CommandScheduler::is_scheduled(CommandId id) const
    {
        return index_of(id) < scheduled_.size();
    }

    Command *CommandScheduler::find(CommandId id) const
    {
        std::size_t index = index_of(id);
        return index < scheduled_.size() ? scheduled_[index].command : nullptr;
    }

    Command *CommandScheduler::requiring(const Subsystem *subsystem) const
    {
        for (const auto &entry : scheduled_)
        {
            if (entry.command->has_requirement(subsystem))
            {
                return entry.command;
            }
        }
        return nullptr;
    }

    void CommandScheduler::register_subsystem(Subsystem *subsystem)
    {
        if (!subsystem)
        {
            throw std::invalid_argument("CommandScheduler: subsystem cannot be null");
        }
        if (std::find(subsystems_.begin(), subsystems_.end(), subsystem) == subsystems_.end())
        {
            subsystems_.push_back(subsystem);
        }
    }

    void CommandScheduler::unregister_all_subsystems()
    {
        subsystems_.clear();
    }

    void CommandScheduler::set_default_command(Subsystem *subsystem, std::unique_ptr<Command> command)
    {
        if (!subsystem || !command)
        {
            throw std::invalid_argument("CommandScheduler: default command and subsystem cannot be null");
        }
        if (!command->has_requirement(subsystem))
        {
            throw std::invalid_argument("CommandScheduler: default command must require its subsystem");
        }

        auto existing = default_commands_.find(subsystem);
        if (existing != default_commands_.end())
        {
            std::size_t index = index_of(existing->second.get());
            if (index < scheduled_.size())
            {
                finish(index, true);
            }
        }
        default_commands_[subsystem] = std::move(command);
    }

    void CommandScheduler::finish(std::size_t index, bool interrupted)
    {
        // Remove first so end() may safely query the scheduler
        ScheduledCommand entry = std::move(scheduled_[index]);
        scheduled_.erase(scheduled_.begin() + static_cast<std::ptrdiff_t>(index));
        entry.command->end(interrupted);
    }

    std::size_t CommandScheduler::index_of(const Command *command) const
    {
        for (std::size_t i = 0; i < scheduled_.size(); ++i)
        {
            if (scheduled_[i].command == command)
            {
                return i;
            }
        }
        return scheduled_.size();
    }

    std::size_t CommandScheduler::index_of(CommandId id) const
    {
        for (std::size_t i = 0; i < scheduled_.size(); ++i)
        {
            if (scheduled_[i].id == id)
            {
                return i;
            }
        }
        return scheduled_.size();
    }

    void CommandScheduler::schedule_default_commands()
    {
        for (auto &[subsystem, command] : default_commands_)
        {
            if (!requiring(subsystem))
            {
                start(command.get(), nullptr);
            }
        }
    }
}
