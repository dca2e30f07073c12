#include "swerveid/command/command.hpp"
#include <stdexcept>

namespace swerveid::command
{
    void Command::add_requirements(std::initializer_list<Subsystem *> subsystems)
    {
        for (Subsystem *subsystem : subsystems)
        {
            add_requirement(subsystem);
        }
    }

    void Command::add_requirement(Subsystem *subsystem)
    {
        if (!subsystem)
        {
            throw std::invalid_argument("Command: requirement cannot be null");
        }
        requirements_.insert(subsystem);
    }

    bool Command::has_requirement(const Subsystem *subsystem) const
    {
        return requirements_.find(subsystem) != requirements_.end();
    }

    RunCommand::RunCommand(std::function<void()> body,
                           std::initializer_list<Subsystem *> requirements,
                           std::string name)
        : Command(std::move(name)), body_(std::move(body))
    {
        if (!body_)
        {
            throw std::invalid_argument("RunCommand: body cannot be empty");
        }
        add_requirements(requirements);
    }

    void RunCommand::execute()
    {
        body_();
    }
}
