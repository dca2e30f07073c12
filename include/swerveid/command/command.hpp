#pragma once

#include "swerveid/command/subsystem.hpp"
#include <functional>
#include <initializer_list>
#include <set>
#include <string>

namespace swerveid::command
{
    /**
     * @brief Unit of work run by the CommandScheduler
     *
     * Lifecycle: initialize() once, execute() every tick until is_finished()
     * returns true or the command is cancelled, then end(interrupted).
     */
    class Command
    {
    private:
        std::set<Subsystem *, std::less<>> requirements_;
        std::string name_;

    public:
        explicit Command(std::string name = "Command") : name_(std::move(name)) {}
        virtual ~Command() = default;

        Command(const Command &) = delete;
        Command &operator=(const Command &) = delete;

        virtual void initialize() {}
        virtual void execute() {}
        virtual void end(bool interrupted) { (void)interrupted; }
        virtual bool is_finished() const { return false; }

        void add_requirements(std::initializer_list<Subsystem *> subsystems);
        void add_requirement(Subsystem *subsystem);
        const std::set<Subsystem *, std::less<>> &get_requirements() const { return requirements_; }
        bool has_requirement(const Subsystem *subsystem) const;

        const std::string &get_name() const { return name_; }
    };

    /**
     * @brief Runs a function every tick, never finishes on its own
     */
    class RunCommand : public Command
    {
    private:
        std::function<void()> body_;

    public:
        RunCommand(std::function<void()> body,
                   std::initializer_list<Subsystem *> requirements,
                   std::string name = "RunCommand");

        void execute() override;
    };
}
