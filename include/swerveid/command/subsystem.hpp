#pragma once

#include <string>

namespace swerveid::command
{
    /**
     * @brief A mechanism that commands claim exclusively while they run
     *
     * Identity is the object address. Two commands conflict when their
     * requirement sets share a Subsystem pointer.
     */
    class Subsystem
    {
    private:
        std::string name_;

    public:
        explicit Subsystem(std::string name) : name_(std::move(name)) {}
        virtual ~Subsystem() = default;

        Subsystem(const Subsystem &) = delete;
        Subsystem &operator=(const Subsystem &) = delete;

        // Called once per scheduler tick before any command executes
        virtual void periodic() {}

        const std::string &get_name() const { return name_; }
    };
}
