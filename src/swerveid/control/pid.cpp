#include "swerveid/control/pid.hpp"
#include <algorithm>
#include <stdexcept>

namespace swerveid::control
{
    PID::PID(const PIDConstants &constants, double output_limit)
        : constants(constants), max_output(output_limit)
    {
        if (constants.max_integral < 0.0)
        {
            throw std::invalid_argument("PID: max_integral cannot be negative");
        }
    }

    double PID::compute(double error, double dt)
    {
        if (dt <= 0.0)
        {
            throw std::invalid_argument("PID: dt must be positive");
        }

        integral += error * dt;
        integral = std::clamp(integral, -constants.max_integral, constants.max_integral);

        // No derivative kick on the first sample
        double derivative = has_prev_error ? (error - prev_error) / dt : 0.0;
        prev_error = error;
        has_prev_error = true;

        double output = constants.kP * error + constants.kI * integral + constants.kD * derivative;

        if (max_output > 0.0)
        {
            output = std::clamp(output, -max_output, max_output);
        }
        return output;
    }

    void PID::reset()
    {
        integral = 0.0;
        prev_error = 0.0;
        has_prev_error = false;
    }

    void PID::set_constants(const PIDConstants &new_constants)
    {
        constants = new_constants;
    }

    PIDConstants PID::get_constants() const
    {
        return constants;
    }
}
