#pragma once
namespace swerveid::control
{
    struct PIDConstants
    {
        double kP;
        double kI;
        double kD;
        double max_integral;
    };

    /**
     * @brief PID on a scalar error with optional output clamp
     *
     * Steering loops pass an already-wrapped angle error (see math::angle_difference).
     */
    class PID
    {
    private:
        PIDConstants constants;
        double max_output;
        double integral = 0.0;
        double prev_error = 0.0;
        bool has_prev_error = false;

    public:
        /**
         * @param constants Gains and integral clamp
         * @param output_limit Symmetric output clamp, <= 0 disables it
         */
        explicit PID(const PIDConstants &constants, double output_limit = 0.0);

        double compute(double error, double dt);

        void reset();
        void set_constants(const PIDConstants &new_constants);
        PIDConstants get_constants() const;
    };
}
