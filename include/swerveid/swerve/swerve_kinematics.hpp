#pragma once

#include "swerveid/units/units.hpp"
#include <Eigen/Dense>
#include <vector>

namespace swerveid::swerve
{
    struct ModuleState
    {
        units::WheelLinearVelocity speed;
        units::Radians angle;
    };

    /**
     * @brief Inverse kinematics for an N-module swerve drive
     *
     * Module positions are measured from the robot's center of rotation,
     * x forward and y left, in inches.
     */
    class SwerveKinematics
    {
    public:
        explicit SwerveKinematics(const std::vector<units::Translation> &module_positions);

        /**
         * @brief Module speeds and angles for a robot-relative chassis speed
         *
         * When the chassis speed is zero, modules keep their previous angle
         * and get zero speed instead of snapping to 0 rad.
         */
        std::vector<ModuleState> to_module_states(units::BodyLinearVelocity vx,
                                                  units::BodyLinearVelocity vy,
                                                  units::BodyAngularVelocity omega);

        /**
         * @brief Scale every module speed so none exceeds max_speed
         */
        static void desaturate(std::vector<ModuleState> &states, units::WheelLinearVelocity max_speed);

        std::size_t module_count() const { return module_positions_.size(); }
        const std::vector<units::Translation> &get_module_positions() const { return module_positions_; }

    private:
        std::vector<units::Translation> module_positions_;
        Eigen::MatrixXd inverse_kinematics_; // 2N x 3
        std::vector<units::Radians> last_angles_;
    };

    /**
     * @brief Flip the target and reverse the wheel when that needs less than 90 degrees of steering
     */
    ModuleState optimize(const ModuleState &desired, units::Radians current_angle);
}
