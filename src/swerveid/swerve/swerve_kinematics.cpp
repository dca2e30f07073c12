#include "swerveid/swerve/swerve_kinematics.hpp"
#include "swerveid/math/angles.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace swerveid::swerve
{
    SwerveKinematics::SwerveKinematics(const std::vector<units::Translation> &module_positions)
        : module_positions_(module_positions),
          inverse_kinematics_(2 * module_positions.size(), 3),
          last_angles_(module_positions.size(), units::Radians(0))
    {
        if (module_positions_.size() < 2)
        {
            throw std::invalid_argument("SwerveKinematics: need at least two modules");
        }

        for (std::size_t i = 0; i < module_positions_.size(); ++i)
        {
            const double x = module_positions_[i].x.inches;
            const double y = module_positions_[i].y.inches;
            const Eigen::Index row = static_cast<Eigen::Index>(2 * i);

            // [vx_i; vy_i] = [1 0 -y; 0 1 x] * [vx; vy; omega]
            inverse_kinematics_.row(row) << 1.0, 0.0, -y;
            inverse_kinematics_.row(row + 1) << 0.0, 1.0, x;
        }
    }

    std::vector<ModuleState> SwerveKinematics::to_module_states(units::BodyLinearVelocity vx,
                                                                units::BodyLinearVelocity vy,
                                                                units::BodyAngularVelocity omega)
    {
        std::vector<ModuleState> states(module_positions_.size());

        if (vx.inches_per_sec == 0.0 && vy.inches_per_sec == 0.0 && omega.rad_per_sec == 0.0)
        {
            for (std::size_t i = 0; i < states.size(); ++i)
            {
                states[i] = ModuleState{units::WheelLinearVelocity(0), last_angles_[i]};
            }
            return states;
        }

        Eigen::Vector3d chassis_speeds(vx.inches_per_sec, vy.inches_per_sec, omega.rad_per_sec);
        Eigen::VectorXd module_velocities = inverse_kinematics_ * chassis_speeds;

        for (std::size_t i = 0; i < states.size(); ++i)
        {
            const double module_vx = module_velocities(static_cast<Eigen::Index>(2 * i));
            const double module_vy = module_velocities(static_cast<Eigen::Index>(2 * i + 1));

            units::Radians angle(std::atan2(module_vy, module_vx));
            states[i] = ModuleState{units::WheelLinearVelocity(std::hypot(module_vx, module_vy)), angle};
            last_angles_[i] = angle;
        }

        return states;
    }

    void SwerveKinematics::desaturate(std::vector<ModuleState> &states, units::WheelLinearVelocity max_speed)
    {
        double fastest = 0.0;
        for (const ModuleState &state : states)
        {
            fastest = std::max(fastest, std::abs(state.speed.inches_per_sec));
        }

        if (fastest <= max_speed.inches_per_sec || fastest == 0.0)
        {
            return;
        }

        const double scale = max_speed.inches_per_sec / fastest;
        for (ModuleState &state : states)
        {
            state.speed = state.speed * scale;
        }
    }

    ModuleState optimize(const ModuleState &desired, units::Radians current_angle)
    {
        double delta = math::angle_difference(desired.angle.value, current_angle.value);
        if (std::abs(delta) > M_PI / 2.0)
        {
            return ModuleState{desired.speed * -1.0,
                               units::Radians(math::normalize_angle(desired.angle.value + M_PI))};
        }
        return desired;
    }
}
