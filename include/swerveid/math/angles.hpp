#pragma once

#include <cmath>

namespace swerveid::math
{
    // Wrap to [-pi, pi)
    inline double normalize_angle(double angle)
    {
        angle = fmod(angle + M_PI, 2.0 * M_PI);
        if (angle < 0.0)
        {
            angle += 2.0 * M_PI;
        }
        return angle - M_PI;
    }

    // Shortest signed rotation from `from` to `to`
    inline double angle_difference(double to, double from)
    {
        return normalize_angle(to - from);
    }

    inline int sgn(double x)
    {
        return (x > 0) - (x < 0);
    }
}
