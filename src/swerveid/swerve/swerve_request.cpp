#include "swerveid/swerve/swerve_request.hpp"

namespace swerveid::swerve
{
    namespace
    {
        struct NameVisitor
        {
            const char *operator()(const Idle &) const { return "Idle"; }
            const char *operator()(const SysIdSwerveTranslation &) const { return "translation characterization"; }
            const char *operator()(const SysIdSwerveSteerGains &) const { return "steer characterization"; }
            const char *operator()(const SysIdSwerveRotation &) const { return "rotational-rate characterization"; }
        };

        struct MagnitudeVisitor
        {
            double operator()(const Idle &) const { return 0.0; }
            double operator()(const SysIdSwerveTranslation &r) const { return r.volts.volts; }
            double operator()(const SysIdSwerveSteerGains &r) const { return r.volts.volts; }
            double operator()(const SysIdSwerveRotation &r) const { return r.rotational_rate.rad_per_sec; }
        };
    }

    const char *request_name(const SwerveRequest &request)
    {
        return std::visit(NameVisitor{}, request);
    }

    double request_magnitude(const SwerveRequest &request)
    {
        return std::visit(MagnitudeVisitor{}, request);
    }
}
