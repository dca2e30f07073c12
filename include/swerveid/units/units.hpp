#pragma once
#include <cmath>
#include <cstdint>
namespace swerveid::units
{

    // ============= ANGLES =============
    struct Radians
    {
        double value;

        constexpr Radians() : value(0) {}
        constexpr explicit Radians(double v) : value(v) {}

        constexpr Radians operator+(Radians other) const { return Radians(value + other.value); }
        constexpr Radians operator-(Radians other) const { return Radians(value - other.value); }
        constexpr Radians operator-() const { return Radians(-value); }
    };

    // Rotation sensor readings come in degrees
    struct Degrees
    {
        double value;

        constexpr Degrees() : value(0) {}
        constexpr explicit Degrees(double v) : value(v) {}

        constexpr Radians to_radians() const { return Radians(value * M_PI / 180.0); }
    };

    // ============= TIME =============
    struct Time
    {
        double seconds;

        constexpr Time() : seconds(0) {}
        constexpr explicit Time(double s) : seconds(s) {}

        constexpr Time operator+(Time other) const { return Time(seconds + other.seconds); }
        constexpr Time operator-(Time other) const { return Time(seconds - other.seconds); }

        constexpr bool operator<(Time other) const { return seconds < other.seconds; }
        constexpr bool operator>=(Time other) const { return seconds >= other.seconds; }

        static constexpr Time from_seconds(double s) { return Time(s); }
        static constexpr Time from_millis(double ms) { return Time(ms / 1000.0); }
        // pros::millis() returns uint32_t
        static constexpr Time from_millis(uint32_t ms) { return Time(ms / 1000.0); }

        constexpr double to_seconds() const { return seconds; }
        constexpr uint32_t to_millis_uint() const { return static_cast<uint32_t>(seconds * 1000.0); }
    };

    // ============= VOLTAGE =============
    struct Voltage
    {
        double volts;

        constexpr Voltage() : volts(0) {}
        constexpr explicit Voltage(double v) : volts(v) {}

        constexpr Voltage operator-() const { return Voltage(-volts); }
        constexpr Voltage operator*(double scalar) const { return Voltage(volts * scalar); }
        constexpr bool operator==(Voltage other) const { return volts == other.volts; }

        // pros::Motor::move takes -127..127 for -12..12 V
        constexpr double to_pros_units() const { return volts * 127.0 / 12.0; }

        static constexpr Voltage from_volts(double v) { return Voltage(v); }
    };

    // Quasistatic ramp slope
    struct VoltageRampRate
    {
        double volts_per_sec;

        constexpr VoltageRampRate() : volts_per_sec(0) {}
        constexpr explicit VoltageRampRate(double v) : volts_per_sec(v) {}

        constexpr Voltage operator*(Time t) const { return Voltage(volts_per_sec * t.seconds); }

        static constexpr VoltageRampRate from_volts_per_sec(double v) { return VoltageRampRate(v); }
    };

    // ============= VELOCITY =============
    // Chassis frame: x forward, y left
    struct BodyLinearVelocity
    {
        double inches_per_sec;

        constexpr BodyLinearVelocity() : inches_per_sec(0) {}
        constexpr explicit BodyLinearVelocity(double v) : inches_per_sec(v) {}
    };

    struct BodyAngularVelocity
    {
        double rad_per_sec;

        constexpr BodyAngularVelocity() : rad_per_sec(0) {}
        constexpr explicit BodyAngularVelocity(double v) : rad_per_sec(v) {}
    };

    // Ground speed of one wheel
    struct WheelLinearVelocity
    {
        double inches_per_sec;

        constexpr WheelLinearVelocity() : inches_per_sec(0) {}
        constexpr explicit WheelLinearVelocity(double v) : inches_per_sec(v) {}

        constexpr WheelLinearVelocity operator*(double scalar) const
        {
            return WheelLinearVelocity(inches_per_sec * scalar);
        }
    };

    // ============= DISTANCE =============
    struct Distance
    {
        double inches;

        constexpr Distance() : inches(0) {}
        constexpr explicit Distance(double i) : inches(i) {}

        constexpr Distance operator-() const { return Distance(-inches); }

        static constexpr Distance from_inches(double i) { return Distance(i); }
    };

    // Module mounting point relative to the center of rotation
    struct Translation
    {
        Distance x;
        Distance y;

        constexpr Translation() : x(), y() {}
        constexpr Translation(Distance x_in, Distance y_in) : x(x_in), y(y_in) {}
    };

    namespace literals
    {
        constexpr Voltage operator""_V(long double v) { return Voltage::from_volts(static_cast<double>(v)); }
        constexpr Voltage operator""_V(unsigned long long v) { return Voltage::from_volts(static_cast<double>(v)); }

        constexpr Distance operator""_in(long double v) { return Distance::from_inches(static_cast<double>(v)); }
        constexpr Distance operator""_in(unsigned long long v) { return Distance::from_inches(static_cast<double>(v)); }
    }

} // namespace swerveid::units
