#pragma once

// units
#include "swerveid/units/units.hpp"

// math
#include "swerveid/math/angles.hpp"

// control
#include "swerveid/control/pid.hpp"

// time
#include "swerveid/util/clock.hpp"

// command framework
#include "swerveid/command/subsystem.hpp"
#include "swerveid/command/command.hpp"
#include "swerveid/command/scheduler.hpp"

// system identification
#include "swerveid/sysid/sysid_routine.hpp"

// telemetry
#include "swerveid/telemetry/signal_log.hpp"
#include "swerveid/telemetry/signal_logger.hpp"

// hardware abstractions
#include "swerveid/hardware/swerve_module_interface.hpp"

// swerve drive
#include "swerveid/swerve/swerve_request.hpp"
#include "swerveid/swerve/swerve_kinematics.hpp"
#include "swerveid/swerve/swerve_drivetrain.hpp"

// characterization
#include "swerveid/characterization/swerve_characterization.hpp"
