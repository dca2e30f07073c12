#include "api.h"
#include "swerveid/swerveid.hpp"
#include "swerveid/hardware/pros_swerve_module.hpp"
#include "swerveid/util/pros_clock.hpp"
#include <mutex>
using namespace swerveid;
using namespace swerveid::units::literals;

pros::Controller controller(pros::E_CONTROLLER_MASTER);

util::ProsClock brain_clock;

telemetry::SignalLogger sysid_log({.directory = "/usd", .name = "swerve_sysid"}, &brain_clock);

hardware::ProsSwerveModule front_left({.drive_port = 1, .steer_port = 2, .encoder_port = 3});
hardware::ProsSwerveModule front_right({.drive_port = -4, .steer_port = 5, .encoder_port = 6});
hardware::ProsSwerveModule back_left({.drive_port = 7, .steer_port = 8, .encoder_port = 9});
hardware::ProsSwerveModule back_right({.drive_port = -10, .steer_port = 11, .encoder_port = 12});

swerve::DrivetrainConfig drivetrain_config{
    .module_positions = {
        {6.5_in, 6.5_in},   // front left
        {6.5_in, -6.5_in},  // front right
        {-6.5_in, 6.5_in},  // back left
        {-6.5_in, -6.5_in}, // back right
    },
    .max_speed = units::WheelLinearVelocity(72.0),
    .max_voltage = 12_V,
};

swerve::SwerveDrivetrain drivetrain(drivetrain_config,
                                    {&front_left, &front_right, &back_left, &back_right},
                                    &sysid_log,
                                    &brain_clock);

command::CommandScheduler scheduler;

constexpr uint32_t LOOP_PERIOD_MS = 10;

// Written by the control loop, read by the screen task
struct SysIdStatus
{
    characterization::RoutineType routine = characterization::RoutineType::TRANSLATION;
    std::string command_name = "none";
    const char *request = "Idle";
    double request_value = 0.0;
};

SysIdStatus status;
pros::Mutex status_mutex;

namespace
{
    characterization::RoutineType next_routine(characterization::RoutineType type)
    {
        switch (type)
        {
        case characterization::RoutineType::TRANSLATION:
            return characterization::RoutineType::STEER;
        case characterization::RoutineType::STEER:
            return characterization::RoutineType::ROTATION;
        default:
            return characterization::RoutineType::TRANSLATION;
        }
    }

    void publish_status()
    {
        command::Command *current = scheduler.requiring(&drivetrain);

        std::lock_guard<pros::Mutex> lock(status_mutex);
        status.routine = drivetrain.get_characterization().get_active_routine_type();
        status.command_name = current ? current->get_name() : "none";
        status.request = swerve::request_name(drivetrain.get_last_request());
        status.request_value = swerve::request_magnitude(drivetrain.get_last_request());
    }

    void tick()
    {
        scheduler.run();
        publish_status();
        pros::delay(LOOP_PERIOD_MS);
    }

    // Blocks until the command ends. Used for the autonomous test sequence.
    void run_to_completion(std::unique_ptr<command::Command> test)
    {
        command::CommandId handle = scheduler.schedule(std::move(test));
        while (scheduler.is_scheduled(handle))
        {
            tick();
        }
    }

    // Start on press, cancel on release
    struct HeldBinding
    {
        pros::controller_digital_e_t button;
        std::function<std::unique_ptr<command::Command>()> factory;
        command::CommandId running = command::NO_COMMAND;
    };

    void update_binding(HeldBinding &binding)
    {
        // A test that timed out or was interrupted is gone from the scheduler
        if (binding.running != command::NO_COMMAND && !scheduler.is_scheduled(binding.running))
        {
            binding.running = command::NO_COMMAND;
        }

        if (controller.get_digital_new_press(binding.button))
        {
            characterization::RoutineType type = drivetrain.get_characterization().get_active_routine_type();
            sysid_log.mark(characterization::routine_type_to_string(type));
            binding.running = scheduler.schedule(binding.factory());
        }
        else if (binding.running != command::NO_COMMAND && !controller.get_digital(binding.button))
        {
            scheduler.cancel(binding.running);
            binding.running = command::NO_COMMAND;
        }
    }
}

void initialize()
{
    pros::lcd::initialize();

    scheduler.register_subsystem(&drivetrain);
    scheduler.set_default_command(&drivetrain, drivetrain.apply_request([]()
                                                                        { return swerve::SwerveRequest(swerve::Idle{}); }));

    if (!sysid_log.is_open())
    {
        pros::lcd::print(0, "ERROR: No SD card!");
    }

    pros::Task screen_task([&]()
                           {
        while (1) {
            SysIdStatus local_status;
            {
                std::lock_guard<pros::Mutex> lock(status_mutex);
                local_status = status;
            }

            // Line 1: Routine selection
            pros::lcd::print(1, "Routine: %s", characterization::routine_type_to_string(local_status.routine));

            // Line 2: What the drivetrain is doing
            pros::lcd::print(2, "Cmd: %s", local_status.command_name.c_str());

            // Line 3: Last request
            pros::lcd::print(3, "Req: %s %.2f", local_status.request, local_status.request_value);

            pros::delay(100);
        } });
}

/**
 * Runs while the robot is in the disabled state of Field Management System or
 * the VEX Competition Switch, following either autonomous or opcontrol. When
 * the robot is enabled, this task will exit.
 */
void disabled()
{
    scheduler.cancel_all();
}

void competition_initialize() {}

/**
 * Runs all four tests for the active routine back to back.
 */
void autonomous()
{
    characterization::SwerveCharacterization &characterization = drivetrain.get_characterization();
    sysid_log.mark(characterization::routine_type_to_string(characterization.get_active_routine_type()));

    run_to_completion(characterization.quasistatic(sysid::Direction::FORWARD));
    pros::delay(1000);
    run_to_completion(characterization.quasistatic(sysid::Direction::REVERSE));
    pros::delay(1000);
    run_to_completion(characterization.dynamic(sysid::Direction::FORWARD));
    pros::delay(1000);
    run_to_completion(characterization.dynamic(sysid::Direction::REVERSE));

    controller.print(0, 0, "sysid done");
}

/**
 * Hold A/B for quasistatic forward/reverse, X/Y for dynamic forward/reverse.
 * Right arrow cycles the active routine.
 */
void opcontrol()
{
    characterization::SwerveCharacterization &characterization = drivetrain.get_characterization();

    HeldBinding bindings[] = {
        {pros::E_CONTROLLER_DIGITAL_A, [&]()
         { return characterization.quasistatic(sysid::Direction::FORWARD); }},
        {pros::E_CONTROLLER_DIGITAL_B, [&]()
         { return characterization.quasistatic(sysid::Direction::REVERSE); }},
        {pros::E_CONTROLLER_DIGITAL_X, [&]()
         { return characterization.dynamic(sysid::Direction::FORWARD); }},
        {pros::E_CONTROLLER_DIGITAL_Y, [&]()
         { return characterization.dynamic(sysid::Direction::REVERSE); }},
    };

    while (1)
    {
        bool testing = false;
        for (const HeldBinding &binding : bindings)
        {
            testing = testing || binding.running != command::NO_COMMAND;
        }

        if (controller.get_digital_new_press(pros::E_CONTROLLER_DIGITAL_RIGHT) && !testing)
        {
            characterization.set_active_routine(next_routine(characterization.get_active_routine_type()));
            controller.print(0, 0, "%-12s", characterization::routine_type_to_string(characterization.get_active_routine_type()));
        }

        for (HeldBinding &binding : bindings)
        {
            update_binding(binding);
        }

        tick();
    }
}
