#include "swerveid/characterization/swerve_characterization.hpp"
#include "swerveid/command/scheduler.hpp"
#include "swerveid/telemetry/signal_log.hpp"
#include "test_helpers.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>
#include <variant>
#include <vector>

using namespace swerveid;
using characterization::RoutineType;
using characterization::SwerveCharacterization;
using swerveid::testing::ManualClock;
using swerveid::testing::TestSubsystem;

class SwerveCharacterizationTest : public ::testing::Test
{
protected:
    ManualClock clock;
    TestSubsystem subsystem{"drivetrain"};
    telemetry::MemorySignalLog signal_log;
    std::vector<swerve::SwerveRequest> requests;
    command::CommandScheduler scheduler;

    SwerveCharacterization characterization{
        [this](const swerve::SwerveRequest &request)
        { requests.push_back(request); },
        &subsystem, &signal_log, &clock};

    int run(std::unique_ptr<command::Command> test)
    {
        command::CommandId handle = scheduler.schedule(std::move(test));
        return swerveid::testing::run_until_done(scheduler, clock, handle);
    }
};

TEST_F(SwerveCharacterizationTest, DefaultActiveRoutineIsTranslation)
{
    EXPECT_EQ(characterization.get_active_routine_type(), RoutineType::TRANSLATION);
}

TEST_F(SwerveCharacterizationTest, SetActiveRoutineRoundTripsEveryKind)
{
    for (RoutineType type : {RoutineType::TRANSLATION, RoutineType::STEER, RoutineType::ROTATION})
    {
        characterization.set_active_routine(type);
        EXPECT_EQ(characterization.get_active_routine_type(), type)
            << characterization::routine_type_to_string(type);
    }
}

TEST_F(SwerveCharacterizationTest, SetActiveRoutineIsIdempotent)
{
    characterization.set_active_routine(RoutineType::STEER);
    characterization.set_active_routine(RoutineType::STEER);
    EXPECT_EQ(characterization.get_active_routine_type(), RoutineType::STEER);
}

TEST_F(SwerveCharacterizationTest, OnlyMostRecentSelectionIsReported)
{
    characterization.set_active_routine(RoutineType::STEER);
    EXPECT_EQ(characterization.get_active_routine_type(), RoutineType::STEER);

    characterization.set_active_routine(RoutineType::ROTATION);
    EXPECT_EQ(characterization.get_active_routine_type(), RoutineType::ROTATION);

    characterization.set_active_routine(RoutineType::TRANSLATION);
    EXPECT_EQ(characterization.get_active_routine_type(), RoutineType::TRANSLATION);
}

TEST_F(SwerveCharacterizationTest, ConstructionEmitsNothing)
{
    EXPECT_TRUE(requests.empty());
    EXPECT_TRUE(signal_log.entries().empty());
}

TEST_F(SwerveCharacterizationTest, NullCollaboratorsAreRejected)
{
    auto apply = [](const swerve::SwerveRequest &) {};

    EXPECT_THROW(SwerveCharacterization(nullptr, &subsystem, &signal_log, &clock), std::invalid_argument);
    EXPECT_THROW(SwerveCharacterization(apply, nullptr, &signal_log, &clock), std::invalid_argument);
    EXPECT_THROW(SwerveCharacterization(apply, &subsystem, nullptr, &clock), std::invalid_argument);
    EXPECT_THROW(SwerveCharacterization(apply, &subsystem, &signal_log, nullptr), std::invalid_argument);
}

TEST_F(SwerveCharacterizationTest, FactoriesReturnFreshCommands)
{
    for (auto direction : {sysid::Direction::FORWARD, sysid::Direction::REVERSE})
    {
        auto quasistatic_a = characterization.quasistatic(direction);
        auto quasistatic_b = characterization.quasistatic(direction);
        auto dynamic_a = characterization.dynamic(direction);
        auto dynamic_b = characterization.dynamic(direction);

        ASSERT_NE(quasistatic_a, nullptr);
        ASSERT_NE(dynamic_a, nullptr);
        EXPECT_NE(quasistatic_a.get(), quasistatic_b.get());
        EXPECT_NE(dynamic_a.get(), dynamic_b.get());
    }
}

TEST_F(SwerveCharacterizationTest, CommandsRequireTheSubsystem)
{
    for (RoutineType type : {RoutineType::TRANSLATION, RoutineType::STEER, RoutineType::ROTATION})
    {
        characterization.set_active_routine(type);

        auto quasistatic = characterization.quasistatic(sysid::Direction::FORWARD);
        auto dynamic = characterization.dynamic(sysid::Direction::REVERSE);

        EXPECT_TRUE(quasistatic->has_requirement(&subsystem));
        EXPECT_TRUE(dynamic->has_requirement(&subsystem));
        EXPECT_EQ(quasistatic->get_requirements().size(), 1u);
    }
}

TEST_F(SwerveCharacterizationTest, RoutinesAreDistinct)
{
    EXPECT_NE(&characterization.get_translation_routine(), &characterization.get_steer_routine());
    EXPECT_NE(&characterization.get_translation_routine(), &characterization.get_rotation_routine());
    EXPECT_NE(&characterization.get_steer_routine(), &characterization.get_rotation_routine());
}

TEST_F(SwerveCharacterizationTest, RoutineParametersMatchTable)
{
    const auto &translation = characterization.get_translation_routine();
    EXPECT_DOUBLE_EQ(translation.get_ramp_rate().volts_per_sec, 1.0);
    EXPECT_DOUBLE_EQ(translation.get_step_voltage().volts, 4.0);
    EXPECT_DOUBLE_EQ(translation.get_timeout().seconds, 10.0);

    const auto &steer = characterization.get_steer_routine();
    EXPECT_DOUBLE_EQ(steer.get_ramp_rate().volts_per_sec, 1.0);
    EXPECT_DOUBLE_EQ(steer.get_step_voltage().volts, 7.0);
    EXPECT_DOUBLE_EQ(steer.get_timeout().seconds, 10.0);

    const auto &rotation = characterization.get_rotation_routine();
    EXPECT_DOUBLE_EQ(rotation.get_ramp_rate().volts_per_sec, M_PI / 6.0);
    EXPECT_DOUBLE_EQ(rotation.get_step_voltage().volts, M_PI);
    EXPECT_DOUBLE_EQ(rotation.get_timeout().seconds, 10.0);
}

TEST_F(SwerveCharacterizationTest, TranslationQuasistaticRampsUntilTimeout)
{
    run(characterization.quasistatic(sysid::Direction::FORWARD));

    ASSERT_GT(requests.size(), 2u);

    double previous = 0.0;
    for (std::size_t i = 0; i + 1 < requests.size(); ++i)
    {
        const auto *translation = std::get_if<swerve::SysIdSwerveTranslation>(&requests[i]);
        ASSERT_NE(translation, nullptr) << "request " << i;
        EXPECT_STREQ(swerve::request_name(requests[i]), "translation characterization");
        EXPECT_GE(translation->volts.volts, previous);
        previous = translation->volts.volts;
    }

    // 1 V/s for 10 s
    EXPECT_NEAR(previous, 10.0, 0.05);

    // Safe state once the timeout ends the test
    const auto *last = std::get_if<swerve::SysIdSwerveTranslation>(&requests.back());
    ASSERT_NE(last, nullptr);
    EXPECT_DOUBLE_EQ(last->volts.volts, 0.0);
}

TEST_F(SwerveCharacterizationTest, ReverseQuasistaticDrivesNegative)
{
    auto test = characterization.quasistatic(sysid::Direction::REVERSE);
    scheduler.schedule(std::move(test));

    for (int i = 0; i < 10; ++i)
    {
        clock.advance(swerveid::testing::TICK);
        scheduler.run();
    }

    const auto *translation = std::get_if<swerve::SysIdSwerveTranslation>(&requests.back());
    ASSERT_NE(translation, nullptr);
    EXPECT_NEAR(translation->volts.volts, -0.2, 1e-9);
}

TEST_F(SwerveCharacterizationTest, SteerDynamicStepsToSevenVolts)
{
    characterization.set_active_routine(RoutineType::STEER);
    scheduler.schedule(characterization.dynamic(sysid::Direction::REVERSE));

    clock.advance(swerveid::testing::TICK);
    scheduler.run();

    ASSERT_EQ(requests.size(), 1u);
    const auto *steer = std::get_if<swerve::SysIdSwerveSteerGains>(&requests.front());
    ASSERT_NE(steer, nullptr);
    EXPECT_DOUBLE_EQ(steer->volts.volts, -7.0);
}

TEST_F(SwerveCharacterizationTest, RotationDynamicMirrorsRateToLog)
{
    characterization.set_active_routine(RoutineType::ROTATION);
    scheduler.schedule(characterization.dynamic(sysid::Direction::FORWARD));

    clock.advance(swerveid::testing::TICK);
    scheduler.run();

    ASSERT_EQ(requests.size(), 1u);
    const auto *rotation = std::get_if<swerve::SysIdSwerveRotation>(&requests.front());
    ASSERT_NE(rotation, nullptr);
    EXPECT_DOUBLE_EQ(rotation->rotational_rate.rad_per_sec, M_PI);

    const telemetry::SignalEntry *rate = signal_log.latest(characterization::ROTATIONAL_RATE_LOG_KEY);
    ASSERT_NE(rate, nullptr);
    EXPECT_EQ(rate->type, telemetry::SignalType::DOUBLE);
    EXPECT_DOUBLE_EQ(rate->double_value, M_PI);
}

TEST_F(SwerveCharacterizationTest, RotationQuasistaticRampsAtPiOverSix)
{
    characterization.set_active_routine(RoutineType::ROTATION);
    scheduler.schedule(characterization.quasistatic(sysid::Direction::FORWARD));

    for (int i = 0; i < 50; ++i)
    {
        clock.advance(swerveid::testing::TICK);
        scheduler.run();
    }

    const auto *rotation = std::get_if<swerve::SysIdSwerveRotation>(&requests.back());
    ASSERT_NE(rotation, nullptr);
    EXPECT_NEAR(rotation->rotational_rate.rad_per_sec, M_PI / 6.0, 1e-9);
}

TEST_F(SwerveCharacterizationTest, TranslationAndSteerDoNotLogRotationalRate)
{
    run(characterization.dynamic(sysid::Direction::FORWARD));
    characterization.set_active_routine(RoutineType::STEER);
    run(characterization.dynamic(sysid::Direction::FORWARD));

    EXPECT_EQ(signal_log.latest(characterization::ROTATIONAL_RATE_LOG_KEY), nullptr);
}

TEST_F(SwerveCharacterizationTest, StateTransitionsAreLoggedUnderRoutineKey)
{
    command::CommandId handle = scheduler.schedule(characterization.quasistatic(sysid::Direction::FORWARD));

    const telemetry::SignalEntry *state = signal_log.latest("SysIdTranslation_State");
    ASSERT_NE(state, nullptr);
    EXPECT_EQ(state->string_value, "quasistatic-forward");

    scheduler.cancel(handle);

    state = signal_log.latest("SysIdTranslation_State");
    ASSERT_NE(state, nullptr);
    EXPECT_EQ(state->string_value, "none");
}

TEST_F(SwerveCharacterizationTest, EachRoutineUsesItsOwnStateKey)
{
    characterization.set_active_routine(RoutineType::STEER);
    scheduler.schedule(characterization.dynamic(sysid::Direction::FORWARD));
    characterization.set_active_routine(RoutineType::ROTATION);
    scheduler.schedule(characterization.dynamic(sysid::Direction::REVERSE));

    const telemetry::SignalEntry *steer = signal_log.latest("SysIdSteer_State");
    const telemetry::SignalEntry *rotation = signal_log.latest("SysIdRotation_State");
    ASSERT_NE(steer, nullptr);
    ASSERT_NE(rotation, nullptr);

    // Scheduling the rotation test interrupted the steer test
    EXPECT_EQ(steer->string_value, "none");
    EXPECT_EQ(rotation->string_value, "dynamic-reverse");
    EXPECT_EQ(signal_log.latest("SysIdTranslation_State"), nullptr);
}

TEST_F(SwerveCharacterizationTest, CancellationLeavesZeroOutput)
{
    characterization.set_active_routine(RoutineType::STEER);
    command::CommandId handle = scheduler.schedule(characterization.dynamic(sysid::Direction::FORWARD));

    for (int i = 0; i < 5; ++i)
    {
        clock.advance(swerveid::testing::TICK);
        scheduler.run();
    }
    scheduler.cancel(handle);

    ASSERT_FALSE(requests.empty());
    const auto *steer = std::get_if<swerve::SysIdSwerveSteerGains>(&requests.back());
    ASSERT_NE(steer, nullptr);
    EXPECT_DOUBLE_EQ(steer->volts.volts, 0.0);
    EXPECT_FALSE(scheduler.is_scheduled(handle));
}

TEST_F(SwerveCharacterizationTest, ApplyControlFailurePropagatesWithoutRetry)
{
    int apply_calls = 0;
    SwerveCharacterization failing{
        [&apply_calls](const swerve::SwerveRequest &request)
        {
            apply_calls++;
            if (swerve::request_magnitude(request) != 0.0)
            {
                throw std::runtime_error("drive fault");
            }
        },
        &subsystem, &signal_log, &clock};

    command::CommandId handle = scheduler.schedule(failing.dynamic(sysid::Direction::FORWARD));
    clock.advance(swerveid::testing::TICK);

    EXPECT_THROW(scheduler.run(), std::runtime_error);
    EXPECT_EQ(apply_calls, 1);

    // Not ended by the failure, so the state is still the running test
    EXPECT_TRUE(scheduler.is_scheduled(handle));
    const telemetry::SignalEntry *state = signal_log.latest("SysIdTranslation_State");
    ASSERT_NE(state, nullptr);
    EXPECT_EQ(state->string_value, "dynamic-forward");

    // Cancelling sends the zero request, which goes through
    scheduler.cancel(handle);
    EXPECT_EQ(apply_calls, 2);
    EXPECT_FALSE(scheduler.is_scheduled(handle));
}

TEST_F(SwerveCharacterizationTest, SwitchingRoutineOnlyAffectsLaterCommands)
{
    auto translation_test = characterization.quasistatic(sysid::Direction::FORWARD);

    characterization.set_active_routine(RoutineType::STEER);
    auto steer_test = characterization.quasistatic(sysid::Direction::FORWARD);

    EXPECT_NE(translation_test.get(), steer_test.get());

    scheduler.schedule(std::move(translation_test));
    clock.advance(swerveid::testing::TICK);
    scheduler.run();
    ASSERT_FALSE(requests.empty());
    EXPECT_TRUE(std::holds_alternative<swerve::SysIdSwerveTranslation>(requests.back()));

    scheduler.schedule(std::move(steer_test));
    clock.advance(swerveid::testing::TICK);
    scheduler.run();
    EXPECT_TRUE(std::holds_alternative<swerve::SysIdSwerveSteerGains>(requests.back()));
}

TEST_F(SwerveCharacterizationTest, RoutineConfigTableCoversEveryKind)
{
    for (RoutineType type : {RoutineType::TRANSLATION, RoutineType::STEER, RoutineType::ROTATION})
    {
        EXPECT_EQ(characterization::routine_config(type).type, type);
    }
    EXPECT_STREQ(characterization::routine_config(RoutineType::ROTATION).state_log_key, "SysIdRotation_State");
}
