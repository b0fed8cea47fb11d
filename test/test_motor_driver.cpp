/**
 * @file test_motor_driver.cpp
 * @brief MotorDriver against a simulated bus: isolation, gating, zeroing, ingestion.
 */

#include <assert.h>
#include <stdio.h>

#include <cmath>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "mocks/simulated_bus.hpp"
#include "robstride_driver/motor_driver.hpp"

using namespace robstride_driver;
using robstride_driver::test::SimulatedBus;

static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) do { \
    tests_run++; \
    printf("  [TEST] %-55s ", #name); \
    name(); \
    tests_passed++; \
    printf("PASS\n"); \
} while (0)

struct Fixture {
    SimulatedBus * bus;
    std::unique_ptr<MotorDriver> driver;
};

static Fixture make_driver(void) {
    auto bus = std::make_unique<SimulatedBus>(std::map<uint8_t, std::string>{{1, "01"}, {2, "03"}});
    Fixture fixture;
    fixture.bus = bus.get();
    std::vector<MotorConfig> motors = {{1, "leg_left", "01"}, {2, "leg_right", "03"}};
    fixture.driver = std::make_unique<MotorDriver>(std::move(bus), motors);
    return fixture;
}

static MotorControlParams hold(float position) {
    MotorControlParams params;
    params.position = position;
    params.kp = 20.0f;
    params.kd = 1.0f;
    return params;
}

template<typename Fn>
static bool throws_configuration_error(Fn fn) {
    try {
        fn();
    } catch (const ConfigurationError &) {
        return true;
    }
    return false;
}

static void test_construction_rejects_bad_configuration(void) {
    assert(throws_configuration_error([] {
        MotorDriver driver(std::make_unique<SimulatedBus>(std::map<uint8_t, std::string>{}),
            std::vector<MotorConfig>{});
    }));
    assert(throws_configuration_error([] {
        MotorDriver driver(std::make_unique<SimulatedBus>(std::map<uint8_t, std::string>{}),
            std::vector<MotorConfig>{{1, "a", "01"}, {1, "b", "01"}});
    }));
    assert(throws_configuration_error([] {
        MotorDriver driver(std::make_unique<SimulatedBus>(std::map<uint8_t, std::string>{}),
            std::vector<MotorConfig>{{1, "a", "09"}});
    }));
}

static void test_start_runs_every_motor(void) {
    Fixture f = make_driver();
    const FeedbackMap feedback = f.driver->send_start();
    assert(feedback.size() == 2);
    assert(f.driver->session(1).state() == SessionState::kRunning);
    assert(f.driver->session(2).state() == SessionState::kRunning);
    assert(f.bus->count_sent(CommType::kEnable) == 2);
}

static void test_silent_motor_does_not_block_others(void) {
    Fixture f = make_driver();
    f.driver->send_start();
    f.bus->set_silent(2, true);

    const FeedbackMap feedback = f.driver->send_motor_controls({{1, hold(0.5f)}, {2, hold(0.5f)}});
    assert(feedback.count(1) == 1);
    assert(feedback.count(2) == 0);
    assert(f.driver->session(1).fresh());
    assert(!f.driver->session(2).fresh());
    assert(f.driver->session(2).consecutive_failures() == 1);
}

static void test_untargeted_motor_is_left_alone(void) {
    Fixture f = make_driver();
    f.driver->send_start();
    f.bus->set_position(2, 0.3f);
    f.driver->poll_feedback(MotorIds{2});
    const MotorFeedback before = f.driver->get_latest_feedback_for(2);
    f.bus->clear_sent();

    const FeedbackMap feedback = f.driver->send_motor_controls({{1, hold(0.5f)}});
    assert(feedback.count(1) == 1);
    assert(feedback.count(2) == 0);
    for (const auto & entry : f.bus->sent()) {
        assert(entry.motor_id == 1);
    }
    assert(f.driver->get_latest_feedback_for(2).position == before.position);
}

static void test_unknown_motor_rejected_before_io(void) {
    Fixture f = make_driver();
    f.bus->clear_sent();

    bool threw = false;
    try {
        f.driver->send_reset(MotorIds{1, 7});
    } catch (const UnknownMotorError & e) {
        threw = true;
        assert(e.motor_id() == 7);
    }
    assert(threw);

    threw = false;
    try {
        f.driver->get_latest_feedback_for(42);
    } catch (const UnknownMotorError &) {
        threw = true;
    }
    assert(threw);
    assert(f.bus->sent().empty());
}

static void test_invalid_batch_sends_nothing(void) {
    Fixture f = make_driver();
    f.bus->clear_sent();

    MotorControlParams too_fast = hold(0.0f);
    too_fast.velocity = 30.0f;  // model 03 allows +-20

    bool threw = false;
    try {
        f.driver->send_motor_controls({{1, hold(0.1f)}, {2, too_fast}});
    } catch (const ValidationError &) {
        threw = true;
    }
    assert(threw);
    assert(f.bus->sent().empty());
}

static void test_mit_mode_written_once(void) {
    Fixture f = make_driver();
    f.driver->send_start();
    f.driver->send_motor_controls({{1, hold(0.1f)}});
    f.driver->send_motor_controls({{1, hold(0.2f)}});
    assert(f.bus->count_sent(CommType::kParamWrite, 1) == 1);
    assert(f.bus->motor(1).run_mode == 0);
    assert(f.bus->count_sent(CommType::kMotionControl, 1) == 2);
    assert(f.bus->count_sent(CommType::kMotionControl, 2) == 0);

    const auto modes = f.driver->send_get_mode();
    assert(modes.at(1) == RunMode::kMit);
}

static void test_faulted_motor_is_polled_until_reset(void) {
    Fixture f = make_driver();
    f.driver->send_start();
    f.driver->send_motor_controls({{1, hold(0.1f)}});

    f.bus->inject_fault(1, kFaultOverTemperature);
    f.driver->send_motor_controls({{1, hold(0.1f)}});
    assert(f.driver->session(1).state() == SessionState::kFault);

    f.bus->clear_sent();
    const FeedbackMap polled = f.driver->send_motor_controls({{1, hold(0.3f)}});
    assert(f.bus->count_sent(CommType::kMotionControl, 1) == 0);
    assert(f.bus->count_sent(CommType::kParamRead, 1) == 2);
    assert(polled.count(1) == 1);

    f.driver->send_reset(MotorIds{1});
    const auto sent = f.bus->sent();
    assert(sent.back().type == CommType::kStop);
    assert(sent.back().frame.data[0] == 1);
    assert(f.driver->session(1).state() == SessionState::kDisabled);
    assert(f.bus->motor(1).faults == 0);

    f.driver->send_start(MotorIds{1});
    f.bus->clear_sent();
    f.driver->send_motor_controls({{1, hold(0.3f)}});
    assert(f.bus->count_sent(CommType::kMotionControl, 1) == 1);
}

static void test_zero_restarts_running_motor(void) {
    Fixture f = make_driver();
    f.driver->send_start();
    f.bus->set_position(1, 0.5f);
    f.bus->clear_sent();

    f.driver->send_set_zero(MotorIds{1});
    const auto sent = f.bus->sent();
    assert(sent.size() == 3);
    assert(sent[0].type == CommType::kStop);
    assert(sent[1].type == CommType::kSetZero);
    assert(sent[2].type == CommType::kEnable);

    const MotorSession & session = f.driver->session(1);
    assert(session.state() == SessionState::kRunning);
    assert(std::fabs(session.zero_offset() - 0.5f) < 0.001f);
    assert(std::fabs(session.latest_feedback().position) < 0.001f);
}

static void test_zero_only_for_stopped_motor(void) {
    Fixture f = make_driver();
    f.driver->send_set_zero(MotorIds{2});
    const auto sent = f.bus->sent();
    assert(sent.size() == 1);
    assert(sent[0].type == CommType::kSetZero);
}

static void test_poll_reads_parameters_without_commanding(void) {
    Fixture f = make_driver();
    f.driver->send_start();
    f.bus->set_position(1, 0.7f);
    f.bus->clear_sent();

    const FeedbackMap feedback = f.driver->poll_feedback();
    assert(feedback.size() == 2);
    assert(feedback.at(1).position == 0.7f);
    assert(f.bus->count_sent(CommType::kMotionControl) == 0);
    assert(f.bus->count_sent(CommType::kParamRead) == 4);
}

static void test_stray_frames_are_ingested(void) {
    Fixture f = make_driver();
    MotorFeedback stray;
    stray.motor_id = 2;
    stray.position = 1.0f;
    stray.mode = FirmwareMode::kRun;
    f.bus->push_rx(frame_codec::encode_feedback(stray, lookup_motor_model("03")));

    f.driver->send_start(MotorIds{1});
    const MotorSession & other = f.driver->session(2);
    assert(other.fresh());
    assert(std::fabs(other.latest_feedback().position - 1.0f) < 0.001f);
    assert(f.driver->session(1).state() == SessionState::kRunning);
}

static void test_write_failure_is_contained(void) {
    Fixture f = make_driver();
    f.bus->fail_next_sends(1);
    const FeedbackMap feedback = f.driver->send_start();
    assert(feedback.count(1) == 0);
    assert(feedback.count(2) == 1);
    assert(f.driver->session(1).total_failures() == 1);
}

static void test_can_timeout_uses_model_register(void) {
    Fixture f = make_driver();
    f.driver->send_can_timeout(1.0f);
    bool saw_01 = false;
    bool saw_03 = false;
    for (const auto & entry : f.bus->sent()) {
        if (entry.type != CommType::kParamWrite) {
            continue;
        }
        const uint16_t index = static_cast<uint16_t>(entry.frame.data[0] | entry.frame.data[1] << 8);
        assert(entry.frame.data[4] == 20);
        if (entry.motor_id == 1) {
            saw_01 = index == 0x200c;
        } else {
            saw_03 = index == 0x200b;
        }
    }
    assert(saw_01 && saw_03);
}

static void test_can_timeout_skips_matching_register(void) {
    Fixture f = make_driver();
    f.bus->set_can_timeout(1, 20);
    f.driver->send_can_timeout(1.0f);
    assert(f.bus->count_sent(CommType::kParamWrite, 1) == 0);
    assert(f.bus->count_sent(CommType::kParamWrite, 2) == 1);
    assert(f.bus->motor(2).can_timeout == 20);

    const std::map<uint8_t, float> timeouts = f.driver->read_can_timeouts();
    assert(timeouts.size() == 2);
    assert(timeouts.at(1) == 1.0f);
    assert(timeouts.at(2) == 1.0f);
}

static void test_identity_strings_span_several_frames(void) {
    Fixture f = make_driver();
    f.bus->set_identity(1, "RS01-LEFT-HIP", "BC0123456789ABCD", "20240115");
    f.bus->set_silent(2, true);

    const auto names = f.driver->read_names();
    assert(names.size() == 1);
    assert(names.at(1) == "RS01-LEFT-HIP");
    assert(f.driver->read_bar_codes().at(1) == "BC0123456789ABCD");
    assert(f.driver->read_build_dates().at(1) == "20240115");
    assert(f.bus->count_sent(CommType::kParamRead, 1) == 3);
    assert(f.driver->session(2).consecutive_failures() == 3);
}

static void test_read_parameter_reports_failures(void) {
    Fixture f = make_driver();
    f.bus->set_position(1, 0.7f);
    assert(f.driver->read_parameter(1, kParamMechPos).as_float() == 0.7f);

    f.bus->set_silent(1, true);
    bool timed_out = false;
    try {
        f.driver->read_parameter(1, kParamMechVel);
    } catch (const TimeoutError &) {
        timed_out = true;
    }
    assert(timed_out);

    // Motor 1 answers the velocity read with its position.
    frame_codec::ParameterReply wrong;
    wrong.motor_id = 1;
    wrong.index = kParamMechPos;
    f.bus->push_rx(frame_codec::encode_parameter_reply(wrong));
    bool undecodable = false;
    try {
        f.driver->read_parameter(1, kParamMechVel);
    } catch (const DecodeError & e) {
        undecodable = true;
        assert(e.status() == DecodeStatus::kUnexpectedCommand);
    }
    assert(undecodable);
    assert(!f.driver->session(1).fresh());
}

static void test_lost_transport_is_raised(void) {
    Fixture f = make_driver();
    f.bus->drop_link();
    bool threw = false;
    try {
        f.driver->send_start();
    } catch (const TransportLostError &) {
        threw = true;
    }
    assert(threw);
}

static void test_close_releases_transport_once(void) {
    Fixture f = make_driver();
    f.driver->close();
    f.driver->close();
    assert(!f.driver->is_open());
    assert(f.bus->close_calls() == 1);
}

int main(void) {
    printf("\n=== motor_driver unit tests ===\n\n");

    TEST(test_construction_rejects_bad_configuration);
    TEST(test_start_runs_every_motor);
    TEST(test_silent_motor_does_not_block_others);
    TEST(test_untargeted_motor_is_left_alone);
    TEST(test_unknown_motor_rejected_before_io);
    TEST(test_invalid_batch_sends_nothing);
    TEST(test_mit_mode_written_once);

    printf("\n  --- faults and zeroing ---\n");
    TEST(test_faulted_motor_is_polled_until_reset);
    TEST(test_zero_restarts_running_motor);
    TEST(test_zero_only_for_stopped_motor);

    printf("\n  --- telemetry ---\n");
    TEST(test_poll_reads_parameters_without_commanding);
    TEST(test_stray_frames_are_ingested);
    TEST(test_write_failure_is_contained);
    TEST(test_can_timeout_uses_model_register);
    TEST(test_can_timeout_skips_matching_register);

    printf("\n  --- parameter queries ---\n");
    TEST(test_identity_strings_span_several_frames);
    TEST(test_read_parameter_reports_failures);

    printf("\n  --- transport ---\n");
    TEST(test_lost_transport_is_raised);
    TEST(test_close_releases_transport_once);

    printf("\n=== %d / %d tests passed ===\n", tests_passed, tests_run);
    return (tests_passed == tests_run) ? 0 : 1;
}
