/**
 * @file test_frame_codec.cpp
 * @brief Unit tests for frame_codec: frame layouts, quantization and decoding.
 */

#include <assert.h>
#include <stdio.h>

#include <cmath>
#include <cstring>
#include <limits>

#include "robstride_driver/errors.hpp"
#include "robstride_driver/frame_codec.hpp"
#include "robstride_driver/motor_model.hpp"

using namespace robstride_driver;

static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) do { \
    tests_run++; \
    printf("  [TEST] %-55s ", #name); \
    name(); \
    tests_passed++; \
    printf("PASS\n"); \
} while (0)

static bool near(float a, float b, float tolerance) {
    return std::fabs(a - b) <= tolerance;
}

static frame_codec::ModelTable models_01() {
    frame_codec::ModelTable models;
    models.emplace(1, lookup_motor_model("01"));
    models.emplace(2, lookup_motor_model("01"));
    return models;
}

static void test_model_lookup_accepts_prefixed_names(void) {
    assert(lookup_motor_model("robstride04").name == "04");
    assert(lookup_motor_model("RobStride03").torque.max == 60.0f);
    assert(lookup_motor_model("01").zero_on_init);
    assert(!lookup_motor_model("02").zero_on_init);
    assert(lookup_motor_model("01").can_timeout_index == 0x200c);
    assert(lookup_motor_model("03").can_timeout_index == 0x200b);
}

static void test_model_lookup_rejects_unknown(void) {
    bool threw = false;
    try {
        lookup_motor_model("05");
    } catch (const ConfigurationError &) {
        threw = true;
    }
    assert(threw);
    assert(!is_motor_model("leg_left"));
}

static void test_start_frame_layout(void) {
    const can_frame frame = frame_codec::encode_command(
        frame_codec::Start{}, 0x7F, lookup_motor_model("01"), kCanIdDebugUi);
    assert(frame.can_id & CAN_EFF_FLAG);
    assert((frame.can_id & CAN_EFF_MASK) == (0x03u << 24 | 0xFDu << 8 | 0x7Fu));
    assert(frame.can_dlc == 8);
    for (int i = 0; i < 8; ++i) {
        assert(frame.data[i] == 0);
    }
}

static void test_reset_sets_clear_fault_byte(void) {
    const MotorModel & model = lookup_motor_model("01");
    const can_frame plain = frame_codec::encode_command(frame_codec::Reset{false}, 1, model);
    const can_frame clear = frame_codec::encode_command(frame_codec::Reset{true}, 1, model);
    assert(frame_codec::comm_type_of(plain.can_id) == static_cast<uint8_t>(CommType::kStop));
    assert(plain.data[0] == 0);
    assert(clear.data[0] == 1);
}

static void test_set_zero_frame_layout(void) {
    const can_frame frame =
        frame_codec::encode_command(frame_codec::SetZero{}, 3, lookup_motor_model("02"));
    assert(frame_codec::comm_type_of(frame.can_id) == static_cast<uint8_t>(CommType::kSetZero));
    assert(frame_codec::target_motor_id(frame.can_id) == 3);
    assert(frame.data[0] == 1);
}

static void test_get_mode_reads_run_mode_parameter(void) {
    const can_frame frame =
        frame_codec::encode_command(frame_codec::GetMode{}, 4, lookup_motor_model("01"));
    assert(frame_codec::comm_type_of(frame.can_id) == static_cast<uint8_t>(CommType::kParamRead));
    assert(frame.data[0] == 0x05);
    assert(frame.data[1] == 0x70);
}

static void test_parameter_write_is_little_endian(void) {
    const frame_codec::WriteParameter write{0x200c, 0x01020304u, frame_codec::kParamTypeU32};
    const can_frame frame = frame_codec::encode_command(write, 1, lookup_motor_model("01"));
    assert(frame_codec::comm_type_of(frame.can_id) == static_cast<uint8_t>(CommType::kParamWrite));
    assert(frame.data[0] == 0x0c);
    assert(frame.data[1] == 0x20);
    assert(frame.data[2] == 0x04);
    assert(frame.data[4] == 0x04);
    assert(frame.data[5] == 0x03);
    assert(frame.data[6] == 0x02);
    assert(frame.data[7] == 0x01);
}

static void test_quantize_range_edges(void) {
    const Range range{-12.5f, 12.5f};
    assert(frame_codec::quantize(-12.5f, range) == 0);
    assert(frame_codec::quantize(12.5f, range) == 65535);
    assert(frame_codec::quantize(0.0f, range) == 32768);
    assert(near(frame_codec::dequantize(0, range), -12.5f, 1e-6f));
    assert(near(frame_codec::dequantize(65535, range), 12.5f, 1e-4f));
}

static void test_motion_control_carries_torque_in_id(void) {
    const MotorModel & model = lookup_motor_model("01");
    MotorControlParams params;
    params.torque = 12.0f;
    const can_frame frame =
        frame_codec::encode_command(frame_codec::SetControls{params}, 2, model);
    assert(frame_codec::comm_type_of(frame.can_id) ==
        static_cast<uint8_t>(CommType::kMotionControl));
    assert(((frame.can_id & 0xFFFF00u) >> 8) == 0xFFFFu);
    assert(frame_codec::target_motor_id(frame.can_id) == 2);
}

static void test_controls_round_trip_within_one_step(void) {
    const char * names[] = {"01", "03", "04"};
    for (const char * name : names) {
        const MotorModel & model = lookup_motor_model(name);
        MotorControlParams params;
        params.position = 1.234f;
        params.velocity = -3.5f;
        params.kp = 42.0f;
        params.kd = 1.5f;
        params.torque = -7.25f;

        const can_frame frame =
            frame_codec::encode_command(frame_codec::SetControls{params}, 1, model);
        MotorControlParams decoded;
        assert(frame_codec::decode_control_params(frame, model, decoded) == DecodeStatus::kOk);

        assert(near(decoded.position, params.position, frame_codec::quantization_step(model.position)));
        assert(near(decoded.velocity, params.velocity, frame_codec::quantization_step(model.velocity)));
        assert(near(decoded.kp, params.kp, frame_codec::quantization_step(model.kp)));
        assert(near(decoded.kd, params.kd, frame_codec::quantization_step(model.kd)));
        assert(near(decoded.torque, params.torque, frame_codec::quantization_step(model.torque)));
    }
}

static void test_set_torque_zeroes_other_fields(void) {
    const MotorModel & model = lookup_motor_model("03");
    const can_frame frame = frame_codec::encode_command(frame_codec::SetTorque{20.0f}, 5, model);
    MotorControlParams decoded;
    assert(frame_codec::decode_control_params(frame, model, decoded) == DecodeStatus::kOk);
    assert(near(decoded.torque, 20.0f, frame_codec::quantization_step(model.torque)));
    assert(near(decoded.kp, 0.0f, frame_codec::quantization_step(model.kp)));
    assert(near(decoded.kd, 0.0f, frame_codec::quantization_step(model.kd)));
}

static void test_out_of_range_is_rejected(void) {
    const MotorModel & model = lookup_motor_model("01");
    MotorControlParams too_far;
    too_far.position = 13.0f;
    MotorControlParams negative_gain;
    negative_gain.kp = -1.0f;
    MotorControlParams not_a_number;
    not_a_number.kd = std::numeric_limits<float>::quiet_NaN();

    const MotorControlParams bad[] = {too_far, negative_gain, not_a_number};
    for (const auto & params : bad) {
        bool threw = false;
        try {
            frame_codec::encode_command(frame_codec::SetControls{params}, 1, model);
        } catch (const ValidationError &) {
            threw = true;
        }
        assert(threw);
    }

    bool threw = false;
    try {
        frame_codec::encode_command(frame_codec::SetTorque{12.5f}, 1, model);
    } catch (const ValidationError &) {
        threw = true;
    }
    assert(threw);
}

static void test_limits_are_accepted(void) {
    const MotorModel & model = lookup_motor_model("04");
    MotorControlParams params;
    params.position = model.position.max;
    params.velocity = model.velocity.min;
    params.kp = model.kp.max;
    params.kd = model.kd.max;
    params.torque = model.torque.min;
    frame_codec::validate(params, model);
}

static void test_feedback_decodes_mode_faults_and_temperature(void) {
    const frame_codec::ModelTable models = models_01();
    MotorFeedback feedback;
    feedback.motor_id = 2;
    feedback.position = -0.5f;
    feedback.velocity = 2.0f;
    feedback.torque = 1.0f;
    feedback.temperature = 36.4f;
    feedback.mode = FirmwareMode::kRun;
    feedback.faults = kFaultOverTemperature | kFaultUnderVoltage;

    const can_frame frame = frame_codec::encode_feedback(feedback, models.at(2));
    assert(frame_codec::reply_motor_id(frame.can_id) == 2);
    assert(frame_codec::target_motor_id(frame.can_id) == kCanIdDebugUi);

    MotorFeedback decoded;
    assert(frame_codec::decode_feedback(frame, models, decoded) == DecodeStatus::kOk);
    assert(decoded.motor_id == 2);
    assert(decoded.mode == FirmwareMode::kRun);
    assert(decoded.faults == (kFaultOverTemperature | kFaultUnderVoltage));
    assert(near(decoded.position, -0.5f, frame_codec::quantization_step(models.at(2).position)));
    assert(near(decoded.temperature, 36.4f, 0.05f));
}

static void test_feedback_decode_errors(void) {
    const frame_codec::ModelTable models = models_01();
    MotorFeedback feedback;
    feedback.motor_id = 1;
    const can_frame good = frame_codec::encode_feedback(feedback, models.at(1));
    MotorFeedback out;

    can_frame short_frame = good;
    short_frame.can_dlc = 4;
    assert(frame_codec::decode_feedback(short_frame, models, out) == DecodeStatus::kTooShort);

    can_frame unknown = good;
    unknown.can_id = (unknown.can_id & ~(0x1Fu << 24)) | (0x1Fu << 24);
    assert(frame_codec::decode_feedback(unknown, models, out) == DecodeStatus::kUnknownCommand);

    can_frame wrong_kind = good;
    wrong_kind.can_id = (wrong_kind.can_id & ~(0x1Fu << 24)) | (0x03u << 24);
    assert(frame_codec::decode_feedback(wrong_kind, models, out) ==
        DecodeStatus::kUnexpectedCommand);

    can_frame standard = good;
    standard.can_id = 0x123;
    assert(frame_codec::decode_feedback(standard, models, out) ==
        DecodeStatus::kUnexpectedCommand);

    MotorFeedback stranger;
    stranger.motor_id = 9;
    const can_frame from_stranger = frame_codec::encode_feedback(stranger, models.at(1));
    assert(frame_codec::decode_feedback(from_stranger, models, out) == DecodeStatus::kUnknownMotor);
}

static void test_parameter_reply_values(void) {
    const frame_codec::ModelTable models = models_01();
    frame_codec::ParameterReply reply;
    reply.motor_id = 1;
    reply.index = kParamMechPos;
    reply.mode = FirmwareMode::kRun;
    const float position = 0.75f;
    std::memcpy(reply.value.data(), &position, sizeof(position));

    const can_frame frame = frame_codec::encode_parameter_reply(reply);
    frame_codec::ParameterReply decoded;
    assert(frame_codec::decode_parameter_reply(frame, models, decoded) == DecodeStatus::kOk);
    assert(decoded.motor_id == 1);
    assert(decoded.index == kParamMechPos);
    assert(decoded.mode == FirmwareMode::kRun);
    assert(decoded.as_float() == 0.75f);

    MotorFeedback not_feedback;
    assert(frame_codec::decode_feedback(frame, models, not_feedback) ==
        DecodeStatus::kUnexpectedCommand);
}

static void test_decode_error_carries_status(void) {
    try {
        throw DecodeError(DecodeStatus::kUnknownMotor, "motor 9");
    } catch (const Error & e) {
        const DecodeError * decode = dynamic_cast<const DecodeError *>(&e);
        assert(decode != nullptr);
        assert(decode->status() == DecodeStatus::kUnknownMotor);
    }
}

int main(void) {
    printf("\n=== frame_codec unit tests ===\n\n");

    TEST(test_model_lookup_accepts_prefixed_names);
    TEST(test_model_lookup_rejects_unknown);

    printf("\n  --- encoding ---\n");
    TEST(test_start_frame_layout);
    TEST(test_reset_sets_clear_fault_byte);
    TEST(test_set_zero_frame_layout);
    TEST(test_get_mode_reads_run_mode_parameter);
    TEST(test_parameter_write_is_little_endian);
    TEST(test_quantize_range_edges);
    TEST(test_motion_control_carries_torque_in_id);
    TEST(test_controls_round_trip_within_one_step);
    TEST(test_set_torque_zeroes_other_fields);
    TEST(test_out_of_range_is_rejected);
    TEST(test_limits_are_accepted);

    printf("\n  --- decoding ---\n");
    TEST(test_feedback_decodes_mode_faults_and_temperature);
    TEST(test_feedback_decode_errors);
    TEST(test_parameter_reply_values);
    TEST(test_decode_error_carries_status);

    printf("\n=== %d / %d tests passed ===\n", tests_passed, tests_run);
    return (tests_passed == tests_run) ? 0 : 1;
}
