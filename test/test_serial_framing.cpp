/**
 * @file test_serial_framing.cpp
 * @brief Unit tests for the CH341 serial tunnel framing.
 */

#include <assert.h>
#include <stdio.h>

#include <cstring>
#include <vector>

#include "robstride_driver/frame_codec.hpp"
#include "robstride_driver/serial_transport.hpp"

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

static can_frame start_frame(void) {
    return frame_codec::encode_command(frame_codec::Start{}, 0x7F, lookup_motor_model("01"));
}

static void test_encode_layout(void) {
    const can_frame frame = start_frame();
    const std::vector<uint8_t> packet = serial_framing::encode(frame);

    assert(packet.size() == serial_framing::kMaxFrameSize);
    assert(packet[0] == 'A' && packet[1] == 'T');
    const uint32_t addr = (frame.can_id & CAN_EFF_MASK) << 3 | 0x4;
    assert(packet[2] == static_cast<uint8_t>(addr >> 24));
    assert(packet[3] == static_cast<uint8_t>(addr >> 16));
    assert(packet[4] == static_cast<uint8_t>(addr >> 8));
    assert(packet[5] == static_cast<uint8_t>(addr));
    assert(packet[6] == 8);
    assert(packet[15] == '\r' && packet[16] == '\n');
}

static void test_decode_round_trip(void) {
    can_frame frame = start_frame();
    frame.data[3] = 0xAB;
    const std::vector<uint8_t> packet = serial_framing::encode(frame);

    can_frame out;
    size_t consumed = 0;
    assert(serial_framing::decode(packet.data(), packet.size(), out, consumed) == DecodeStatus::kOk);
    assert(consumed == packet.size());
    assert(out.can_id == frame.can_id);
    assert(out.can_dlc == 8);
    assert(std::memcmp(out.data, frame.data, 8) == 0);
}

static void test_partial_packet_needs_more_bytes(void) {
    const std::vector<uint8_t> packet = serial_framing::encode(start_frame());
    can_frame out;
    size_t consumed = 99;
    assert(serial_framing::decode(packet.data(), 1, out, consumed) == DecodeStatus::kTooShort);
    assert(consumed == 0);
    assert(serial_framing::decode(packet.data(), 10, out, consumed) == DecodeStatus::kTooShort);
    assert(consumed == 0);
}

static void test_garbage_prefix_is_skipped(void) {
    const std::vector<uint8_t> packet = serial_framing::encode(start_frame());
    std::vector<uint8_t> stream = {0x00, 'A', 0x13};
    stream.insert(stream.end(), packet.begin(), packet.end());

    can_frame out;
    size_t offset = 0;
    size_t consumed = 0;
    DecodeStatus status;
    while ((status = serial_framing::decode(
        stream.data() + offset, stream.size() - offset, out, consumed)) == DecodeStatus::kBadFraming)
    {
        assert(consumed == 1);
        offset += consumed;
    }
    assert(status == DecodeStatus::kOk);
    assert(offset == 3);
    assert(out.can_id == start_frame().can_id);
}

static void test_bad_trailer_is_bad_framing(void) {
    std::vector<uint8_t> packet = serial_framing::encode(start_frame());
    packet[packet.size() - 1] = 'x';
    can_frame out;
    size_t consumed = 0;
    assert(serial_framing::decode(packet.data(), packet.size(), out, consumed) ==
        DecodeStatus::kBadFraming);
    assert(consumed == 1);
}

static void test_oversized_length_is_bad_framing(void) {
    std::vector<uint8_t> packet = serial_framing::encode(start_frame());
    packet[6] = 9;
    can_frame out;
    size_t consumed = 0;
    assert(serial_framing::decode(packet.data(), packet.size(), out, consumed) ==
        DecodeStatus::kBadFraming);
}

int main(void) {
    printf("\n=== serial_framing unit tests ===\n\n");

    TEST(test_encode_layout);
    TEST(test_decode_round_trip);
    TEST(test_partial_packet_needs_more_bytes);
    TEST(test_garbage_prefix_is_skipped);
    TEST(test_bad_trailer_is_bad_framing);
    TEST(test_oversized_length_is_bad_framing);

    printf("\n=== %d / %d tests passed ===\n", tests_passed, tests_run);
    return (tests_passed == tests_run) ? 0 : 1;
}
