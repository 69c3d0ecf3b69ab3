// tests/test_DeviceSnapshotDiffer.cpp
#include <gtest/gtest.h>
#include "DeviceSnapshotDiffer.hpp"
#include "FakeDeviceEnumerator.hpp"

namespace usb_handshake {
namespace testing {

class DeviceSnapshotDifferTest : public ::testing::Test {
protected:
    FakeDeviceEnumerator enumerator;
};

TEST_F(DeviceSnapshotDifferTest, NewDeviceIsReportedAndRemembered) {
    enumerator.devices = {makeDescriptor(0x1234, 0x5678, 1, 2)};

    PollResult result = pollOnce(enumerator, {});

    ASSERT_EQ(result.newlyDetected.size(), 1u);
    EXPECT_EQ(result.newlyDetected[0].vendorId, 0x1234);
    EXPECT_EQ(result.newlyDetected[0].productId, 0x5678);
    EXPECT_EQ(result.newlyDetected[0].busNumber, 1);
    EXPECT_EQ(result.newlyDetected[0].deviceAddress, 2);

    DeviceIdentifier expected{0x1234, 0x5678, 1, 2};
    EXPECT_EQ(result.knownKeys.size(), 1u);
    EXPECT_EQ(result.knownKeys.count(expected), 1u);
}

TEST_F(DeviceSnapshotDifferTest, KnownDeviceIsNotReportedAgain) {
    enumerator.devices = {makeDescriptor(0x1234, 0x5678, 1, 2)};
    KnownDeviceSet known = {DeviceIdentifier{0x1234, 0x5678, 1, 2}};

    PollResult result = pollOnce(enumerator, known);

    EXPECT_TRUE(result.newlyDetected.empty());
    EXPECT_EQ(result.knownKeys, known);
}

TEST_F(DeviceSnapshotDifferTest, SecondPollWithSameStateIsEmpty) {
    enumerator.devices = {
        makeDescriptor(0x046d, 0xc52b, 1, 4),
        makeDescriptor(0x0781, 0x5581, 2, 3)
    };

    PollResult first = pollOnce(enumerator, {});
    PollResult second = pollOnce(enumerator, first.knownKeys);

    EXPECT_EQ(first.newlyDetected.size(), 2u);
    EXPECT_TRUE(second.newlyDetected.empty());
    EXPECT_EQ(second.knownKeys, first.knownKeys);
}

TEST_F(DeviceSnapshotDifferTest, PreservesEnumerationOrder) {
    enumerator.devices = {
        makeDescriptor(0xffff, 0x0001, 3, 9),
        makeDescriptor(0x0001, 0x0001, 1, 1),
        makeDescriptor(0x8000, 0x0002, 2, 5)
    };

    PollResult result = pollOnce(enumerator, {});

    ASSERT_EQ(result.newlyDetected.size(), 3u);
    EXPECT_EQ(result.newlyDetected[0].vendorId, 0xffff);
    EXPECT_EQ(result.newlyDetected[1].vendorId, 0x0001);
    EXPECT_EQ(result.newlyDetected[2].vendorId, 0x8000);
}

TEST_F(DeviceSnapshotDifferTest, IdenticalIdentityIsLoggedOnce) {
    DeviceDescriptor a = makeDescriptor(0x1234, 0x5678, 1, 2);
    DeviceDescriptor b = a;
    b.serial = "second-copy";
    enumerator.devices = {a, b};

    PollResult result = pollOnce(enumerator, {});

    ASSERT_EQ(result.newlyDetected.size(), 1u);
    EXPECT_FALSE(result.newlyDetected[0].serial.has_value());
}

TEST_F(DeviceSnapshotDifferTest, ReplugAtNewAddressIsANewDevice) {
    enumerator.devices = {makeDescriptor(0x1234, 0x5678, 1, 2)};
    PollResult first = pollOnce(enumerator, {});

    enumerator.devices = {makeDescriptor(0x1234, 0x5678, 1, 7)};
    PollResult second = pollOnce(enumerator, first.knownKeys);

    ASSERT_EQ(second.newlyDetected.size(), 1u);
    EXPECT_EQ(second.newlyDetected[0].deviceAddress, 7);
    EXPECT_EQ(second.knownKeys.size(), 2u);
}

TEST_F(DeviceSnapshotDifferTest, NoDevicesAttachedIsNotAnError) {
    KnownDeviceSet known = {DeviceIdentifier{0x1234, 0x5678, 1, 2}};

    PollResult result = pollOnce(enumerator, known);

    EXPECT_TRUE(result.newlyDetected.empty());
    EXPECT_EQ(result.knownKeys, known);
}

TEST_F(DeviceSnapshotDifferTest, BackendFailurePropagates) {
    enumerator.failing = true;

    EXPECT_THROW(pollOnce(enumerator, {}), BackendUnavailable);
}

TEST(DeviceIdentifierTest, OrdersByAllFields) {
    DeviceIdentifier a{0x1234, 0x5678, 1, 2};
    DeviceIdentifier b{0x1234, 0x5678, 1, 3};
    DeviceIdentifier c{0x1234, 0x5678, 2, 1};

    EXPECT_TRUE(a < b);
    EXPECT_TRUE(b < c);
    EXPECT_FALSE(b < a);
    EXPECT_NE(a, b);
    EXPECT_EQ(a, (DeviceIdentifier{0x1234, 0x5678, 1, 2}));
}

} // namespace testing
} // namespace usb_handshake
