#include <gtest/gtest.h>
#include "backend/network/hid/HidWireCodec.h"

using namespace HidWireCodec;

TEST(HidWireCodec, KeyFrameCarriesStateAndName) {
    const QByteArray down = encodeKey("KeyA", true);
    EXPECT_EQ(down, QByteArray::fromHex("01014b657941"));

    const QByteArray up = encodeKey("ShiftLeft", false);
    ASSERT_EQ(up.size(), 2 + 9);
    EXPECT_EQ(quint8(up.at(0)), 0x01);
    EXPECT_EQ(quint8(up.at(1)), 0x00);
    EXPECT_EQ(up.mid(2), QByteArray("ShiftLeft"));
}

TEST(HidWireCodec, KeyFinishFrame) {
    EXPECT_EQ(encodeKeyFinish(), QByteArray::fromHex("0100"));
}

TEST(HidWireCodec, MouseButtonFrame) {
    EXPECT_EQ(encodeMouseButton("left", true), QByteArray::fromHex("02016c656674"));
    EXPECT_EQ(encodeMouseButton("middle", false).left(2), QByteArray::fromHex("0200"));
}

TEST(HidWireCodec, AbsoluteMoveIsBigEndianSigned) {
    EXPECT_EQ(encodeMouseMove(0, 0), QByteArray::fromHex("0300000000"));
    EXPECT_EQ(encodeMouseMove(32767, -32767), QByteArray::fromHex("037fff8001"));
    EXPECT_EQ(encodeMouseMove(-1, 256), QByteArray::fromHex("03ffff0100"));
}

TEST(HidWireCodec, AbsoluteMoveClampsInsteadOfWrapping) {
    EXPECT_EQ(encodeMouseMove(40000, -40000), QByteArray::fromHex("037fff8000"));
}

TEST(HidWireCodec, RelativeAndWheelFrames) {
    EXPECT_EQ(encodeMouseRelative(5, -3), QByteArray::fromHex("040005fd"));
    EXPECT_EQ(encodeMouseWheel(0, 1), QByteArray::fromHex("05000001"));
    EXPECT_EQ(encodeMouseWheel(0, -1), QByteArray::fromHex("050000ff"));
    EXPECT_EQ(encodeMouseRelative(1, 1, true), QByteArray::fromHex("04010101"));
}

TEST(HidWireCodec, DeltasClampToInt8) {
    EXPECT_EQ(encodeMouseRelative(500, -500), QByteArray::fromHex("04007f80"));
    EXPECT_EQ(clampInt8(128), 127);
    EXPECT_EQ(clampInt8(-129), -128);
}

TEST(HidWireCodec, AbsoluteMovesClampSymmetrically) {
    EXPECT_EQ(clampAbsolute(70000), 32767);
    EXPECT_EQ(clampAbsolute(-32768), -32767);
    EXPECT_EQ(clampAbsolute(-70000), -32767);
    EXPECT_EQ(encodeMouseMove(-40000, 40000), QByteArray::fromHex("0380017fff"));
}
