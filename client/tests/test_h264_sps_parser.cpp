#include <gtest/gtest.h>
#include "backend/media/H264SpsParser.h"

namespace {
    // Baseline profile, level 3.0, 80x45 macroblocks, no cropping
    const QByteArray SPS_720P = QByteArray::fromHex("6742001EDA014016E4");
    const QByteArray PPS = QByteArray::fromHex("68CE3880");
}

TEST(H264SpsParser, SplitsAnnexBOnBothStartCodeLengths) {
    const QByteArray stream = QByteArray::fromHex("00000001") + SPS_720P + QByteArray::fromHex("000001") + PPS;
    const QList<QByteArray> nals = H264SpsParser::splitAnnexB(stream);
    ASSERT_EQ(nals.size(), 2);
    EXPECT_EQ(nals.at(0), SPS_720P);
    EXPECT_EQ(nals.at(1), PPS);
}

TEST(H264SpsParser, RemovesEmulationPrevention) {
    EXPECT_EQ(H264SpsParser::toRbsp(QByteArray::fromHex("6700000301")), QByteArray::fromHex("67000001"));
    EXPECT_EQ(H264SpsParser::toRbsp(QByteArray::fromHex("670000")), QByteArray::fromHex("670000"));
}

TEST(H264SpsParser, Parses720pSps) {
    H264SpsParser::SpsInfo info;
    ASSERT_TRUE(H264SpsParser::parseSps(SPS_720P, &info));
    EXPECT_EQ(info.profileIdc, 66);
    EXPECT_EQ(info.levelIdc, 30);
    EXPECT_EQ(info.widthInMbs, 80);
    EXPECT_EQ(info.heightInMapUnits, 45);
    EXPECT_TRUE(info.frameMbsOnly);
    EXPECT_EQ(info.size(), QSize(1280, 720));
}

TEST(H264SpsParser, FrameSizeFromAccessUnit) {
    const QByteArray au = QByteArray::fromHex("00000001") + PPS + QByteArray::fromHex("00000001") + SPS_720P;
    EXPECT_EQ(H264SpsParser::frameSizeFromAccessUnit(au), QSize(1280, 720));
    EXPECT_FALSE(H264SpsParser::frameSizeFromAccessUnit(QByteArray::fromHex("00000001") + PPS).isValid());
}

TEST(H264SpsParser, RejectsNonSpsAndTruncatedInput) {
    H264SpsParser::SpsInfo info;
    EXPECT_FALSE(H264SpsParser::parseSps(PPS, &info));
    EXPECT_FALSE(H264SpsParser::parseSps(SPS_720P.left(4), &info));
}
