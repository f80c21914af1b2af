#include <gtest/gtest.h>
#include <QSettings>
#include <QSignalSpy>
#include <QTemporaryDir>
#include "TestFakes.h"
#include "backend/input/InputManager.h"
#include "backend/input/KeyNameMapper.h"

TEST(KeyNameMapper, LettersDigitsAndFunctionKeys) {
    EXPECT_EQ(KeyNameMapper::keyName(Qt::Key_A), QString("KeyA"));
    EXPECT_EQ(KeyNameMapper::keyName(Qt::Key_Z), QString("KeyZ"));
    EXPECT_EQ(KeyNameMapper::keyName(Qt::Key_7), QString("Digit7"));
    EXPECT_EQ(KeyNameMapper::keyName(Qt::Key_F12), QString("F12"));
    EXPECT_EQ(KeyNameMapper::keyName(Qt::Key_Return), QString("Enter"));
    EXPECT_EQ(KeyNameMapper::keyName(Qt::Key_Left), QString("ArrowLeft"));
}

TEST(KeyNameMapper, ShiftedSymbolsMapToPhysicalKey) {
    EXPECT_EQ(KeyNameMapper::keyName(Qt::Key_Exclam, Qt::ShiftModifier), QString("Digit1"));
    EXPECT_EQ(KeyNameMapper::keyName(Qt::Key_ParenRight, Qt::ShiftModifier), QString("Digit0"));
    EXPECT_EQ(KeyNameMapper::keyName(Qt::Key_Question, Qt::ShiftModifier), QString("Slash"));
    EXPECT_EQ(KeyNameMapper::keyName(Qt::Key_AsciiTilde, Qt::ShiftModifier), QString("Backquote"));
}

TEST(KeyNameMapper, KeypadKeys) {
    EXPECT_EQ(KeyNameMapper::keyName(Qt::Key_5, Qt::KeypadModifier), QString("Numpad5"));
    EXPECT_EQ(KeyNameMapper::keyName(Qt::Key_Plus, Qt::KeypadModifier), QString("NumpadAdd"));
    EXPECT_EQ(KeyNameMapper::keyName(Qt::Key_Enter, Qt::KeypadModifier), QString("NumpadEnter"));
}

TEST(KeyNameMapper, ModifierSides) {
    EXPECT_EQ(KeyNameMapper::keyName(Qt::Key_Shift, Qt::ShiftModifier, 50), QString("ShiftLeft"));
    EXPECT_EQ(KeyNameMapper::keyName(Qt::Key_Shift, Qt::ShiftModifier, 62), QString("ShiftRight"));
    EXPECT_EQ(KeyNameMapper::keyName(Qt::Key_Control, Qt::ControlModifier, 105), QString("ControlRight"));
    EXPECT_EQ(KeyNameMapper::keyName(Qt::Key_Meta), QString("MetaLeft"));
    EXPECT_TRUE(KeyNameMapper::isModifierKey("AltRight"));
    EXPECT_FALSE(KeyNameMapper::isModifierKey("KeyA"));
}

TEST(KeyNameMapper, UnmappedKeyIsEmpty) {
    EXPECT_TRUE(KeyNameMapper::keyName(Qt::Key_VolumeUp).isEmpty());
    EXPECT_TRUE(KeyNameMapper::mouseButtonName(Qt::ExtraButton4).isEmpty());
    EXPECT_EQ(KeyNameMapper::mouseButtonName(Qt::MiddleButton), QString("middle"));
}

class InputManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        input.setViewSize(QSize(200, 100));
        input.start(&sink);
    }

    FakeHidSink sink;
    InputManager input;
};

TEST_F(InputManagerTest, KeysAreForwardedInOrder) {
    EXPECT_TRUE(input.handleKey(Qt::Key_A, Qt::NoModifier, 0, true));
    EXPECT_TRUE(input.handleKey(Qt::Key_A, Qt::NoModifier, 0, false));
    EXPECT_EQ(sink.events, (QStringList{ "key:KeyA:1", "key:KeyA:0" }));
    EXPECT_TRUE(input.pressedKeys().isEmpty());
}

TEST_F(InputManagerTest, AutoRepeatIsSwallowed) {
    input.handleKey(Qt::Key_B, Qt::NoModifier, 0, true);
    EXPECT_TRUE(input.handleKey(Qt::Key_B, Qt::NoModifier, 0, true, true));
    EXPECT_EQ(sink.events, QStringList{ "key:KeyB:1" });
}

TEST_F(InputManagerTest, LoneMetaSendsNothing) {
    input.processKey("MetaLeft", true);
    EXPECT_EQ(input.pendingMeta(), QString("MetaLeft"));
    input.processKey("MetaLeft", false);
    EXPECT_TRUE(sink.events.isEmpty());
    EXPECT_TRUE(input.pendingMeta().isEmpty());
}

TEST_F(InputManagerTest, MetaChordIsFlushedBeforeKey) {
    input.processKey("MetaLeft", true);
    input.processKey("KeyC", true);
    input.processKey("KeyC", false);
    input.processKey("MetaLeft", false);
    EXPECT_EQ(sink.events, (QStringList{ "key:MetaLeft:1", "key:KeyC:1", "key:KeyC:0", "key:MetaLeft:0" }));
}

TEST_F(InputManagerTest, PlainModifierKeepsMetaBuffered) {
    input.processKey("MetaLeft", true);
    input.processKey("ShiftLeft", true);
    EXPECT_EQ(sink.events, QStringList{ "key:ShiftLeft:1" });
    input.processKey("KeyS", true);
    EXPECT_EQ(sink.events, (QStringList{ "key:ShiftLeft:1", "key:MetaLeft:1", "key:KeyS:1" }));
}

TEST_F(InputManagerTest, StopReleasesHeldKeysAndButtons) {
    input.processKey("ControlLeft", true);
    input.processKey("KeyV", true);
    input.handleMouseButton(Qt::LeftButton, true, QPointF(100, 50));
    sink.events.clear();

    input.stop();
    EXPECT_EQ(sink.events, (QStringList{ "key:KeyV:0", "key:ControlLeft:0", "button:left:0" }));
    EXPECT_FALSE(input.isActive());

    sink.events.clear();
    input.processKey("KeyA", true);
    EXPECT_TRUE(sink.events.isEmpty());
}

TEST_F(InputManagerTest, ButtonPressSendsPositionFirst) {
    input.handleMouseButton(Qt::LeftButton, true, QPointF(100, 50));
    input.handleMouseButton(Qt::LeftButton, false, QPointF(100, 50));
    EXPECT_EQ(sink.events, (QStringList{ "move:0,0", "button:left:1", "button:left:0" }));
}

TEST_F(InputManagerTest, AbsoluteMovesAreQueued) {
    input.handleMouseMove(QPointF(0, 0));
    input.handleMouseMove(QPointF(200, 100));
    EXPECT_EQ(sink.events, (QStringList{ "queue:-32767,-32767", "queue:32767,32767" }));
}

TEST_F(InputManagerTest, RelativeModeSendsClampedDeltas) {
    input.setRelativeMouseEnabled(true);
    input.handleMouseMove(QPointF(10, 10));
    input.handleMouseMove(QPointF(15, 7));
    input.handleMouseMove(QPointF(515, 7));
    input.handleMouseMove(QPointF(515, 7));
    EXPECT_EQ(sink.events, (QStringList{ "rel:5,-3", "rel:127,0" }));

    input.handleMouseButton(Qt::RightButton, true, QPointF(515, 7));
    EXPECT_EQ(sink.events.last(), QString("button:right:1"));
    EXPECT_EQ(sink.events.size(), 3);
}

TEST_F(InputManagerTest, WheelClampsAndSkipsZero) {
    input.handleWheel(QPoint(), QPoint(0, 120));
    input.handleWheel(QPoint(0, -400), QPoint());
    input.handleWheel(QPoint(), QPoint(0, 4));
    EXPECT_EQ(sink.events, (QStringList{ "wheel:0,15", "wheel:0,-127" }));
}

TEST_F(InputManagerTest, DisabledCaptureDropsEvents) {
    QSignalSpy spy(&input, &InputManager::captureSettingsChanged);
    input.setKeyboardCaptureEnabled(false);
    input.setMouseCaptureEnabled(false);
    EXPECT_EQ(spy.count(), 2);

    EXPECT_FALSE(input.handleKey(Qt::Key_A, Qt::NoModifier, 0, true));
    input.handleMouseMove(QPointF(5, 5));
    input.handleWheel(QPoint(0, 10), QPoint());
    EXPECT_TRUE(sink.events.isEmpty());
}

TEST_F(InputManagerTest, DisablingKeyboardReleasesHeldKeys) {
    input.processKey("KeyQ", true);
    input.setKeyboardCaptureEnabled(false);
    EXPECT_EQ(sink.events, (QStringList{ "key:KeyQ:1", "key:KeyQ:0" }));
}

TEST(InputManagerSettings, RoundTripThroughSettings) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QSettings settings(dir.filePath("input.ini"), QSettings::IniFormat);

    InputManager first;
    first.setMouseCaptureEnabled(false);
    first.setRelativeMouseEnabled(true);
    first.saveSettings(settings);

    InputManager second;
    second.loadSettings(settings);
    EXPECT_TRUE(second.isKeyboardCaptureEnabled());
    EXPECT_FALSE(second.isMouseCaptureEnabled());
    EXPECT_TRUE(second.isRelativeMouseEnabled());
}
