#include "backend/input/KeyNameMapper.h"
#include <QHash>

namespace {
    // X11 keycodes (evdev + 8) of the right-hand modifiers
    constexpr quint32 XKB_SHIFT_R = 62;
    constexpr quint32 XKB_CONTROL_R = 105;
    constexpr quint32 XKB_ALT_R = 108;
    constexpr quint32 XKB_SUPER_R = 134;

    const QHash<int, QString>& fixedKeys() {
        static const QHash<int, QString> table = {
            { Qt::Key_QuoteLeft, "Backquote" }, { Qt::Key_AsciiTilde, "Backquote" },
            { Qt::Key_Minus, "Minus" }, { Qt::Key_Underscore, "Minus" },
            { Qt::Key_Equal, "Equal" }, { Qt::Key_Plus, "Equal" },
            { Qt::Key_BracketLeft, "BracketLeft" }, { Qt::Key_BraceLeft, "BracketLeft" },
            { Qt::Key_BracketRight, "BracketRight" }, { Qt::Key_BraceRight, "BracketRight" },
            { Qt::Key_Semicolon, "Semicolon" }, { Qt::Key_Colon, "Semicolon" },
            { Qt::Key_Apostrophe, "Quote" }, { Qt::Key_QuoteDbl, "Quote" },
            { Qt::Key_Backslash, "Backslash" }, { Qt::Key_Bar, "Backslash" },
            { Qt::Key_Comma, "Comma" }, { Qt::Key_Less, "Comma" },
            { Qt::Key_Period, "Period" }, { Qt::Key_Greater, "Period" },
            { Qt::Key_Slash, "Slash" }, { Qt::Key_Question, "Slash" },

            { Qt::Key_Exclam, "Digit1" }, { Qt::Key_At, "Digit2" }, { Qt::Key_NumberSign, "Digit3" },
            { Qt::Key_Dollar, "Digit4" }, { Qt::Key_Percent, "Digit5" }, { Qt::Key_AsciiCircum, "Digit6" },
            { Qt::Key_Ampersand, "Digit7" }, { Qt::Key_Asterisk, "Digit8" }, { Qt::Key_ParenLeft, "Digit9" },
            { Qt::Key_ParenRight, "Digit0" },

            { Qt::Key_Space, "Space" },
            { Qt::Key_Tab, "Tab" }, { Qt::Key_Backtab, "Tab" },
            { Qt::Key_Return, "Enter" },
            { Qt::Key_Enter, "NumpadEnter" },
            { Qt::Key_Backspace, "Backspace" },
            { Qt::Key_Escape, "Escape" },
            { Qt::Key_Help, "Help" },
            { Qt::Key_Insert, "Insert" },
            { Qt::Key_Delete, "Delete" },
            { Qt::Key_Home, "Home" },
            { Qt::Key_End, "End" },
            { Qt::Key_PageUp, "PageUp" },
            { Qt::Key_PageDown, "PageDown" },
            { Qt::Key_Left, "ArrowLeft" },
            { Qt::Key_Right, "ArrowRight" },
            { Qt::Key_Up, "ArrowUp" },
            { Qt::Key_Down, "ArrowDown" },
            { Qt::Key_CapsLock, "CapsLock" },
            { Qt::Key_NumLock, "NumLock" },
            { Qt::Key_ScrollLock, "ScrollLock" },
            { Qt::Key_Print, "PrintScreen" },
            { Qt::Key_Pause, "Pause" },
            { Qt::Key_Menu, "ContextMenu" },
        };
        return table;
    }
}

QString KeyNameMapper::keyName(int qtKey, Qt::KeyboardModifiers modifiers, quint32 nativeScanCode) {
    const QString modifier = modifierName(qtKey, nativeScanCode);
    if (!modifier.isEmpty()) {
        return modifier;
    }

    if (modifiers.testFlag(Qt::KeypadModifier)) {
        const QString keypad = keypadName(qtKey);
        if (!keypad.isEmpty()) return keypad;
    }

    if (qtKey >= Qt::Key_A && qtKey <= Qt::Key_Z) {
        return QString("Key%1").arg(QChar('A' + (qtKey - Qt::Key_A)));
    }
    if (qtKey >= Qt::Key_0 && qtKey <= Qt::Key_9) {
        return QString("Digit%1").arg(qtKey - Qt::Key_0);
    }
    if (qtKey >= Qt::Key_F1 && qtKey <= Qt::Key_F17) {
        return QString("F%1").arg(qtKey - Qt::Key_F1 + 1);
    }
    return fixedKeys().value(qtKey);
}

QString KeyNameMapper::keypadName(int qtKey) {
    if (qtKey >= Qt::Key_0 && qtKey <= Qt::Key_9) {
        return QString("Numpad%1").arg(qtKey - Qt::Key_0);
    }
    switch (qtKey) {
        case Qt::Key_Period:
        case Qt::Key_Comma:
        case Qt::Key_Delete:
            return "NumpadDecimal";
        case Qt::Key_Asterisk: return "NumpadMultiply";
        case Qt::Key_Plus: return "NumpadAdd";
        case Qt::Key_Minus: return "NumpadSubtract";
        case Qt::Key_Slash: return "NumpadDivide";
        case Qt::Key_Enter:
        case Qt::Key_Return:
            return "NumpadEnter";
        case Qt::Key_Equal: return "NumpadEqual";
        default: return QString();
    }
}

QString KeyNameMapper::modifierName(int qtKey, quint32 nativeScanCode) {
    switch (qtKey) {
        case Qt::Key_Shift:
            return nativeScanCode == XKB_SHIFT_R ? "ShiftRight" : "ShiftLeft";
        case Qt::Key_Control:
            return nativeScanCode == XKB_CONTROL_R ? "ControlRight" : "ControlLeft";
        case Qt::Key_Alt:
            return nativeScanCode == XKB_ALT_R ? "AltRight" : "AltLeft";
        case Qt::Key_AltGr:
            return "AltRight";
        case Qt::Key_Meta:
        case Qt::Key_Super_L:
        case Qt::Key_Super_R:
            if (qtKey == Qt::Key_Super_R || nativeScanCode == XKB_SUPER_R) return "MetaRight";
            return "MetaLeft";
        default:
            return QString();
    }
}

bool KeyNameMapper::isModifierKey(const QString& name) {
    return name.startsWith("Shift") || name.startsWith("Control") || name.startsWith("Alt") || name.startsWith("Meta");
}

QString KeyNameMapper::mouseButtonName(Qt::MouseButton button) {
    switch (button) {
        case Qt::LeftButton: return "left";
        case Qt::RightButton: return "right";
        case Qt::MiddleButton: return "middle";
        case Qt::BackButton: return "up";
        case Qt::ForwardButton: return "down";
        default: return QString();
    }
}
