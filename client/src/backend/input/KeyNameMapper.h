#ifndef KEYNAMEMAPPER_H
#define KEYNAMEMAPPER_H

#include <QString>
#include <Qt>

/**
 * @brief Maps Qt key events to the appliance key-name vocabulary
 *
 * Names follow the DOM KeyboardEvent.code set ("KeyA", "Digit1",
 * "ShiftLeft", "NumpadEnter", ...). Shifted US-layout symbols map back to
 * the physical key that produces them. Left/right modifiers are told apart
 * by their X11 keycodes when the platform reports one. An empty string
 * means the key is not forwarded.
 */
class KeyNameMapper {
public:
    static QString keyName(int qtKey, Qt::KeyboardModifiers modifiers = Qt::NoModifier, quint32 nativeScanCode = 0);
    static QString mouseButtonName(Qt::MouseButton button);

    static bool isMetaKey(const QString& name) { return name == "MetaLeft" || name == "MetaRight"; }
    static bool isModifierKey(const QString& name);

private:
    static QString keypadName(int qtKey);
    static QString modifierName(int qtKey, quint32 nativeScanCode);
};

#endif // KEYNAMEMAPPER_H
