#ifndef RICHEDIT_INTERACTION_TYPES_H
#define RICHEDIT_INTERACTION_TYPES_H

#include <cstdint>

namespace richedit::interaction {

enum class SelectionChangedCause : std::uint8_t {
    Tap = 0,
    DoubleTap = 1,
    LongPress = 2,
    ForcePress = 3,
    Keyboard = 4,
    Drag = 5,
};

// Keys the editable reacts to. Everything else maps to Other.
enum class LogicalKey : std::uint8_t {
    Other = 0,
    ArrowLeft = 1,
    ArrowRight = 2,
    ArrowUp = 3,
    ArrowDown = 4,
    Delete = 5,
    Backspace = 6,
    KeyA = 7,
    KeyC = 8,
    KeyV = 9,
    KeyX = 10,
};

struct KeyEvent {
    LogicalKey key = LogicalKey::Other;
    bool down = true;       // Key-up events are ignored
    bool shift = false;
    bool control = false;
    bool alt = false;
    bool meta = false;
};

// Action button pressed on the soft keyboard.
enum class TextInputAction : std::uint8_t {
    None = 0,
    Unspecified = 1,
    Done = 2,
    Go = 3,
    Search = 4,
    Send = 5,
    Next = 6,
    Previous = 7,
    Continue = 8,
    Join = 9,
    Route = 10,
    EmergencyCall = 11,
    Newline = 12,
};

// Granularity of a pointer drag selection.
enum class DragGranularity : std::uint8_t {
    Character = 0,
    Word = 1,
};

} // namespace richedit::interaction

#endif // RICHEDIT_INTERACTION_TYPES_H
