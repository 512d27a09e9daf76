#pragma once
#include <string>
#include <unordered_map>
#include <vector>

enum class Key
{
    Unknown = 0,
    A,
    D,
    W,
    S,
    Q,
    E,
    Z,
    F,
    C,
    Space,
    Return,
    LShift,
    Tab,
    Left,
    Right,
    Up,
    Down,
    Escape,
    F5,
    F9
};

enum class InputEventType
{
    KeyDown,
    KeyUp,
    Quit
};

// Evento discreto (edge-triggered). O estado continuo vem do snapshot em Input.
struct InputEvent
{
    InputEventType type = InputEventType::KeyDown;
    Key key = Key::Unknown;
    bool repeat = false; // auto-repeat do SO
};

struct AxisMapping
{
    std::vector<Key> positive;
    std::vector<Key> negative;
};

struct ActionBinding
{
    std::vector<Key> keys;
};

class Input
{
public:
    void beginFrame(); // guarda o estado anterior para pressed()

    // Engine chama isso ao receber evento de teclado
    void setKeyDown(Key key, bool down);
    void apply(const InputEvent &event);
    void releaseAll();

    // API consumida pelo Game
    bool isKeyDown(Key key) const;

    // Axes (ex: "MoveX")
    void setAxisMapping(const std::string &name, AxisMapping mapping);
    float getAxis(const std::string &name) const;

    // Actions (ex: "Jump", "Pause")
    void setActionBinding(const std::string &name, ActionBinding binding);
    bool down(const std::string &name) const;
    bool pressed(const std::string &name) const;

    // true se a tecla do evento pertence a action
    bool matches(const std::string &name, Key key) const;

private:
    std::unordered_map<Key, bool> keys_;
    std::unordered_map<Key, bool> prevKeys_;
    std::unordered_map<std::string, AxisMapping> axes_;
    std::unordered_map<std::string, ActionBinding> actions_;
};

// Bindings padrao do jogo (A/D mover, Space pular, Q/Z era, ...)
void BindDefaultControls(Input &input);
