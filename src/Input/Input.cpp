#include "Input.h"

void Input::beginFrame()
{
    prevKeys_ = keys_;
}

void Input::setKeyDown(Key key, bool down)
{
    keys_[key] = down;
}

void Input::apply(const InputEvent &event)
{
    if (event.key == Key::Unknown)
        return;
    if (event.type == InputEventType::KeyDown)
        setKeyDown(event.key, true);
    else if (event.type == InputEventType::KeyUp)
        setKeyDown(event.key, false);
}

void Input::releaseAll()
{
    keys_.clear();
    prevKeys_.clear();
}

bool Input::isKeyDown(Key key) const
{
    auto it = keys_.find(key);
    if (it == keys_.end())
        return false;
    return it->second;
}

void Input::setAxisMapping(const std::string &name, AxisMapping mapping)
{
    axes_[name] = std::move(mapping);
}

float Input::getAxis(const std::string &name) const
{
    auto it = axes_.find(name);
    if (it == axes_.end())
        return 0.0f;

    float v = 0.0f;

    for (auto k : it->second.positive)
    {
        if (isKeyDown(k))
        {
            v += 1.0f;
            break;
        }
    }
    for (auto k : it->second.negative)
    {
        if (isKeyDown(k))
        {
            v -= 1.0f;
            break;
        }
    }

    return v;
}

void Input::setActionBinding(const std::string &name, ActionBinding binding)
{
    actions_[name] = std::move(binding);
}

bool Input::down(const std::string &name) const
{
    auto it = actions_.find(name);
    if (it == actions_.end())
        return false;

    for (auto k : it->second.keys)
    {
        if (isKeyDown(k))
            return true;
    }

    return false;
}

bool Input::pressed(const std::string &name) const
{
    auto it = actions_.find(name);
    if (it == actions_.end())
        return false;

    for (auto k : it->second.keys)
    {
        bool now = isKeyDown(k);
        bool before = false;
        auto pit = prevKeys_.find(k);
        if (pit != prevKeys_.end())
            before = pit->second;
        if (now && !before)
            return true;
    }

    return false;
}

bool Input::matches(const std::string &name, Key key) const
{
    auto it = actions_.find(name);
    if (it == actions_.end())
        return false;

    for (auto k : it->second.keys)
    {
        if (k == key)
            return true;
    }
    return false;
}

void BindDefaultControls(Input &input)
{
    input.setAxisMapping("MoveX", AxisMapping{
                                      /*positive*/ {Key::D, Key::Right},
                                      /*negative*/ {Key::A, Key::Left}});

    input.setActionBinding("Jump", ActionBinding{{Key::Space, Key::W, Key::Up}});
    input.setActionBinding("Attack", ActionBinding{{Key::F}});
    input.setActionBinding("EraPower", ActionBinding{{Key::E}});
    input.setActionBinding("SlowTime", ActionBinding{{Key::LShift}});
    input.setActionBinding("NextEra", ActionBinding{{Key::Q}});
    input.setActionBinding("PrevEra", ActionBinding{{Key::Z}});
    input.setActionBinding("Pause", ActionBinding{{Key::Escape}});
    input.setActionBinding("QuickSave", ActionBinding{{Key::F5}});
    input.setActionBinding("QuickLoad", ActionBinding{{Key::F9}});
    input.setActionBinding("ToggleColliders", ActionBinding{{Key::C}});

    // Menus
    input.setActionBinding("MenuUp", ActionBinding{{Key::Up, Key::W}});
    input.setActionBinding("MenuDown", ActionBinding{{Key::Down, Key::S}});
    input.setActionBinding("Confirm", ActionBinding{{Key::Return}});
    input.setActionBinding("Back", ActionBinding{{Key::Escape}});
}
