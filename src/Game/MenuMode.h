#pragma once
#include <string>
#include <vector>
#include "DrawContext.h"
#include "GameModeMachine.h"

class Input;
class PlayingMode;
class SaveManager;

class MenuMode
{
public:
    enum class Option
    {
        Resume,
        Tutorial,
        DemoLevel
    };

    static constexpr float kTitleAlphaSpeed = 128.0f; // alpha/s
    static constexpr float kTitleAlphaMin = 128.0f;
    static constexpr float kTitleAlphaMax = 255.0f;

    MenuMode(const Input &bindings, PlayingMode &playing, SaveManager *saves);

    void onEnter(GameMode previous);
    ModeRequest handleInput(const InputEvent &event);
    ModeRequest update(float dtMs);
    void draw(DrawContext &ctx) const;

    const std::vector<Option> &options() const { return options_; }
    int selected() const { return selected_; }
    float titleAlpha() const { return titleAlpha_; }
    bool quitRequested() const { return quitRequested_; }

    static const char *OptionLabel(Option option);

private:
    void refreshOptions();
    ModeRequest confirm();

private:
    const Input &bindings_;
    PlayingMode &playing_;
    SaveManager *saves_ = nullptr;

    std::vector<Option> options_;
    int selected_ = 0;
    float titleAlpha_ = kTitleAlphaMax;
    float titleDirection_ = -1.0f;
    bool quitRequested_ = false;
};
