#include "MenuMode.h"
#include "PlayingMode.h"
#include "../Input/Input.h"
#include "../Persistence/SaveManager.h"
#include "../Renderer/CommandBuffer.h"
#include <cstdio>

MenuMode::MenuMode(const Input &bindings, PlayingMode &playing, SaveManager *saves)
    : bindings_(bindings),
      playing_(playing),
      saves_(saves)
{
    refreshOptions();
}

const char *MenuMode::OptionLabel(Option option)
{
    switch (option)
    {
    case Option::Resume:
        return "Resume";
    case Option::Tutorial:
        return "Tutorial";
    case Option::DemoLevel:
        return "Demo Level";
    }
    return "";
}

void MenuMode::refreshOptions()
{
    options_.clear();
    if (saves_ && saves_->hasSuspendSave())
        options_.push_back(Option::Resume);
    options_.push_back(Option::Tutorial);
    options_.push_back(Option::DemoLevel);
    selected_ = 0;
}

void MenuMode::onEnter(GameMode previous)
{
    (void)previous;
    refreshOptions();
    titleAlpha_ = kTitleAlphaMax;
    titleDirection_ = -1.0f;
}

ModeRequest MenuMode::handleInput(const InputEvent &event)
{
    if (event.type != InputEventType::KeyDown)
        return std::nullopt;

    const int count = (int)options_.size();
    if (bindings_.matches("MenuUp", event.key))
    {
        selected_ = (selected_ + count - 1) % count;
        return std::nullopt;
    }
    if (bindings_.matches("MenuDown", event.key))
    {
        selected_ = (selected_ + 1) % count;
        return std::nullopt;
    }
    if (event.repeat)
        return std::nullopt;

    if (bindings_.matches("Confirm", event.key))
        return confirm();
    if (bindings_.matches("Back", event.key))
        quitRequested_ = true;

    return std::nullopt;
}

ModeRequest MenuMode::confirm()
{
    switch (options_[selected_])
    {
    case Option::Resume:
    {
        if (!saves_)
            return std::nullopt;
        auto snap = saves_->loadGame(SaveType::Suspend, 0);
        saves_->cleanupSuspendSave();
        if (!snap || !playing_.importState(*snap))
        {
            std::printf("MenuMode: suspend save unusable\n");
            refreshOptions();
            return std::nullopt;
        }
        return GameMode::Playing;
    }
    case Option::Tutorial:
    case Option::DemoLevel:
    {
        // run nova descarta a sessao suspensa
        if (saves_ && saves_->suspendCleanupPending())
            saves_->cleanupSuspendSave();

        int level = options_[selected_] == Option::Tutorial ? 0 : playing_.levelCount() - 1;
        if (!playing_.startNewRun(level))
            return std::nullopt;
        return GameMode::Playing;
    }
    }
    return std::nullopt;
}

ModeRequest MenuMode::update(float dtMs)
{
    titleAlpha_ += titleDirection_ * kTitleAlphaSpeed * (dtMs / 1000.0f);
    if (titleAlpha_ <= kTitleAlphaMin)
    {
        titleAlpha_ = kTitleAlphaMin;
        titleDirection_ = 1.0f;
    }
    else if (titleAlpha_ >= kTitleAlphaMax)
    {
        titleAlpha_ = kTitleAlphaMax;
        titleDirection_ = -1.0f;
    }
    return std::nullopt;
}

void MenuMode::draw(DrawContext &ctx) const
{
    CommandBuffer &cmds = ctx.cmds;
    float cx = ctx.surfaceW * 0.5f;

    cmds.rect(0, 0.0f, 0.0f, ctx.surfaceW, ctx.surfaceH, 0, 0, 0, 255, true);
    cmds.text(10, "CHRONOSTA", cx, ctx.surfaceH * 0.25f, FontStyle::Title,
              255, 255, 255, (unsigned char)titleAlpha_, true);

    for (int i = 0; i < (int)options_.size(); ++i)
    {
        bool active = (i == selected_);
        unsigned char shade = active ? 255 : 128;
        cmds.text(10, OptionLabel(options_[i]), cx, ctx.surfaceH * 0.5f + i * 50.0f, FontStyle::Body,
                  shade, shade, active ? 0 : 128, 255, true);
    }

    cmds.text(10, "Up/Down to choose, Enter to start, Esc to quit", cx, ctx.surfaceH - 40.0f,
              FontStyle::Body, 150, 150, 150, 255, true);
}
