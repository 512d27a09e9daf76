#include "CommandBuffer.h"
#include <algorithm>

void CommandBuffer::nextFrame(std::uint64_t frameIndex)
{
    stats_ = RenderStats{};
    stats_.frameIndex = frameIndex;
    finalized_ = false;
}

void CommandBuffer::clear()
{
    cmds_.clear();
    finalized_ = false;
}

void CommandBuffer::submit(const RenderCommand &cmd)
{
    cmds_.push_back(cmd);
    stats_.commandsSubmitted++;
    finalized_ = false;
}

void CommandBuffer::rect(int layer, float x, float y, int w, int h,
                         unsigned char r, unsigned char g, unsigned char b, unsigned char a,
                         bool screenSpace)
{
    RenderCommand cmd;
    cmd.type = RenderCommandType::Rect;
    cmd.layer = layer;
    cmd.x = x;
    cmd.y = y;
    cmd.w = w;
    cmd.h = h;
    cmd.r = r;
    cmd.g = g;
    cmd.b = b;
    cmd.a = a;
    cmd.screenSpace = screenSpace;
    submit(cmd);
}

void CommandBuffer::text(int layer, const std::string &str, float x, float y, FontStyle font,
                         unsigned char r, unsigned char g, unsigned char b, unsigned char a,
                         bool centered)
{
    RenderCommand cmd;
    cmd.type = RenderCommandType::Text;
    cmd.layer = layer;
    cmd.x = x;
    cmd.y = y;
    cmd.text = str;
    cmd.font = font;
    cmd.r = r;
    cmd.g = g;
    cmd.b = b;
    cmd.a = a;
    cmd.centered = centered;
    cmd.screenSpace = true;
    submit(cmd);
}

void CommandBuffer::finalize()
{
    if (finalized_)
        return;

    // Ordena por layer; dentro do layer mantém a ordem de submissão (overlay depois do mundo)
    std::stable_sort(cmds_.begin(), cmds_.end(),
                     [](const RenderCommand &a, const RenderCommand &b)
                     {
                         return a.layer < b.layer;
                     });

    stats_.rectDraws = 0;
    stats_.textureDraws = 0;
    stats_.textDraws = 0;

    for (const auto &c : cmds_)
    {
        if (c.type == RenderCommandType::Rect)
            stats_.rectDraws++;
        else if (c.type == RenderCommandType::Texture)
            stats_.textureDraws++;
        else
            stats_.textDraws++;
    }

    finalized_ = true;
}
