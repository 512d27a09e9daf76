#pragma once
#include <vector>
#include "RenderCommand.h"
#include "RenderStats.h"

class CommandBuffer
{
public:
    void clear();
    void submit(const RenderCommand &cmd);

    // helpers usados pelos modos de jogo
    void rect(int layer, float x, float y, int w, int h,
              unsigned char r, unsigned char g, unsigned char b, unsigned char a,
              bool screenSpace = false);
    void text(int layer, const std::string &str, float x, float y, FontStyle font,
              unsigned char r, unsigned char g, unsigned char b, unsigned char a,
              bool centered = false);

    void nextFrame(std::uint64_t frameIndex);
    void finalize();

    const RenderStats &stats() const { return stats_; }
    const std::vector<RenderCommand> &commands() const { return cmds_; }

private:
    std::vector<RenderCommand> cmds_;
    RenderStats stats_;
    bool finalized_ = false;
};
