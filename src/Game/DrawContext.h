#pragma once
#include "../Engine/Camera2D.h"

class CommandBuffer;

// Tudo que um modo precisa para desenhar um frame
struct DrawContext
{
    CommandBuffer &cmds;
    int surfaceW = 1280;
    int surfaceH = 720;
    float interpolation = 0.0f; // fracao do FixedStepScheduler
    Camera2D camera;            // o modo Playing posiciona; o Engine aplica
};
