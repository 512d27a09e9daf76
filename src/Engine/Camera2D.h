#pragma once

struct Camera2D
{
    float x = 0.0f; // centro da câmera no mundo
    float y = 0.0f;
    float zoom = 1.0f; // 1.0 = normal, 2.0 = aproxima, 0.5 = afasta

    // Segue o alvo sem mostrar fora do mundo [0,worldW] x [0,worldH]
    void follow(float targetX, float targetY, float worldW, float worldH, int viewW, int viewH)
    {
        float halfW = (viewW * 0.5f) / zoom;
        float halfH = (viewH * 0.5f) / zoom;

        x = targetX;
        y = targetY;

        if (worldW <= halfW * 2.0f)
            x = worldW * 0.5f;
        else if (x < halfW)
            x = halfW;
        else if (x > worldW - halfW)
            x = worldW - halfW;

        if (worldH <= halfH * 2.0f)
            y = worldH * 0.5f;
        else if (y < halfH)
            y = halfH;
        else if (y > worldH - halfH)
            y = worldH - halfH;
    }
};
