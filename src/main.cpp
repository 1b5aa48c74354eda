#include "raylib.h"
#include "raymath.h"
#include <cstring>
#include <string>
#include "constant.hpp"
#include "gameConfig.hpp"
#include "gameSession.hpp"
#include "orbitCamera.hpp"
#include "uiManager.hpp"
#include "updateContext.hpp"

int main(int argc, char **argv)
{
    std::string configPath = CONFIG_FILENAME;
    bool verbose = false;
    for (int i = 1; i < argc; i++)
    {
        if (strcmp(argv[i], "--verbose") == 0)
            verbose = true;
        else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc)
            configPath = argv[++i];
    }
    SetTraceLogLevel(verbose ? LOG_DEBUG : LOG_INFO);

    GameConfig config{};
    LoadConfig(configPath, config);

    InitWindow(SCREEN_WIDTH, SCREEN_HEIGHT, "whackgrid");
    SetTargetFPS(TARGET_FPS);

    GameSession session(config);

    // Frame the whole board from above and behind, then orbit its center
    float boardSize = (float)session.getGrid().getSize();
    Vector3 cameraStart = {0.0f, 6.0f + boardSize * 0.8f, -boardSize * 0.25f};
    OrbitCamera camera(cameraStart, {0.0f, 0.0f, 0.0f}, session.getConfig().orbitSpeed);

    UIManager uiManager;
    uiManager.addElement(new UIStatsPanel(&session, {20.0f, 20.0f}));
    uiManager.addElement(new UIPoolBar(&session));

    Color skyColor = SKY_COLOR;
    while (!WindowShouldClose())
    {
        float dt = GetFrameTime();

        if (IsKeyPressed(KEY_P))
            session.togglePause();
        if (IsKeyPressed(KEY_R))
            session.Restart();
        if (IsKeyPressed(KEY_F5))
            SaveConfig(configPath, session.getConfig());

        camera.update(dt);

        PointerInput frameInput(IsMouseButtonPressed(MOUSE_BUTTON_LEFT),
                                IsMouseButtonPressed(MOUSE_BUTTON_RIGHT),
                                camera.getPickRay(GetMousePosition()));
        UpdateContext uc(&session, frameInput, dt);
        session.Update(uc);

        const HitReport &hit = session.getLastHit();
        if (hit.kind == HitKind::Heavy && hit.landed)
            camera.addShake(0.15f, 0.2f);

        uiManager.update();

        BeginDrawing();
        ClearBackground(skyColor);
        BeginMode3D(camera.getCamera());
        session.DrawScene();
        EndMode3D();
        uiManager.draw();
        DrawText("LMB: light hit   RMB: heavy hit   P: pause   R: restart   F5: save config", 20, SCREEN_HEIGHT - 80, 18, GRAY);
        EndDrawing();
    }

    uiManager.cleanup();
    CloseWindow();
    return 0;
}
