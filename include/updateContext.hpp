#pragma once
#include <raylib.h>

// Forward declarations to avoid circular includes
class GameSession;

/**
 * @brief Snapshot of pointer input for a single frame.
 *
 * `lightPressed` / `heavyPressed` are the primary / secondary button edges.
 * `ray` is the pick ray through the pointer from the active camera.
 */
typedef struct PointerInput
{
    bool lightPressed;
    bool heavyPressed;
    Ray ray;
    PointerInput() : lightPressed(false), heavyPressed(false), ray{{0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}} {}
    PointerInput(bool _lightPressed, bool _heavyPressed, Ray _ray) : lightPressed(_lightPressed), heavyPressed(_heavyPressed), ray(_ray) {}
} PointerInput;

/**
 * @brief Context object passed into Update() functions each frame.
 *
 * Construct one per frame in `main()` and pass by reference to the session
 * and the systems it drives.
 */
typedef struct UpdateContext
{
    GameSession *const session;
    PointerInput pointerInput;
    float deltaSeconds;

    UpdateContext(GameSession *s, PointerInput pi, float dt) : session(s), pointerInput(pi), deltaSeconds(dt) {}
} UpdateContext;
