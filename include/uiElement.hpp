#pragma once
#include <raylib.h>
#include "constant.hpp"

class GameSession;

/**
 * @brief Base class for on-screen 2D UI widgets.
 *
 * Derive from UIElement and implement `draw()` and `update()`. Position and
 * size are in screen pixels. UIManager owns elements added to its list.
 */
class UIElement
{
public:
    UIElement() {}
    virtual ~UIElement()
    {
    }

    /**
     * @brief Draw the element. Called every frame by the UI manager.
     */
    virtual void draw() = 0;

    /**
     * @brief Update element state from the session.
     */
    virtual void update() = 0;

    virtual Rectangle getBounds() const
    {
        return {position.x, position.y, size.x, size.y};
    }

protected:
    Vector2 position = {0.0f, 0.0f};
    Vector2 size = {0.0f, 0.0f};
};

/**
 * @brief Bar showing how much of the enemy pool is currently on the board.
 */
class UIPoolBar : public UIElement
{
public:
    UIPoolBar(GameSession *session, float width = 280.0f, float height = 20.0f);
    ~UIPoolBar() override = default;

    void setMargin(float marginPixels);
    void setColors(Color base, Color fill, Color outline);

    void update() override;
    void draw() override;

    float getDisplayedPercent() const { return this->displayedPercent; }

private:
    GameSession *session = nullptr;
    float margin = 20.0f;
    float outlineThickness = 2.0f;
    Color baseColor{60, 60, 60, 255};
    Color fillColor{230, 41, 55, 255};
    Color outlineColor{0, 0, 0, 255};
    float displayedPercent = 0.0f;
};

/**
 * @brief Text block with spawn counters and the current game state.
 */
class UIStatsPanel : public UIElement
{
public:
    UIStatsPanel(GameSession *session, Vector2 position, int fontSize = 20);
    ~UIStatsPanel() override = default;

    void update() override;
    void draw() override;

private:
    GameSession *session = nullptr;
    int fontSize;
    int spawned = 0;
    int killed = 0;
    int onBoard = 0;
    int poolSize = 0;
    int freeCells = 0;
    bool paused = false;
};
