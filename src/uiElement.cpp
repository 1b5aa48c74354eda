#include "uiElement.hpp"
#include <raymath.h>
#include <cmath>
#include "gameSession.hpp"

UIPoolBar::UIPoolBar(GameSession *sessionRef, float width, float height)
{
    this->session = sessionRef;
    this->size = {width, height};
    this->position = {margin, 0.0f};
}

void UIPoolBar::setMargin(float marginPixels)
{
    this->margin = marginPixels;
}

void UIPoolBar::setColors(Color base, Color fill, Color outline)
{
    this->baseColor = base;
    this->fillColor = fill;
    this->outlineColor = outline;
}

void UIPoolBar::update()
{
    float percent = 0.0f;
    if (this->session && this->session->getPool().size() > 0)
    {
        EnemyPool &pool = this->session->getPool();
        percent = static_cast<float>(pool.activeCount()) / static_cast<float>(pool.size());
    }
    this->displayedPercent = Clamp(percent, 0.0f, 1.0f);
}

void UIPoolBar::draw()
{
    // Anchored to the bottom-left corner, label above the bar
    this->position = {this->margin, (float)GetScreenHeight() - this->margin - this->size.y};
    Rectangle bar = this->getBounds();

    DrawRectangleRec(bar, this->baseColor);
    DrawRectangleRec({bar.x, bar.y, bar.width * this->displayedPercent, bar.height}, this->fillColor);
    if (this->outlineThickness > 0.0f)
        DrawRectangleLinesEx(bar, this->outlineThickness, this->outlineColor);

    int percentLabel = (int)roundf(this->displayedPercent * 100.0f);
    DrawText(TextFormat("Pool in use: %d%%", percentLabel), (int)bar.x, (int)bar.y - 20, 18, RAYWHITE);
}

UIStatsPanel::UIStatsPanel(GameSession *sessionRef, Vector2 _position, int _fontSize)
{
    this->session = sessionRef;
    this->position = _position;
    this->fontSize = _fontSize;
    this->size = {260.0f, (float)(_fontSize * 4)};
}

void UIStatsPanel::update()
{
    if (!this->session)
        return;
    const SpawnStats &stats = this->session->getStats();
    this->spawned = stats.spawned;
    this->killed = stats.killed;
    this->onBoard = this->session->getPool().activeCount();
    this->poolSize = this->session->getPool().size();
    this->freeCells = this->session->getGrid().freeCount();
    this->paused = this->session->getState() == GameState::STOP;
}

void UIStatsPanel::draw()
{
    int x = (int)this->position.x;
    int y = (int)this->position.y;
    DrawText(TextFormat("Spawned: %d  Killed: %d", this->spawned, this->killed), x, y, this->fontSize, RAYWHITE);
    DrawText(TextFormat("On board: %d / %d", this->onBoard, this->poolSize), x, y + this->fontSize, this->fontSize, RAYWHITE);
    DrawText(TextFormat("Free cells: %d", this->freeCells), x, y + this->fontSize * 2, this->fontSize, RAYWHITE);
    if (this->paused)
        DrawText("PAUSED (P)", x, y + this->fontSize * 3, this->fontSize, YELLOW);
}
