#pragma once
#include <vector>
#include "uiElement.hpp"

/**
 * @brief Owns HUD elements and updates / draws them in insertion order.
 */
class UIManager
{
public:
    UIManager() {}
    ~UIManager();

    UIManager(const UIManager &) = delete;
    UIManager &operator=(const UIManager &) = delete;

    void addElement(UIElement *element);
    void update();
    void draw();
    void cleanup();

    size_t elementCount() const { return this->elements.size(); }

private:
    std::vector<UIElement *> elements;
};
