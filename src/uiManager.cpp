#include "uiManager.hpp"

UIManager::~UIManager()
{
    this->cleanup();
}

void UIManager::cleanup()
{
    for (auto &element : elements)
    {
        delete element;
    }
    elements.clear();
}

void UIManager::addElement(UIElement *element)
{
    if (element)
        this->elements.push_back(element);
}

void UIManager::update()
{
    for (auto &element : elements)
    {
        element->update();
    }
}

void UIManager::draw()
{
    for (auto &element : elements)
    {
        element->draw();
    }
}
