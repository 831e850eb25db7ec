#include "Widget.hpp"

Widget::Widget(const std::string& title, bool startOpen) : title(title), isOpen(startOpen) {}

bool Widget::isVisible() const { return isOpen; }
void Widget::setVisible(bool visible) { isOpen = visible; }
void Widget::toggle() { isOpen = !isOpen; }

const std::string& Widget::getTitle() const { return title; }
