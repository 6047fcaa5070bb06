#include "Widget.hpp"

Widget::Widget(const std::string& title_, bool open) : title(title_), isOpen(open) {}
