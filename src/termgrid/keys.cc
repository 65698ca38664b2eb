/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "keys.h"
#include <array>

namespace tg {

std::string_view keyName (Key k)
{
        static constexpr std::array printable = [] {
                std::array<char, 95> ret{};

                for (int i = 0; i < int (ret.size ()); ++i) {
                        ret.at (i) = char (32 + i);
                }

                return ret;
        }();

        if (isPrintable (k)) {
                return {&printable.at (int (k) - 32), 1};
        }

        switch (k) {
        case Key::tab:
                return "tab";
        case Key::enter:
                return "enter";
        case Key::escape:
                return "escape";
        case Key::backspace:
                return "backspace";
        case Key::up:
                return "up";
        case Key::down:
                return "down";
        case Key::left:
                return "left";
        case Key::right:
                return "right";
        case Key::ctrlUp:
                return "ctrl+up";
        case Key::ctrlDown:
                return "ctrl+down";
        case Key::ctrlLeft:
                return "ctrl+left";
        case Key::ctrlRight:
                return "ctrl+right";
        case Key::shiftTab:
                return "shift+tab";
        case Key::home:
                return "home";
        case Key::end:
                return "end";
        case Key::pageUp:
                return "page up";
        case Key::pageDown:
                return "page down";
        case Key::del:
                return "delete";
        case Key::insert:
                return "insert";
        case Key::f1:
                return "F1";
        case Key::f2:
                return "F2";
        case Key::f3:
                return "F3";
        case Key::f4:
                return "F4";
        case Key::f5:
                return "F5";
        case Key::f6:
                return "F6";
        case Key::f7:
                return "F7";
        case Key::f8:
                return "F8";
        default:
                return "unknown";
        }
}

} // namespace tg
