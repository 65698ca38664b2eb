/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "ncursesDisplay.h"
#include <clocale>
#include <string>

// Function versions only, the macros collide with member names (clear, refresh, move).
#define NCURSES_NOMACROS
#include <ncurses.h>

namespace tg {

NcursesDisplay::NcursesDisplay ()
{
        setlocale (LC_ALL, "");
        initscr ();
        curs_set (0);
        noecho ();
        cbreak ();
        start_color ();
        keypad (stdscr, true);
        set_escdelay (25);

        for (auto [name, key] : {std::pair{"kUP5", Key::ctrlUp}, std::pair{"kDN5", Key::ctrlDown}, std::pair{"kLFT5", Key::ctrlLeft},
                                 std::pair{"kRIT5", Key::ctrlRight}}) {
                if (int code = key_defined (name); code > 0) {
                        extendedKeys[code] = key;
                }
        }

        ::refresh ();
}

/****************************************************************************/

NcursesDisplay::~NcursesDisplay () noexcept
{
        mousemask (0, nullptr);
        ::erase ();
        ::refresh ();
        endwin ();
}

/****************************************************************************/

void NcursesDisplay::print (Point const &pos, std::string_view str, Attributes const &attr)
{
        int h = getmaxy (stdscr);
        int w = getmaxx (stdscr);

        if (pos.y () < 0 || pos.y () >= h || pos.x () >= w) {
                return;
        }

        // Clip to the screen in code points, ncurses fails on the whole string otherwise.
        std::string tmp;
        auto x = pos.x ();
        Coordinate start = -1;

        for (size_t i = 0; i < str.size ();) {
                size_t len = 1;
                while (i + len < str.size () && (static_cast<unsigned char> (str[i + len]) & 0xc0) == 0x80) {
                        ++len;
                }

                if (x >= 0 && x < w) {
                        if (start < 0) {
                                start = x;
                        }

                        tmp.append (str.substr (i, len));
                }

                ++x;
                i += len;
        }

        if (tmp.empty ()) {
                return;
        }

        attr_t a = COLOR_PAIR (attr.color) | ((attr.bold) ? (A_BOLD) : (A_NORMAL));
        attron (a);
        mvaddstr (pos.y (), start, tmp.c_str ());
        attroff (a);
}

/****************************************************************************/

void NcursesDisplay::clear () { ::erase (); }

void NcursesDisplay::refresh () { ::refresh (); }

/****************************************************************************/

void NcursesDisplay::initColorPair (ColorPair id, int16_t fg, int16_t bg) { init_pair (id, fg, bg); }

int NcursesDisplay::maxColorPairs () const { return COLOR_PAIRS; }

/****************************************************************************/

Dimensions NcursesDisplay::size () const { return {getmaxx (stdscr), getmaxy (stdscr)}; }

/****************************************************************************/

Event NcursesDisplay::poll (Timeout timeout)
{
        ::timeout ((timeout) ? (int (timeout->count ())) : (-1));
        int chr = getch ();

        if (chr == ERR) {
                return std::monostate{};
        }

        if (chr == KEY_RESIZE) {
                return ResizeEvent{size ()};
        }

        if (chr == KEY_MOUSE) {
                MEVENT ev{};

                if (getmouse (&ev) != OK) {
                        return std::monostate{};
                }

                return MouseInput{{ev.x, ev.y}, getMouseEvent (ev.bstate)};
        }

        return KeyEvent{translate (chr)};
}

/****************************************************************************/

void NcursesDisplay::moveCursor (Point const &pos) { ::move (pos.y (), pos.x ()); }

void NcursesDisplay::showCursor (bool visible) { curs_set ((visible) ? (1) : (0)); }

void NcursesDisplay::enableMouse (bool enabled)
{
        if (enabled) {
                mousemask (ALL_MOUSE_EVENTS, nullptr);
        }
        else {
                mousemask (0, nullptr);
        }
}

/****************************************************************************/

Key NcursesDisplay::translate (int chr) const
{
        if (auto i = extendedKeys.find (chr); i != extendedKeys.cend ()) {
                return i->second;
        }

        return getKey (chr);
}

/****************************************************************************/

Key getKey (int chr)
{
        switch (chr) {
        case KEY_UP:
                return Key::up;

        case KEY_DOWN:
                return Key::down;

        case KEY_LEFT:
                return Key::left;

        case KEY_RIGHT:
                return Key::right;

        case KEY_HOME:
                return Key::home;

        case KEY_END:
                return Key::end;

        case KEY_PPAGE:
                return Key::pageUp;

        case KEY_NPAGE:
                return Key::pageDown;

        case KEY_DC:
                return Key::del;

        case KEY_IC:
                return Key::insert;

        case KEY_BTAB:
                return Key::shiftTab;

        case KEY_BACKSPACE:
        case 8:
        case 127:
                return Key::backspace;

        case KEY_ENTER:
        case '\r':
        case '\n':
                return Key::enter;

        case '\t':
                return Key::tab;

        case 27:
                return Key::escape;

        default:
                break;
        }

        if (chr >= KEY_F (1) && chr <= KEY_F (8)) {
                return Key (int32_t (Key::f1) + chr - KEY_F (1));
        }

        if (chr >= 32 && chr < 127) {
                return Key (chr);
        }

        return Key::unknown;
}

/****************************************************************************/

MouseEvent getMouseEvent (unsigned long bstate)
{
        if (bstate & BUTTON1_CLICKED) {
                return MouseEvent::leftClick;
        }

        if (bstate & BUTTON1_DOUBLE_CLICKED) {
                return MouseEvent::leftDoubleClick;
        }

        if (bstate & BUTTON1_TRIPLE_CLICKED) {
                return MouseEvent::leftTripleClick;
        }

        if (bstate & BUTTON1_PRESSED) {
                return MouseEvent::leftPress;
        }

        if (bstate & BUTTON1_RELEASED) {
                return MouseEvent::leftRelease;
        }

        if (bstate & BUTTON2_CLICKED) {
                return MouseEvent::middleClick;
        }

        if (bstate & BUTTON3_CLICKED) {
                return MouseEvent::rightClick;
        }

        if (bstate & BUTTON3_DOUBLE_CLICKED) {
                return MouseEvent::rightDoubleClick;
        }

        if (bstate & BUTTON3_PRESSED) {
                return MouseEvent::rightPress;
        }

        if (bstate & BUTTON3_RELEASED) {
                return MouseEvent::rightRelease;
        }

        return MouseEvent::unknown;
}

} // namespace tg
