/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "display.h"
#include <map>

namespace tg {

/**
 * Ncurses backend. Only one instance may exist at a time, ncurses is initialized
 * in the constructor and shut down in the destructor.
 */
class NcursesDisplay : public IDisplay {
public:
        NcursesDisplay ();
        NcursesDisplay (NcursesDisplay const &) = delete;
        NcursesDisplay &operator= (NcursesDisplay const &) = delete;
        NcursesDisplay (NcursesDisplay &&) noexcept = delete;
        NcursesDisplay &operator= (NcursesDisplay &&) noexcept = delete;
        ~NcursesDisplay () noexcept override;

        void print (Point const &pos, std::string_view str, Attributes const &attr) override;
        void clear () override;
        void refresh () override;

        void initColorPair (ColorPair id, int16_t fg, int16_t bg) override;
        int maxColorPairs () const override;

        Dimensions size () const override;
        Event poll (Timeout timeout) override;

        void moveCursor (Point const &pos) override;
        void showCursor (bool visible) override;
        void enableMouse (bool enabled) override;

private:
        Key translate (int chr) const;

        // Ctrl + arrow codes differ between terminals, they are looked up by name.
        std::map<int, Key> extendedKeys;
};

/**
 * Maps a raw ncurses key code to a Key. Codes without a mapping come back as
 * Key::unknown, plain characters as themselves.
 */
Key getKey (int chr);

/// Maps an ncurses button state to a MouseEvent.
MouseEvent getMouseEvent (unsigned long bstate);

} // namespace tg
