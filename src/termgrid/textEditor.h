/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "geometry.h"
#include "keys.h"
#include "logging.h"
#include <string>
#include <string_view>

namespace tg {

/**
 * Single line text editing state. The text is shown in a viewport W columns wide
 * starting at (left, y). The cursor moves on the screen while it fits in the
 * viewport; past that it stays at the right edge and the text scrolls instead.
 */
class TextEditor {
public:
        explicit TextEditor (std::string initialText = {}, bool password = false, Logger logger = {});

        std::string const &get () const { return text; }

        /// Replaces the text. The cursor keeps its index unless the new text is shorter.
        void setText (std::string t);
        void clear ();

        bool isPassword () const { return password; }
        void setPassword (bool p) { password = p; }

        /// Screen placement of the text, set by the owning element on every layout.
        void setViewport (Coordinate left, Coordinate y, Dimension width);
        Dimension viewportWidth () const { return viewportWidth_; }

        size_t cursorTextPos () const { return cursor; }

        /// Screen position of the cursor.
        Point cursorPosition () const;

        /// Index of the first visible character.
        size_t viewportOffset () const;

        /// The part of the text visible in the viewport (asterisks in password mode).
        std::string visibleText () const;

        void moveLeft ();
        void moveRight ();
        void insertChar (char c);

        /// Backspace.
        void eraseChar ();

        /// Delete, removes the character under the cursor.
        void deleteChar ();
        void jumpToStart ();
        void jumpToEnd ();

        /**
         * Editing keys (arrows, home, end, backspace, delete, printable characters).
         * Returns false for keys it does not use.
         */
        bool handleKey (Key key);

protected:
        Logger logger;

private:
        std::string text;
        size_t cursor{};
        bool password;
        Coordinate left{};
        Coordinate y{};
        Dimension viewportWidth_{};
};

} // namespace tg
