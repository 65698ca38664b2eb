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
#include <vector>

namespace tg {

/**
 * Multi line text editing state. The cursor addresses a character by (column, line),
 * the visible window is viewport.width x viewport.height characters starting at
 * viewportStart. The window follows the cursor one step at a time, except for home
 * and end which set the horizontal offset directly.
 */
class TextBlockEditor {
public:
        explicit TextBlockEditor (std::string_view initialText = {}, Logger logger = {});

        /// All lines, each followed by a newline.
        std::string get () const;

        /// Appends text as new lines (replaces the single empty line of an empty editor).
        void write (std::string_view text);
        void clear ();

        /// Replaces the text and moves the cursor and the viewport home.
        void setText (std::string_view text);

        std::vector<std::string> const &lines () const { return lines_; }
        std::string const &currentLine () const { return lines_.at (row); }
        void setCurrentLine (std::string line);

        /// Screen placement, set by the owning element on every layout.
        void setViewport (Point const &origin, Dimensions const &size);
        Dimensions viewport () const { return viewport_; }

        /// (column, line) of the cursor in the text.
        Point cursorTextPos () const { return {column, row}; }

        /// (column, line) of the top left visible character.
        Point viewportStart () const { return {viewportX, viewportY}; }

        /// Screen position of the cursor.
        Point cursorPosition () const;

        /// Visible part of the visible lines, viewport.height entries at most.
        std::vector<std::string> visibleLines () const;

        void moveLeft ();
        void moveRight ();
        void moveUp ();
        void moveDown ();

        void handleNewline ();
        void handleBackspace ();
        void handleDelete ();
        void handleHome ();
        void handleEnd ();
        void insertChar (char c);

        /// Editing and navigation keys. Returns false for keys it does not use.
        bool handleKey (Key key);

protected:
        Logger logger;

private:
        /// Moves the viewport the least needed to show the cursor.
        void scrollToCursor ();
        Coordinate lineLength (Coordinate line) const { return Coordinate (lines_.at (line).size ()); }

        std::vector<std::string> lines_{""};
        Coordinate column{};
        Coordinate row{};
        Coordinate viewportX{};
        Coordinate viewportY{};
        Point origin{};
        Dimensions viewport_{};
};

} // namespace tg
