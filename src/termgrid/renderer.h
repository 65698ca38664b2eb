/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "colors.h"
#include "display.h"
#include <optional>
#include <span>
#include <string_view>

namespace tg {

class UIElement;

enum class Alignment { left, center, right };

/**
 * Draws borders, text and the cursor on behalf of elements. Elements never talk to
 * the display directly.
 */
class Renderer {
public:
        explicit Renderer (IDisplay &display, BorderCharacters const &borders = borders::ascii) : display_{display}, borders_{borders} {}

        IDisplay &display () { return display_; }

        void setBorderCharacters (BorderCharacters const &b) { borders_ = b; }
        BorderCharacters const &borderCharacters () const { return borders_; }

        void setColorMode (ColorPair c) { color = c; }
        void unsetColorMode () { color = colors::whiteOnBlack; }
        ColorPair colorMode () const { return color; }

        void setBold (bool b) { bold = b; }

        /// Rules used by the following drawText calls.
        void setColorRules (std::span<ColorRule const> r) { rules = r; }
        void resetColorRules () { rules = {}; }

        /**
         * Frame around the element (minus its padding) in the current color. fill blanks
         * the interior, withTitle puts the title into the top edge if it fits.
         */
        void drawBorder (UIElement const &element, bool fill = true, bool withTitle = true);

        /// Same, for an arbitrary rectangle.
        void drawFrame (Rect const &rect, std::string_view title, bool fill = true, bool withTitle = true);

        /**
         * One line of text inside the element at absolute row y. The text is cut to the
         * element's inner width starting at startPos and aligned. bordered draws the side
         * edges of the frame as well. Selected lines use the element's selected color.
         */
        void drawText (UIElement const &element, std::string_view line, Coordinate y, Alignment alignment = Alignment::left,
                       bool bordered = true, bool selected = false, int startPos = 0);

        /// Inner width drawText uses for an element.
        static Dimension textWidth (UIElement const &element, bool bordered = true);

        /// Requests the terminal cursor at pos after the frame is drawn.
        void drawCursor (Point const &pos) { cursor_ = pos; }

        /// Hides the cursor (it was requested by some other element).
        void resetCursor () { cursor_.reset (); }

        std::optional<Point> const &cursor () const { return cursor_; }

        /// Plain print in the current color mode.
        void print (Point const &pos, std::string_view str) { display_.print (pos, str, {color, bold}); }

private:
        IDisplay &display_;
        BorderCharacters borders_;
        ColorPair color{colors::whiteOnBlack};
        bool bold{};
        std::span<ColorRule const> rules;
        std::optional<Point> cursor_;
};

namespace detail {
        /// Cuts str to len columns and pads it with spaces according to alignment.
        std::string align (std::string_view str, Dimension len, Alignment alignment);
} // namespace detail

} // namespace tg
