/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "textBlockEditor.h"
#include <algorithm>

namespace tg {

namespace {
        /// Lines of text without the terminators. A trailing newline does not start a new line.
        std::vector<std::string> splitLines (std::string_view text)
        {
                std::vector<std::string> ret;
                size_t start{};

                while (start < text.size ()) {
                        auto end = text.find ('\n', start);

                        if (end == std::string_view::npos) {
                                end = text.size ();
                        }

                        auto line = text.substr (start, end - start);

                        if (line.ends_with ('\r')) {
                                line.remove_suffix (1);
                        }

                        ret.emplace_back (line);
                        start = end + 1;
                }

                return ret;
        }
} // namespace

/****************************************************************************/

TextBlockEditor::TextBlockEditor (std::string_view initialText, Logger logger) : logger{orNull (std::move (logger))}
{
        setText (initialText);
}

/****************************************************************************/

std::string TextBlockEditor::get () const
{
        std::string ret;

        for (auto const &l : lines_) {
                ret += l;
                ret += '\n';
        }

        return ret;
}

/****************************************************************************/

void TextBlockEditor::write (std::string_view text)
{
        auto newLines = splitLines (text);

        if (newLines.empty ()) {
                return;
        }

        if (lines_.size () == 1 && lines_.front ().empty ()) {
                lines_ = std::move (newLines);
                return;
        }

        lines_.insert (lines_.end (), newLines.begin (), newLines.end ());
}

/****************************************************************************/

void TextBlockEditor::clear ()
{
        lines_.assign (1, std::string{});
        column = row = viewportX = viewportY = 0;
}

/****************************************************************************/

void TextBlockEditor::setText (std::string_view text)
{
        lines_ = splitLines (text);

        if (lines_.empty ()) {
                lines_.emplace_back ();
        }

        column = row = viewportX = viewportY = 0;
}

/****************************************************************************/

void TextBlockEditor::setCurrentLine (std::string line)
{
        lines_.at (row) = std::move (line);
        column = std::min (column, lineLength (row));
        scrollToCursor ();
}

/****************************************************************************/

void TextBlockEditor::setViewport (Point const &o, Dimensions const &size)
{
        origin = o;
        viewport_ = {std::max (size.width, 0), std::max (size.height, 0)};
        scrollToCursor ();
}

/****************************************************************************/

Point TextBlockEditor::cursorPosition () const { return origin + Point (column - viewportX, row - viewportY); }

/****************************************************************************/

std::vector<std::string> TextBlockEditor::visibleLines () const
{
        std::vector<std::string> ret;

        for (auto i = viewportY; i < Coordinate (lines_.size ()) && i < viewportY + viewport_.height; ++i) {
                auto const &l = lines_.at (i);
                ret.push_back ((viewportX < Coordinate (l.size ())) ? (l.substr (viewportX, viewport_.width)) : (std::string{}));
        }

        return ret;
}

/****************************************************************************/

void TextBlockEditor::scrollToCursor ()
{
        if (row < viewportY) {
                viewportY = row;
        }
        else if (viewport_.height > 0 && row >= viewportY + viewport_.height) {
                viewportY = row - viewport_.height + 1;
        }

        // The cursor may sit one past the last visible column (end of a full line).
        if (column < viewportX) {
                viewportX = column;
        }
        else if (column > viewportX + viewport_.width) {
                viewportX = column - viewport_.width;
        }
}

/****************************************************************************/

void TextBlockEditor::moveLeft ()
{
        if (column > 0) {
                --column;
                scrollToCursor ();
        }
}

void TextBlockEditor::moveRight ()
{
        if (column < lineLength (row)) {
                ++column;
                scrollToCursor ();
        }
}

/*--------------------------------------------------------------------------*/

void TextBlockEditor::moveUp ()
{
        if (row > 0) {
                --row;
                column = std::min (column, lineLength (row));
                scrollToCursor ();
        }
}

void TextBlockEditor::moveDown ()
{
        if (row < Coordinate (lines_.size ()) - 1) {
                ++row;
                column = std::min (column, lineLength (row));
                scrollToCursor ();
        }
}

/****************************************************************************/

void TextBlockEditor::handleNewline ()
{
        auto &current = lines_.at (row);
        std::string rest = current.substr (column);
        current.erase (column);
        lines_.insert (lines_.begin () + row + 1, std::move (rest));
        ++row;
        column = 0;
        viewportX = 0;
        scrollToCursor ();
}

/*--------------------------------------------------------------------------*/

void TextBlockEditor::handleBackspace ()
{
        if (column == 0) {
                if (row == 0) {
                        return;
                }

                // Join with the previous line.
                auto current = std::move (lines_.at (row));
                lines_.erase (lines_.begin () + row);
                --row;
                column = lineLength (row);
                lines_.at (row) += current;
        }
        else {
                lines_.at (row).erase (column - 1, 1);
                --column;
        }

        scrollToCursor ();
}

/*--------------------------------------------------------------------------*/

void TextBlockEditor::handleDelete ()
{
        if (column < lineLength (row)) {
                lines_.at (row).erase (column, 1);
                return;
        }

        if (row < Coordinate (lines_.size ()) - 1) {
                lines_.at (row) += lines_.at (row + 1);
                lines_.erase (lines_.begin () + row + 1);
        }
}

/*--------------------------------------------------------------------------*/

void TextBlockEditor::handleHome ()
{
        column = 0;
        viewportX = 0;
}

void TextBlockEditor::handleEnd ()
{
        column = lineLength (row);
        viewportX = std::max (0, column - viewport_.width);
}

/*--------------------------------------------------------------------------*/

void TextBlockEditor::insertChar (char c)
{
        lines_.at (row).insert (size_t (column), 1, c);
        ++column;
        scrollToCursor ();
}

/****************************************************************************/

bool TextBlockEditor::handleKey (Key key)
{
        switch (key) {
        case Key::left:
                moveLeft ();
                return true;

        case Key::right:
                moveRight ();
                return true;

        case Key::up:
                moveUp ();
                return true;

        case Key::down:
                moveDown ();
                return true;

        case Key::enter:
                handleNewline ();
                return true;

        case Key::backspace:
                handleBackspace ();
                return true;

        case Key::del:
                handleDelete ();
                return true;

        case Key::home:
                handleHome ();
                return true;

        case Key::end:
                handleEnd ();
                return true;

        default:
                break;
        }

        if (isPrintable (key)) {
                insertChar (toChar (key));
                return true;
        }

        return false;
}

} // namespace tg
