/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "textEditor.h"
#include <algorithm>

namespace tg {

TextEditor::TextEditor (std::string initialText, bool password, Logger logger)
    : logger{orNull (std::move (logger))}, text{std::move (initialText)}, password{password}
{
        cursor = text.size ();
}

/****************************************************************************/

void TextEditor::setText (std::string t)
{
        text = std::move (t);
        cursor = std::min (cursor, text.size ());
}

/****************************************************************************/

void TextEditor::clear ()
{
        text.clear ();
        cursor = 0;
}

/****************************************************************************/

void TextEditor::setViewport (Coordinate l, Coordinate row, Dimension width)
{
        left = l;
        y = row;
        viewportWidth_ = std::max (width, 0);
}

/****************************************************************************/

size_t TextEditor::viewportOffset () const
{
        auto w = size_t (viewportWidth_);
        return (cursor > w) ? (cursor - w) : (0);
}

/*--------------------------------------------------------------------------*/

Point TextEditor::cursorPosition () const { return {left + Coordinate (cursor - viewportOffset ()), y}; }

/*--------------------------------------------------------------------------*/

std::string TextEditor::visibleText () const
{
        auto visible = text.substr (std::min (viewportOffset (), text.size ()), size_t (viewportWidth_));

        if (password) {
                return std::string (visible.size (), '*');
        }

        return visible;
}

/****************************************************************************/

void TextEditor::moveLeft ()
{
        if (cursor > 0) {
                --cursor;
        }
}

void TextEditor::moveRight ()
{
        if (cursor < text.size ()) {
                ++cursor;
        }
}

/*--------------------------------------------------------------------------*/

void TextEditor::insertChar (char c)
{
        text.insert (cursor, 1, c);
        ++cursor;
}

/*--------------------------------------------------------------------------*/

void TextEditor::eraseChar ()
{
        if (cursor == 0) {
                return;
        }

        text.erase (cursor - 1, 1);
        --cursor;
}

void TextEditor::deleteChar ()
{
        if (cursor < text.size ()) {
                text.erase (cursor, 1);
        }
}

/*--------------------------------------------------------------------------*/

void TextEditor::jumpToStart () { cursor = 0; }

void TextEditor::jumpToEnd () { cursor = text.size (); }

/****************************************************************************/

bool TextEditor::handleKey (Key key)
{
        switch (key) {
        case Key::left:
                moveLeft ();
                return true;

        case Key::right:
                moveRight ();
                return true;

        case Key::backspace:
                eraseChar ();
                return true;

        case Key::del:
                deleteChar ();
                return true;

        case Key::home:
                jumpToStart ();
                return true;

        case Key::end:
                jumpToEnd ();
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
