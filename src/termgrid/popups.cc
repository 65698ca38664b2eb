/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "popups.h"
#include "widgets.h"
#include <algorithm>
#include <fmt/format.h>

namespace tg {

Popup::Popup (IRoot &root, std::string title, std::string text, ColorPair color, Logger logger)
    : UIElement{0, std::move (title), std::move (logger)}, root{root}, text_{std::move (text)}
{
        setColor (color);
        alignment = Alignment::center;
        helpText_ = "Popup. Press Esc to close.";
        UIElement::updateHeightWidth ();
}

/****************************************************************************/

Point Popup::absoluteStartPos () const
{
        auto size = root.absoluteSize ();
        return {size.width / 4, size.height / 3};
}

Point Popup::absoluteStopPos () const
{
        auto size = root.absoluteSize ();
        return {3 * size.width / 4, 2 * size.height / 3};
}

/****************************************************************************/

void Popup::close ()
{
        if (closed) {
                return;
        }

        closed = true;
        logger->debug ("[Popup] '{}' closed", title_);

        if (!nested) {
                root.closePopup ();
        }
}

/****************************************************************************/

void Popup::drawFrame (Renderer &r) const
{
        r.setColorMode (color_);
        r.drawBorder (*this, true, true);
}

/****************************************************************************/
/* MessagePopup                                                             */
/****************************************************************************/

MessagePopup::MessagePopup (IRoot &root, std::string title, std::string text, ColorPair color, Logger logger)
    : Popup{root, std::move (title), std::move (text), color, std::move (logger)}
{
        helpText_ = "Message popup. Press Enter, Space or Esc to close.";
}

/*--------------------------------------------------------------------------*/

void MessagePopup::handleKeyPress (Key key)
{
        if (key == Key::enter || key == Key::space || key == Key::escape) {
                close ();
        }
}

/*--------------------------------------------------------------------------*/

void MessagePopup::draw (Renderer &r)
{
        drawFrame (r);
        r.drawText (*this, text_, startPosition ().y () + height () / 2, alignment);
        r.unsetColorMode ();
}

/****************************************************************************/
/* YesNoPopup                                                               */
/****************************************************************************/

YesNoPopup::YesNoPopup (IRoot &root, std::string title, ColorPair color, Command command, Logger logger)
    : Popup{root, std::move (title), "y/n", color, std::move (logger)}, command{std::move (command)}
{
        helpText_ = "Yes/No popup. Press y to confirm, n to deny, Esc to close.";
}

/*--------------------------------------------------------------------------*/

void YesNoPopup::answer (bool yes)
{
        // The popup is only retired by close, so the members are still valid below.
        close ();

        if (command) {
                command (yes);
        }
        else {
                root.showWarningPopup ("No command", "The Yes/No popup had no command");
        }
}

/*--------------------------------------------------------------------------*/

void YesNoPopup::handleKeyPress (Key key)
{
        switch (key) {
        case Key::yLower:
        case Key::yUpper:
                answer (true);
                break;

        case Key::nLower:
        case Key::nUpper:
                answer (false);
                break;

        case Key::escape:
                close ();
                break;

        default:
                break;
        }
}

/*--------------------------------------------------------------------------*/

void YesNoPopup::draw (Renderer &r)
{
        drawFrame (r);
        r.drawText (*this, text_, startPosition ().y () + height () / 2, alignment);
        r.unsetColorMode ();
}

/****************************************************************************/
/* TextBoxPopup                                                             */
/****************************************************************************/

TextBoxPopup::TextBoxPopup (IRoot &root, std::string title, ColorPair color, Command command, bool password, Logger logger)
    : Popup{root, std::move (title), {}, color, logger}, editor_{{}, password, logger}, command{std::move (command)}
{
        helpText_ = "Text box popup. Type, Enter to submit, Esc to cancel.";
        updateHeightWidth ();
}

/*--------------------------------------------------------------------------*/

void TextBoxPopup::updateHeightWidth ()
{
        Popup::updateHeightWidth ();
        editor_.setViewport (startPosition ().x () + padx + 2, startPosition ().y () + height () / 2, Renderer::textWidth (*this) - 1);
}

/*--------------------------------------------------------------------------*/

void TextBoxPopup::handleKeyPress (Key key)
{
        if (key == Key::escape) {
                close ();
                return;
        }

        if (key == Key::enter) {
                auto text = editor_.get ();
                close ();

                if (command) {
                        command (text);
                }

                return;
        }

        editor_.handleKey (key);
}

/*--------------------------------------------------------------------------*/

void TextBoxPopup::draw (Renderer &r)
{
        drawFrame (r);
        r.drawText (*this, editor_.visibleText (), editor_.cursorPosition ().y ());
        r.drawCursor (editor_.cursorPosition ());
        r.unsetColorMode ();
}

/****************************************************************************/
/* MenuPopup                                                                */
/****************************************************************************/

MenuPopup::MenuPopup (IRoot &root, std::vector<std::string> const &items, std::string title, ColorPair color, Command command,
                      bool runCommandIfNone, Logger logger)
    : Popup{root, std::move (title), {}, color, logger}, list_{logger}, command{std::move (command)}, runCommandIfNone{runCommandIfNone}
{
        list_.addItemList (items);
        alignment = Alignment::left;
        selectedColor_ = colors::blackOnWhite;
        helpText_ = "Menu popup. Use up/down to scroll, Enter to select, Esc to close.";
}

/*--------------------------------------------------------------------------*/

void MenuPopup::handleKeyPress (Key key)
{
        if (detail::scrollList (list_, key, viewportHeight ())) {
                return;
        }

        if (key == Key::enter) {
                auto item = list_.get ();
                close ();

                if (command) {
                        command (item);
                }
        }
        else if (key == Key::escape) {
                close ();

                if (runCommandIfNone && command) {
                        command (std::nullopt);
                }
        }
}

/*--------------------------------------------------------------------------*/

void MenuPopup::handleMousePress (Point const &pos, MouseEvent event)
{
        Popup::handleMousePress (pos, event);

        if (event == MouseEvent::leftClick) {
                detail::clickList (*this, list_, pos);
        }
}

/*--------------------------------------------------------------------------*/

void MenuPopup::draw (Renderer &r)
{
        drawFrame (r);
        detail::drawList (r, *this, list_);
        r.unsetColorMode ();
}

/****************************************************************************/
/* Loading                                                                  */
/****************************************************************************/

LoadingIconPopup::LoadingIconPopup (IRoot &root, std::string title, std::string message, ColorPair color, Logger logger)
    : Popup{root, std::move (title), std::move (message), color, std::move (logger)}
{
        helpText_ = "Loading...";
}

/*--------------------------------------------------------------------------*/

void LoadingIconPopup::draw (Renderer &r)
{
        if (!root.isLoading ()) {
                close ();
        }

        drawFrame (r);
        auto icon = icons.at (size_t (frame_) % icons.size ());
        r.drawText (*this, fmt::format ("{} ... {}", text_, icon), startPosition ().y () + height () / 2, alignment);
        r.unsetColorMode ();
        ++frame_;
}

/*--------------------------------------------------------------------------*/

LoadingBarPopup::LoadingBarPopup (IRoot &root, std::string title, int numItems, ColorPair color, Logger logger)
    : Popup{root, std::move (title), {}, color, std::move (logger)}, total{std::max (numItems, 1)}
{
        helpText_ = "Loading...";
}

/*--------------------------------------------------------------------------*/

std::string LoadingBarPopup::generateBar (Dimension width, int done) const
{
        done = std::clamp (done, 0, total);
        auto suffix = fmt::format (" ({}/{})", done, total);
        auto barWidth = std::max (width - int (suffix.size ()), 0);
        auto filled = barWidth * done / total;
        return std::string (filled, '#') + std::string (barWidth - filled, '-') + suffix;
}

/*--------------------------------------------------------------------------*/

void LoadingBarPopup::draw (Renderer &r)
{
        auto done = root.loadingProgress ();

        if (done >= total) {
                root.stopLoadingPopup ();
        }

        if (!root.isLoading ()) {
                close ();
        }

        drawFrame (r);
        auto icon = LoadingIconPopup::icons.at (size_t (frame_++) % LoadingIconPopup::icons.size ());
        r.drawText (*this, fmt::format ("{} {}", title_, icon), startPosition ().y () + height () / 2 - 1, alignment);
        r.drawText (*this, generateBar (Renderer::textWidth (*this), done), startPosition ().y () + height () / 2, Alignment::left);
        r.unsetColorMode ();
}

} // namespace tg
