/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "widgets.h"
#include "errors.h"
#include <fmt/format.h>

namespace tg {

Widget::Widget (WidgetId id, std::string title, Grid const *grid, Placement const &placement, Logger logger)
    : UIElement{id, std::move (title), std::move (logger)}, grid_{grid}, placement_{placement}
{
        if (grid_ == nullptr) {
                throw MissingParentError (fmt::format ("Widget '{}' has no grid", title_));
        }

        auto const &p = placement_;

        if (!grid_->contains (p.row, p.column, p.rowSpan, p.columnSpan)) {
                throw OutOfBoundsError (fmt::format ("Widget '{}' at ({}, {}) spanning ({}, {}) does not fit in a {}x{} grid", title_, p.row,
                                                     p.column, p.rowSpan, p.columnSpan, grid_->rows (), grid_->columns ()));
        }

        padx = p.padx;
        pady = p.pady;
        selectedColor_ = colors::blackOnGreen;
        UIElement::updateHeightWidth ();
}

/****************************************************************************/

Point Widget::absoluteStartPos () const
{
        auto const &p = placement_;
        return grid_->cellRect (p.row, p.column, p.rowSpan, p.columnSpan).origin;
}

Point Widget::absoluteStopPos () const
{
        auto const &p = placement_;
        return grid_->cellRect (p.row, p.column, p.rowSpan, p.columnSpan).stop ();
}

/****************************************************************************/

bool Widget::isRowColumnInside (Dimension row, Dimension column) const
{
        auto const &p = placement_;
        return p.row <= row && row < p.row + p.rowSpan && p.column <= column && column < p.column + p.columnSpan;
}

/****************************************************************************/

void Widget::handleKeyPress (Key key)
{
        if (auto i = keyCommands.find (key); i != keyCommands.cend ()) {
                logger->debug ("[{}] Key command for {}", title_, keyName (key));
                auto command = i->second;
                command ();
        }
}

/*--------------------------------------------------------------------------*/

void Widget::handleMousePress (Point const &pos, MouseEvent event)
{
        UIElement::handleMousePress (pos, event);

        if (auto i = mouseCommands.find (event); i != mouseCommands.cend ()) {
                i->second ();
        }
}

/*--------------------------------------------------------------------------*/

void Widget::addKeyCommand (Key key, std::function<void ()> command) { keyCommands[key] = std::move (command); }

void Widget::addMouseCommand (MouseEvent event, std::function<void ()> command) { mouseCommands[event] = std::move (command); }

/****************************************************************************/

void Widget::beginDraw (Renderer &r, bool withBorder, bool withTitle) const
{
        r.setColorRules (rules);

        if (withBorder) {
                r.setColorMode (borderColor ());
                r.setBold (selected_);
                r.drawBorder (*this, true, withTitle);
                r.setBold (false);
        }

        r.setColorMode (color_);
}

void Widget::endDraw (Renderer &r) const
{
        r.unsetColorMode ();
        r.resetColorRules ();
}

/****************************************************************************/
/* Label                                                                    */
/****************************************************************************/

Label::Label (WidgetId id, std::string title, Grid const *grid, Placement const &placement, Logger logger)
    : Widget{id, std::move (title), grid, placement, std::move (logger)}
{
        alignment = Alignment::center;
}

/*--------------------------------------------------------------------------*/

void Label::draw (Renderer &r)
{
        beginDraw (r, border, false);
        r.drawText (*this, title_, startPosition ().y () + height () / 2, alignment, border);
        endDraw (r);
}

/*--------------------------------------------------------------------------*/

BlockLabel::BlockLabel (WidgetId id, std::string title, Grid const *grid, Placement const &placement, bool center, Logger logger)
    : Widget{id, std::move (title), grid, placement, std::move (logger)}, center{center}
{
        std::string_view t{title_};

        while (!t.empty ()) {
                auto end = t.find ('\n');
                lines.emplace_back (t.substr (0, end));
                t = (end == std::string_view::npos) ? (std::string_view{}) : (t.substr (end + 1));
        }
}

/*--------------------------------------------------------------------------*/

void BlockLabel::draw (Renderer &r)
{
        beginDraw (r, border, false);
        auto y = startPosition ().y () + std::max ((height () - int (lines.size ())) / 2, pady + int (border));

        for (auto const &l : lines) {
                if (y >= stopPosition ().y () - pady - int (border)) {
                        break;
                }

                r.drawText (*this, l, y++, (center) ? (Alignment::center) : (Alignment::left), border);
        }

        endDraw (r);
}

/****************************************************************************/
/* ScrollMenu                                                               */
/****************************************************************************/

ScrollMenu::ScrollMenu (WidgetId id, std::string title, Grid const *grid, Placement const &placement, Logger logger)
    : Widget{id, std::move (title), grid, placement, logger}, list_{logger}
{
        helpText_ = "Focus mode on ScrollMenu. Use up/down to scroll, Enter to trigger command, Esc to exit.";
}

/*--------------------------------------------------------------------------*/

void ScrollMenu::handleKeyPress (Key key)
{
        Widget::handleKeyPress (key);

        if (detail::scrollList (list_, key, viewportHeight ())) {
                return;
        }

        if (key == Key::enter && command) {
                if (auto item = list_.get ()) {
                        command (*item);
                }
        }
}

/*--------------------------------------------------------------------------*/

void ScrollMenu::handleMousePress (Point const &pos, MouseEvent event)
{
        Widget::handleMousePress (pos, event);

        if (event == MouseEvent::leftClick) {
                detail::clickList (*this, list_, pos);
        }
}

/*--------------------------------------------------------------------------*/

void ScrollMenu::draw (Renderer &r)
{
        beginDraw (r);
        detail::drawList (r, *this, list_);
        endDraw (r);
}

/****************************************************************************/
/* CheckBoxMenu                                                             */
/****************************************************************************/

CheckBoxMenu::CheckBoxMenu (WidgetId id, std::string title, Grid const *grid, Placement const &placement, char checkedChar, Logger logger)
    : Widget{id, std::move (title), grid, placement, logger}, list_{checkedChar, logger}
{
        helpText_ = "Focus mode on CheckBox. Use up/down to scroll, Enter to toggle set, unset, Esc to exit.";
}

/*--------------------------------------------------------------------------*/

void CheckBoxMenu::toggle ()
{
        if (list_.empty ()) {
                return;
        }

        bool state = list_.markSelectedItemAsChecked ();

        if (command) {
                command (list_.itemList ().at (list_.selectedIndex ()).text, state);
        }
}

/*--------------------------------------------------------------------------*/

void CheckBoxMenu::handleKeyPress (Key key)
{
        Widget::handleKeyPress (key);

        if (detail::scrollList (list_, key, viewportHeight ())) {
                return;
        }

        if (key == Key::enter) {
                toggle ();
        }
}

/*--------------------------------------------------------------------------*/

void CheckBoxMenu::handleMousePress (Point const &pos, MouseEvent event)
{
        Widget::handleMousePress (pos, event);

        if (event == MouseEvent::leftClick && detail::clickList (*this, list_, pos)) {
                toggle ();
        }
}

/*--------------------------------------------------------------------------*/

void CheckBoxMenu::draw (Renderer &r)
{
        beginDraw (r);
        detail::drawList (r, *this, list_);
        endDraw (r);
}

/****************************************************************************/
/* Button                                                                   */
/****************************************************************************/

Button::Button (WidgetId id, std::string title, Grid const *grid, Placement const &placement, std::function<void ()> command, Logger logger)
    : Widget{id, std::move (title), grid, placement, std::move (logger)}, command{std::move (command)}
{
        helpText_ = "Focus mode on Button. Press Enter to press button, Esc to exit focus mode.";
        setColor (colors::magentaOnBlack);
        selectedColor_ = colors::blackOnGreen;
        alignment = Alignment::center;
}

/*--------------------------------------------------------------------------*/

void Button::press ()
{
        logger->debug ("[Button] '{}' pressed", title_);

        // Copied, the command may destroy this button (switching widget sets).
        if (auto c = command) {
                c ();
        }
}

/*--------------------------------------------------------------------------*/

void Button::handleKeyPress (Key key)
{
        Widget::handleKeyPress (key);

        if (key == Key::enter) {
                press ();
        }
}

void Button::handleMousePress (Point const &pos, MouseEvent event)
{
        Widget::handleMousePress (pos, event);

        if (event == MouseEvent::leftClick && selected_) {
                press ();
        }
}

/*--------------------------------------------------------------------------*/

void Button::draw (Renderer &r)
{
        beginDraw (r, true, false);
        r.setColorMode ((selected_) ? (selectedColor_) : (color_));
        r.drawText (*this, title_, startPosition ().y () + height () / 2, alignment, true, selected_);
        endDraw (r);
}

/****************************************************************************/
/* TextBox                                                                  */
/****************************************************************************/

TextBox::TextBox (WidgetId id, std::string title, Grid const *grid, Placement const &placement, std::string initialText, bool password,
                  Logger logger)
    : Widget{id, std::move (title), grid, placement, logger}, editor_{std::move (initialText), password, logger}
{
        helpText_ = "Focus mode on TextBox. Press Esc to exit focus mode.";
        updateHeightWidth ();
}

/*--------------------------------------------------------------------------*/

void TextBox::updateHeightWidth ()
{
        Widget::updateHeightWidth ();
        editor_.setViewport (startPosition ().x () + padx + 2, startPosition ().y () + height () / 2, Renderer::textWidth (*this) - 1);
}

/*--------------------------------------------------------------------------*/

void TextBox::handleKeyPress (Key key)
{
        if (hasKeyCommand (key)) {
                Widget::handleKeyPress (key);
                return;
        }

        editor_.handleKey (key);
}

/*--------------------------------------------------------------------------*/

void TextBox::draw (Renderer &r)
{
        beginDraw (r, false);
        auto textY = editor_.cursorPosition ().y ();

        r.setColorMode (borderColor ());
        r.setBold (selected_);
        r.drawFrame ({{startPosition ().x () + padx, textY - 1}, {width () - 2 * padx, 3}}, title_);
        r.setBold (false);

        r.setColorMode (color_);
        r.drawText (*this, editor_.visibleText (), textY);

        if (selected_) {
                r.drawCursor (editor_.cursorPosition ());
        }

        endDraw (r);
}

/****************************************************************************/
/* ScrollTextBlock                                                          */
/****************************************************************************/

ScrollTextBlock::ScrollTextBlock (WidgetId id, std::string title, Grid const *grid, Placement const &placement, std::string_view initialText,
                                  Logger logger)
    : Widget{id, std::move (title), grid, placement, logger}, editor_{initialText, logger}
{
        helpText_ = "Focus mode on TextBlock. Press Esc to exit focus mode.";
        updateHeightWidth ();
}

/*--------------------------------------------------------------------------*/

void ScrollTextBlock::updateHeightWidth ()
{
        Widget::updateHeightWidth ();
        editor_.setViewport ({startPosition ().x () + padx + 2, startPosition ().y () + pady + 1},
                             {Renderer::textWidth (*this) - 1, viewportHeight ()});
}

/*--------------------------------------------------------------------------*/

void ScrollTextBlock::handleKeyPress (Key key)
{
        if (hasKeyCommand (key)) {
                Widget::handleKeyPress (key);
                return;
        }

        editor_.handleKey (key);
}

/*--------------------------------------------------------------------------*/

void ScrollTextBlock::draw (Renderer &r)
{
        beginDraw (r);
        auto y = startPosition ().y () + pady + 1;
        auto visible = editor_.visibleLines ();

        for (Dimension i = 0; i < viewportHeight (); ++i) {
                r.drawText (*this, (i < int (visible.size ())) ? (visible.at (i)) : (std::string{}), y + i);
        }

        if (selected_) {
                r.drawCursor (editor_.cursorPosition ());
        }

        endDraw (r);
}

/****************************************************************************/
/* SliderWidget                                                             */
/****************************************************************************/

SliderWidget::SliderWidget (WidgetId id, std::string title, Grid const *grid, Placement const &placement, int min, int max, int step,
                            int init, Logger logger)
    : Widget{id, std::move (title), grid, placement, logger}, state_{min, max, init, step, logger}
{
        helpText_ = "Focus mode on Slider. Use left/right to adjust value. Esc to exit.";
}

/*--------------------------------------------------------------------------*/

void SliderWidget::setBarChar (std::string_view c)
{
        if (c.size () != 1) {
                throw InvalidValueError (fmt::format ("Slider bar character must be one character, got '{}'", c));
        }

        barChar = c.front ();
}

/*--------------------------------------------------------------------------*/

void SliderWidget::handleKeyPress (Key key)
{
        Widget::handleKeyPress (key);

        if (key == Key::left) {
                state_.update (-1);
        }
        else if (key == Key::right) {
                state_.update (1);
        }
}

/*--------------------------------------------------------------------------*/

std::string SliderWidget::generateBar (Dimension width) const
{
        std::string value = (valueEnabled) ? (fmt::format (" {}", state_.value ())) : (std::string{});
        auto barWidth = std::max (width - int (value.size ()), 0);
        auto range = state_.max () - state_.min ();
        auto filled = (range > 0) ? ((state_.value () - state_.min ()) * barWidth / range) : (barWidth);

        return std::string (filled, barChar) + std::string (barWidth - filled, ' ') + value;
}

/*--------------------------------------------------------------------------*/

void SliderWidget::draw (Renderer &r)
{
        beginDraw (r, borderEnabled, titleEnabled);
        auto start = startPosition ().y ();

        if (!borderEnabled && titleEnabled) {
                r.drawText (*this, title_, start + pady, Alignment::center, false);
        }

        Coordinate y{};

        switch (verticalAlignment) {
        case VerticalAlignment::top:
                y = start + pady + 1;
                break;

        case VerticalAlignment::middle:
                y = start + height () / 2;
                break;

        case VerticalAlignment::bottom:
                y = stopPosition ().y () - pady - 2;
                break;
        }

        r.drawText (*this, generateBar (Renderer::textWidth (*this, borderEnabled)), y, Alignment::left, borderEnabled);
        endDraw (r);
}

} // namespace tg
