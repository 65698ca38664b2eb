/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "debug.h"
#include "errors.h"
#include "widgetSet.h"
#include <algorithm>

namespace tg {

std::string_view kindName (ElementKind kind)
{
        switch (kind) {
        case ElementKind::label:
                return "Label";
        case ElementKind::blockLabel:
                return "BlockLabel";
        case ElementKind::scrollMenu:
                return "ScrollMenu";
        case ElementKind::checkBoxMenu:
                return "CheckBoxMenu";
        case ElementKind::button:
                return "Button";
        case ElementKind::textBox:
                return "TextBox";
        case ElementKind::textBlock:
                return "ScrollTextBlock";
        case ElementKind::slider:
                return "Slider";
        case ElementKind::popup:
                return "Popup";
        case ElementKind::formField:
                return "FormField";
        case ElementKind::fileSelect:
                return "FileSelect";
        case ElementKind::fileNameInput:
                return "FileNameInput";
        case ElementKind::dialogButton:
                return "DialogButton";
        case ElementKind::liveDebug:
                return "LiveDebug";
        }

        return "unknown";
}

/*--------------------------------------------------------------------------*/

void logLayout (WidgetSet const &set, spdlog::logger &logger)
{
        auto const &grid = set.grid ();
        logger.debug ("[Layout] grid: {}x{} cells of {}x{}, area {}x{}", grid.rows (), grid.columns (), grid.columnWidth (),
                      grid.rowHeight (), grid.width (), grid.height ());

        for (auto const &w : set.widgets ()) {
                auto start = w->startPosition ();
                logger.debug ("[Layout]   id: {}, {}, x: {}, y: {}, w: {}, h: {}, '{}'{}", w->id (), kindName (w->kind ()), start.x (),
                              start.y (), w->width (), w->height (), w->title (), (set.selectedWidget () == w->id ()) ? (" *") : (""));
        }
}

/****************************************************************************/
/* LiveDebugElement                                                         */
/****************************************************************************/

LiveDebugElement::LiveDebugElement (IRoot &root, std::shared_ptr<LiveDebugSink> sink, Logger logger)
    : UIElement{0, "Live Debug", logger}, root{root}, sink{std::move (sink)}, list_{logger}
{
        if (!this->sink) {
                throw MissingParentError ("Live debug element needs a sink");
        }

        selectedColor_ = colors::blackOnWhite;
        helpText_ = "Live debug. Use up/down to scroll, Esc to exit.";
        updateHeightWidth ();
}

/*--------------------------------------------------------------------------*/

Point LiveDebugElement::absoluteStartPos () const
{
        auto size = root.absoluteSize ();
        return {size.width / 7 + 2, size.height / 7 + 2};
}

Point LiveDebugElement::absoluteStopPos () const
{
        auto size = root.absoluteSize ();
        return {6 * (size.width / 7) - 2, 6 * (size.height / 7) - 2};
}

/****************************************************************************/

void LiveDebugElement::update ()
{
        auto lines = sink->last_formatted ();

        if (lines == snapshot) {
                return;
        }

        snapshot = lines;
        auto sel = list_.selectedIndex ();
        std::ranges::reverse (lines);

        for (auto &l : lines) {
                while (!l.empty () && (l.back () == '\n' || l.back () == '\r')) {
                        l.pop_back ();
                }
        }

        list_.clear ();
        list_.addItemList (lines);
        list_.setSelectedIndex (sel);
}

/*--------------------------------------------------------------------------*/

void LiveDebugElement::handleKeyPress (Key key)
{
        update ();
        detail::scrollList (list_, key, viewportHeight ());
}

/*--------------------------------------------------------------------------*/

void LiveDebugElement::handleMousePress (Point const &pos, MouseEvent event)
{
        UIElement::handleMousePress (pos, event);

        if (event == MouseEvent::leftClick) {
                detail::clickList (*this, list_, pos);
        }
}

/*--------------------------------------------------------------------------*/

void LiveDebugElement::draw (Renderer &r)
{
        update ();
        r.setColorMode (colors::whiteOnBlack);
        r.drawBorder (*this);
        detail::drawList (r, *this, list_);
        r.unsetColorMode ();
}

} // namespace tg
