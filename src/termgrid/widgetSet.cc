/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "widgetSet.h"
#include <algorithm>

namespace tg {

WidgetSet::WidgetSet (Dimension rows, Dimension columns, Dimensions area, Coordinate titleBarOffset, Logger logger)
    : grid_{std::make_unique<Grid> (rows, columns, area.height, area.width, titleBarOffset)}, logger{orNull (std::move (logger))}
{
        this->logger->debug ("[WidgetSet] Created {}x{} grid over {}x{}", rows, columns, area.width, area.height);
}

/****************************************************************************/

WidgetSet::Container::iterator WidgetSet::find (WidgetId id)
{
        auto i = std::ranges::lower_bound (widgets_, id, {}, [] (auto const &w) { return w->id (); });
        return (i != widgets_.end () && (*i)->id () == id) ? (i) : (widgets_.end ());
}

WidgetSet::Container::const_iterator WidgetSet::find (WidgetId id) const
{
        auto i = std::ranges::lower_bound (widgets_, id, {}, [] (auto const &w) { return w->id (); });
        return (i != widgets_.cend () && (*i)->id () == id) ? (i) : (widgets_.cend ());
}

/*--------------------------------------------------------------------------*/

Widget *WidgetSet::get (WidgetId id)
{
        auto i = find (id);
        return (i == widgets_.end ()) ? (nullptr) : (i->get ());
}

Widget const *WidgetSet::get (WidgetId id) const
{
        auto i = find (id);
        return (i == widgets_.cend ()) ? (nullptr) : (i->get ());
}

/****************************************************************************/

bool WidgetSet::remove (WidgetId id)
{
        auto i = find (id);

        if (i == widgets_.end ()) {
                logger->warn ("[WidgetSet] No widget with id {} to remove", id);
                return false;
        }

        logger->debug ("[WidgetSet] Removing '{}' ({})", (*i)->title (), id);
        widgets_.erase (i);

        if (selected == id) {
                selected.reset ();
                auto next = std::ranges::find_if (widgets_, [] (auto const &w) { return w->isSelectable (); });

                if (next != widgets_.end ()) {
                        selected = (*next)->id ();
                }
        }

        return true;
}

/****************************************************************************/

bool WidgetSet::setSelectedWidget (WidgetId id)
{
        auto *w = get (id);

        if (w == nullptr || !w->isSelectable ()) {
                return false;
        }

        selected = id;
        return true;
}

/****************************************************************************/

void WidgetSet::resize (Dimensions area)
{
        grid_->resize (area.height, area.width);
        updateHeightWidth ();
}

void WidgetSet::updateHeightWidth ()
{
        for (auto &w : widgets_) {
                w->updateHeightWidth ();
        }
}

} // namespace tg
