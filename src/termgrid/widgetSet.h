/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "grid.h"
#include "logging.h"
#include "widgets.h"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tg {

/**
 * A grid and the widgets placed on it. One set is shown at a time, Cui can swap them.
 * Widgets are stored in id order, ids are sequential and never reused, so a removed
 * widget's id simply stops resolving.
 */
class WidgetSet {
public:
        using Container = std::vector<std::unique_ptr<Widget>>;
        using KeyCommands = std::map<Key, std::function<void ()>>;

        /// area is the part of the terminal managed by the grid (without the title and status bars).
        WidgetSet (Dimension rows, Dimension columns, Dimensions area, Coordinate titleBarOffset = 0, Logger logger = {});

        /// Widgets keep a pointer to the grid.
        WidgetSet (WidgetSet const &) = delete;
        WidgetSet &operator= (WidgetSet const &) = delete;
        WidgetSet (WidgetSet &&) = delete;
        WidgetSet &operator= (WidgetSet &&) = delete;
        ~WidgetSet () = default;

        /**
         * Creates a widget of type W. args are passed between the placement and the
         * logger. Throws OutOfBoundsError if the placement does not fit the grid.
         */
        template <typename W, typename... Args> W &add (std::string title, Placement const &placement, Args &&...args)
        {
                auto w = std::make_unique<W> (nextId, std::move (title), grid_.get (), placement, std::forward<Args> (args)..., logger);
                auto &ref = *w;
                widgets_.push_back (std::move (w));
                ++nextId;

                if (!selected && ref.isSelectable ()) {
                        selected = ref.id ();
                }

                logger->debug ("[WidgetSet] Added '{}' with id {} at ({}, {})", ref.title (), ref.id (), placement.row, placement.column);
                return ref;
        }

        ScrollMenu &addScrollMenu (std::string title, Placement const &p) { return add<ScrollMenu> (std::move (title), p); }

        CheckBoxMenu &addCheckBoxMenu (std::string title, Placement const &p, char checkedChar = 'X')
        {
                return add<CheckBoxMenu> (std::move (title), p, checkedChar);
        }

        TextBox &addTextBox (std::string title, Placement const &p, std::string initialText = {}, bool password = false)
        {
                return add<TextBox> (std::move (title), p, std::move (initialText), password);
        }

        ScrollTextBlock &addTextBlock (std::string title, Placement const &p, std::string_view initialText = {})
        {
                return add<ScrollTextBlock> (std::move (title), p, initialText);
        }

        Label &addLabel (std::string title, Placement const &p) { return add<Label> (std::move (title), p); }

        BlockLabel &addBlockLabel (std::string title, Placement const &p, bool center = false)
        {
                return add<BlockLabel> (std::move (title), p, center);
        }

        Button &addButton (std::string title, Placement const &p, std::function<void ()> command = {})
        {
                return add<Button> (std::move (title), p, std::move (command));
        }

        SliderWidget &addSlider (std::string title, Placement const &p, int min = 0, int max = 100, int step = 1, int init = 0)
        {
                return add<SliderWidget> (std::move (title), p, min, max, step, init);
        }

        /// nullptr for ids never issued or already removed.
        Widget *get (WidgetId id);
        Widget const *get (WidgetId id) const;

        /// Returns false if there was no such widget.
        bool remove (WidgetId id);

        /// In creation order.
        Container const &widgets () const { return widgets_; }
        size_t size () const { return widgets_.size (); }

        /// Commands run in overview mode.
        void addKeyCommand (Key key, std::function<void ()> command) { keyCommands_[key] = std::move (command); }
        KeyCommands const &keyCommands () const { return keyCommands_; }

        std::optional<WidgetId> selectedWidget () const { return selected; }

        /// Returns false (and changes nothing) for unknown or non selectable widgets.
        bool setSelectedWidget (WidgetId id);

        Grid const &grid () const { return *grid_; }

        /// Resizes the grid and re-lays the widgets out. Throws TooSmallError (set untouched).
        void resize (Dimensions area);
        void updateHeightWidth ();

private:
        Container::iterator find (WidgetId id);
        Container::const_iterator find (WidgetId id) const;

        std::unique_ptr<Grid> grid_;
        Container widgets_;
        KeyCommands keyCommands_;
        std::optional<WidgetId> selected;
        WidgetId nextId{1};
        Logger logger;
};

} // namespace tg
