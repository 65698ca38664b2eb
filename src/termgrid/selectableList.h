/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "logging.h"
#include <algorithm>
#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tg {
namespace c {

        /**
         * Things a menu can show: strings, or anything with a label () method.
         */
        template <typename T>
        concept menu_item = std::copyable<T> && (std::convertible_to<T const &, std::string_view> || requires (T const &t) {
                                                         { t.label () } -> std::convertible_to<std::string>;
                                                 });

} // namespace c

namespace detail {
        template <c::menu_item T> std::string itemLabel (T const &item)
        {
                if constexpr (std::convertible_to<T const &, std::string_view>) {
                        return std::string{std::string_view{item}};
                }
                else {
                        return item.label ();
                }
        }
} // namespace detail

/**
 * Scrollable list state. selectedIndex is the highlighted item, topViewIndex the first
 * visible one. Both are meaningless (and 0) when the list is empty.
 */
template <c::menu_item Item> class SelectableList {
public:
        using Container = std::vector<Item>;
        static constexpr int pageScrollLength = 5;

        explicit SelectableList (Logger logger = {}) : logger{orNull (std::move (logger))} {}
        SelectableList (SelectableList const &) = default;
        SelectableList &operator= (SelectableList const &) = default;
        SelectableList (SelectableList &&) noexcept = default;
        SelectableList &operator= (SelectableList &&) noexcept = default;
        virtual ~SelectableList () = default;

        void clear ()
        {
                items.clear ();
                selected = 0;
                top = 0;
                logger->debug ("[SelectableList] Cleared");
        }

        void addItem (Item item) { items.push_back (std::move (item)); }

        void addItemList (std::vector<Item> const &list) { items.insert (items.end (), list.begin (), list.end ()); }

        /// No-op on an empty list.
        void removeSelectedItem ()
        {
                if (items.empty ()) {
                        return;
                }

                items.erase (items.begin () + selected);
                clampSelection ();
        }

        /// Removes the first item equal to item. Returns false if there was none.
        bool removeItem (Item const &item)
                requires std::equality_comparable<Item>
        {
                auto i = std::find (items.begin (), items.end (), item);

                if (i == items.end ()) {
                        return false;
                }

                items.erase (i);
                clampSelection ();
                return true;
        }

        Container const &itemList () const { return items; }
        Container &itemList () { return items; }
        size_t size () const { return items.size (); }
        bool empty () const { return items.empty (); }

        /// Selected item, or nothing for an empty list.
        std::optional<Item> get () const
        {
                if (items.empty ()) {
                        return std::nullopt;
                }

                return items.at (selected);
        }

        /// Replaces the selected item. No-op on an empty list.
        void setSelectedItem (Item item)
        {
                if (!items.empty ()) {
                        items.at (selected) = std::move (item);
                }
        }

        int selectedIndex () const { return selected; }
        int topViewIndex () const { return top; }

        /// Clamped into the list.
        void setSelectedIndex (int i)
        {
                selected = std::clamp (i, 0, std::max (int (items.size ()) - 1, 0));
                top = std::min (top, selected);
        }

        /*---------------------------------------------------------------------------*/

        void scrollUp ()
        {
                if (top > 0 && selected == top) {
                        --top;
                }

                if (selected > 0) {
                        --selected;
                }
        }

        /// viewportHeight is the number of visible rows.
        void scrollDown (int viewportHeight)
        {
                if (selected < int (items.size ()) - 1) {
                        ++selected;
                }

                if (selected >= top + std::max (viewportHeight, 1)) {
                        ++top;
                }
        }

        void jumpUp ()
        {
                for (int i = 0; i < pageScrollLength; ++i) {
                        scrollUp ();
                }
        }

        void jumpDown (int viewportHeight)
        {
                for (int i = 0; i < pageScrollLength; ++i) {
                        scrollDown (viewportHeight);
                }
        }

        void jumpToTop ()
        {
                selected = 0;
                top = 0;
        }

        void jumpToBottom (int viewportHeight)
        {
                selected = std::max (int (items.size ()) - 1, 0);
                top = std::max (selected - std::max (viewportHeight, 1) + 1, 0);
        }

        /// Labels of the items visible in a viewport of the given height.
        std::vector<std::string> visibleLabels (int viewportHeight) const
        {
                std::vector<std::string> ret;

                for (int i = top; i < int (items.size ()) && i < top + viewportHeight; ++i) {
                        ret.push_back (label (items.at (i)));
                }

                return ret;
        }

        /// How an item is shown.
        virtual std::string label (Item const &item) const { return detail::itemLabel (item); }

protected:
        Logger logger;

private:
        void clampSelection ()
        {
                if (selected >= int (items.size ()) && selected > 0) {
                        selected = int (items.size ()) - 1;
                }

                selected = std::max (selected, 0);
                top = std::min (top, selected);
        }

        Container items;
        int selected{};
        int top{};
};

} // namespace tg
