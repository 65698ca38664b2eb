/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "selectableList.h"
#include <string>
#include <vector>

namespace tg {

struct CheckItem {
        bool operator== (CheckItem const &) const = default;
        std::string label () const { return text; }

        std::string text;
        bool checked{};
};

/**
 * List of items which can be checked and unchecked independently.
 */
class CheckboxList : public SelectableList<CheckItem> {
public:
        explicit CheckboxList (char checkedChar = 'X', Logger logger = {});

        void addItem (std::string text) { SelectableList::addItem ({std::move (text), false}); }
        void addItemList (std::vector<std::string> const &list);

        /// Toggles the selected item. Returns its new state (false for an empty list).
        bool markSelectedItemAsChecked ();

        /// Toggles the first item with the given text. Returns false if there is none.
        bool markItemAsChecked (std::string const &text);

        std::vector<std::string> checkedItems () const;

        char checkedChar () const { return checked; }
        void setCheckedChar (char c) { checked = c; }

        /// "[X] - text" or "[ ] - text"
        std::string label (CheckItem const &item) const override;

private:
        char checked;
};

} // namespace tg
