/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "checkboxList.h"
#include <fmt/format.h>

namespace tg {

CheckboxList::CheckboxList (char checkedChar, Logger logger) : SelectableList{std::move (logger)}, checked{checkedChar} {}

/****************************************************************************/

void CheckboxList::addItemList (std::vector<std::string> const &list)
{
        for (auto const &s : list) {
                addItem (s);
        }
}

/****************************************************************************/

bool CheckboxList::markSelectedItemAsChecked ()
{
        if (empty ()) {
                return false;
        }

        auto &item = itemList ().at (selectedIndex ());
        item.checked = !item.checked;
        logger->debug ("[CheckboxList] '{}' checked: {}", item.text, item.checked);
        return item.checked;
}

/*--------------------------------------------------------------------------*/

bool CheckboxList::markItemAsChecked (std::string const &text)
{
        for (auto &item : itemList ()) {
                if (item.text == text) {
                        item.checked = !item.checked;
                        return true;
                }
        }

        return false;
}

/****************************************************************************/

std::vector<std::string> CheckboxList::checkedItems () const
{
        std::vector<std::string> ret;

        for (auto const &item : itemList ()) {
                if (item.checked) {
                        ret.push_back (item.text);
                }
        }

        return ret;
}

/****************************************************************************/

std::string CheckboxList::label (CheckItem const &item) const
{
        return fmt::format ("[{}] - {}", (item.checked) ? (checked) : (' '), item.text);
}

} // namespace tg
