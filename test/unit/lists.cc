/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "termgrid/checkboxList.h"
#include "termgrid/selectableList.h"
#include <catch2/catch.hpp>
#include <cstdlib>
#include <string>
#include <vector>

using namespace tg;

struct Labelled {
        std::string label () const { return "L"; }
};

struct Unlabelled {};

static_assert (c::menu_item<std::string>);
static_assert (c::menu_item<char const *>);
static_assert (c::menu_item<Labelled>);
static_assert (!c::menu_item<Unlabelled>);
static_assert (!c::menu_item<int>);

namespace {
SelectableList<std::string> fiveItems ()
{
        SelectableList<std::string> list;
        list.addItemList ({"a", "b", "c", "d", "e"});
        return list;
}
} // namespace

TEST_CASE ("Scrolling", "[list]")
{
        auto list = fiveItems ();

        SECTION ("Selection follows the viewport")
        {
                for (int i = 0; i < 4; ++i) {
                        list.scrollDown (3);
                }

                REQUIRE (list.selectedIndex () == 4);
                REQUIRE (list.topViewIndex () == 2);
                REQUIRE (list.visibleLabels (3) == std::vector<std::string>{"c", "d", "e"});

                list.scrollDown (3);
                REQUIRE (list.selectedIndex () == 4);
                REQUIRE (list.topViewIndex () == 2);

                list.scrollUp ();
                list.scrollUp ();
                REQUIRE (list.selectedIndex () == 2);
                REQUIRE (list.topViewIndex () == 2);

                list.scrollUp ();
                REQUIRE (list.selectedIndex () == 1);
                REQUIRE (list.topViewIndex () == 1);
        }

        SECTION ("Scrolling up at the top does nothing")
        {
                list.scrollUp ();
                REQUIRE (list.selectedIndex () == 0);
                REQUIRE (list.topViewIndex () == 0);
        }

        SECTION ("Jumps")
        {
                list.jumpToBottom (3);
                REQUIRE (list.selectedIndex () == 4);
                REQUIRE (list.topViewIndex () == 2);

                list.jumpToTop ();
                REQUIRE (list.selectedIndex () == 0);
                REQUIRE (list.topViewIndex () == 0);

                list.jumpDown (2);
                REQUIRE (list.selectedIndex () == 4);
                REQUIRE (list.topViewIndex () == 3);

                list.jumpUp ();
                REQUIRE (list.selectedIndex () == 0);
                REQUIRE (list.topViewIndex () == 0);
        }

        SECTION ("Selection stays in the viewport")
        {
                for (int vh = 1; vh < 7; ++vh) {
                        auto l = fiveItems ();

                        for (int i = 0; i < 10; ++i) {
                                int prevSelected = l.selectedIndex ();
                                int prevTop = l.topViewIndex ();
                                (i % 3 == 2) ? (l.scrollUp ()) : (l.scrollDown (vh));

                                REQUIRE (l.topViewIndex () <= l.selectedIndex ());
                                REQUIRE (l.selectedIndex () < l.topViewIndex () + vh);
                                REQUIRE (std::abs (l.selectedIndex () - prevSelected) <= 1);
                                REQUIRE (std::abs (l.topViewIndex () - prevTop) <= 1);
                        }
                }
        }
}

TEST_CASE ("List contents", "[list]")
{
        SECTION ("Empty list")
        {
                SelectableList<std::string> list;
                REQUIRE (!list.get ());
                list.scrollDown (3);
                list.scrollUp ();
                list.removeSelectedItem ();
                REQUIRE (list.selectedIndex () == 0);
                REQUIRE (list.visibleLabels (3).empty ());
        }

        SECTION ("Removing the last item moves the selection up")
        {
                auto list = fiveItems ();
                list.jumpToBottom (3);
                list.removeSelectedItem ();
                REQUIRE (list.size () == 4);
                REQUIRE (*list.get () == "d");

                REQUIRE (list.removeItem ("a"));
                REQUIRE (!list.removeItem ("x"));
                REQUIRE (*list.get () == "d");
        }

        SECTION ("Selected index is clamped")
        {
                auto list = fiveItems ();
                list.setSelectedIndex (42);
                REQUIRE (list.selectedIndex () == 4);
                list.setSelectedIndex (-1);
                REQUIRE (list.selectedIndex () == 0);
        }

        SECTION ("Replacing and clearing")
        {
                auto list = fiveItems ();
                list.scrollDown (3);
                list.setSelectedItem ("B");
                REQUIRE (list.itemList ().at (1) == "B");

                list.clear ();
                REQUIRE (list.empty ());
                REQUIRE (list.selectedIndex () == 0);
        }

        SECTION ("Custom labels")
        {
                SelectableList<Labelled> list;
                list.addItem ({});
                REQUIRE (list.visibleLabels (1) == std::vector<std::string>{"L"});
        }
}

TEST_CASE ("Checkbox list", "[list]")
{
        CheckboxList list;
        list.addItemList ({"apple", "pear", "plum"});

        REQUIRE (list.visibleLabels (3) == std::vector<std::string>{"[ ] - apple", "[ ] - pear", "[ ] - plum"});

        REQUIRE (list.markSelectedItemAsChecked ());
        list.scrollDown (3);
        list.scrollDown (3);
        REQUIRE (list.markSelectedItemAsChecked ());
        REQUIRE (list.checkedItems () == std::vector<std::string>{"apple", "plum"});
        REQUIRE (list.label (list.itemList ().front ()) == "[X] - apple");

        SECTION ("Toggling twice unchecks")
        {
                REQUIRE (!list.markSelectedItemAsChecked ());
                REQUIRE (list.checkedItems () == std::vector<std::string>{"apple"});
        }

        SECTION ("By text")
        {
                REQUIRE (list.markItemAsChecked ("pear"));
                REQUIRE (!list.markItemAsChecked ("kiwi"));
                REQUIRE (list.checkedItems ().size () == 3);
        }

        SECTION ("Custom check character")
        {
                list.setCheckedChar ('*');
                REQUIRE (list.label (list.itemList ().back ()) == "[*] - plum");
        }

        SECTION ("Empty")
        {
                CheckboxList empty;
                REQUIRE (!empty.markSelectedItemAsChecked ());
        }
}
