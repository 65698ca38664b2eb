/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "termgrid/debug.h"
#include "termgrid/errors.h"
#include "termgrid/widgetSet.h"
#include <catch2/catch.hpp>
#include <memory>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>
#include <sstream>

using namespace tg;

TEST_CASE ("Widget set", "[widgetSet]")
{
        WidgetSet set{3, 3, {60, 30}};

        auto &label = set.addLabel ("Label", {});
        REQUIRE (label.id () == 1);
        REQUIRE (!set.selectedWidget ());

        auto &menu = set.addScrollMenu ("Menu", {.row = 1});
        auto &button = set.addButton ("Button", {.row = 2, .column = 1, .columnSpan = 2});
        REQUIRE (menu.id () == 2);
        REQUIRE (button.id () == 3);
        REQUIRE (set.size () == 3);

        SECTION ("First selectable widget is selected")
        {
                REQUIRE (set.selectedWidget () == 2U);
        }

        SECTION ("Lookup")
        {
                REQUIRE (set.get (2) == &menu);
                REQUIRE (set.get (0) == nullptr);
                REQUIRE (set.get (99) == nullptr);

                auto const &cset = set;
                REQUIRE (cset.get (3)->title () == "Button");
        }

        SECTION ("Selection")
        {
                REQUIRE (!set.setSelectedWidget (1));
                REQUIRE (!set.setSelectedWidget (42));
                REQUIRE (set.selectedWidget () == 2U);
                REQUIRE (set.setSelectedWidget (3));
                REQUIRE (set.selectedWidget () == 3U);
        }

        SECTION ("Removal")
        {
                set.setSelectedWidget (3);
                REQUIRE (set.remove (3));
                REQUIRE (!set.remove (3));
                REQUIRE (set.get (3) == nullptr);
                REQUIRE (set.selectedWidget () == 2U);

                // Ids are never reused.
                auto &box = set.addTextBox ("Box", {.row = 2});
                REQUIRE (box.id () == 4);

                REQUIRE (set.remove (2));
                REQUIRE (set.selectedWidget () == 4U);
                REQUIRE (set.remove (4));
                REQUIRE (!set.selectedWidget ());
        }

        SECTION ("Placement is checked")
        {
                REQUIRE_THROWS_AS (set.addLabel ("Out", {.row = 3}), OutOfBoundsError);
                REQUIRE_THROWS_AS (set.addLabel ("Out", {.column = 1, .columnSpan = 3}), OutOfBoundsError);
                REQUIRE (set.size () == 3);
                REQUIRE (set.addLabel ("In", {.column = 2}).id () == 4);
        }

        SECTION ("Resize")
        {
                set.resize ({90, 60});
                REQUIRE (menu.startPosition () == Point{0, 20});
                REQUIRE (button.rect () == Rect{{30, 40}, {60, 20}});

                REQUIRE_THROWS_AS (set.resize ({5, 5}), TooSmallError);
                REQUIRE (set.grid ().height () == 60);
                REQUIRE (menu.startPosition () == Point{0, 20});
        }

        SECTION ("Other widget types")
        {
                auto &slider = set.add<SliderWidget> ("Slider", {.column = 1}, 0, 10, 1, 5);
                REQUIRE (slider.value () == 5);
                REQUIRE (set.addCheckBoxMenu ("Check", {.column = 2}, '*').list ().checkedChar () == '*');
                REQUIRE (set.addTextBlock ("Block", {.row = 1, .column = 1}, "a\nb").editor ().lines ().size () == 2);
                REQUIRE (set.addBlockLabel ("Art", {.row = 1, .column = 2}).kind () == ElementKind::blockLabel);
                REQUIRE (set.addSlider ("S2", {.row = 2}, -5, 5).state ().value () == 0);
                REQUIRE (set.size () == 8);
        }

        SECTION ("Key commands")
        {
                int cnt{};
                set.addKeyCommand (toKey ('a'), [&cnt] { ++cnt; });
                REQUIRE (set.keyCommands ().size () == 1);
                set.keyCommands ().at (toKey ('a')) ();
                REQUIRE (cnt == 1);
        }

        SECTION ("Layout dump")
        {
                std::ostringstream out;
                auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt> (out);
                sink->set_pattern ("%v");
                spdlog::logger logger{"layout", sink};
                logger.set_level (spdlog::level::debug);

                logLayout (set, logger);
                auto text = out.str ();
                REQUIRE (text.find ("[Layout] grid: 3x3 cells of 20x10, area 60x30") != std::string::npos);
                REQUIRE (text.find ("id: 2, ScrollMenu, x: 0, y: 10, w: 20, h: 10, 'Menu' *") != std::string::npos);
                REQUIRE (text.find ("id: 3, Button, x: 20, y: 20, w: 40, h: 10, 'Button'\n") != std::string::npos);
        }
}

TEST_CASE ("Widget set with a title bar", "[widgetSet]")
{
        WidgetSet set{2, 2, {40, 20}, 1};
        REQUIRE (set.addLabel ("L", {}).startPosition () == Point{0, 1});
        REQUIRE (set.addLabel ("R", {.row = 1, .column = 1}).rect () == Rect{{20, 11}, {20, 10}});
}
