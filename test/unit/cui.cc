/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "termgrid/errors.h"
#include "termgrid/memoryDisplay.h"
#include "termgrid/termgrid.h"
#include <catch2/catch.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace tg;
using namespace std::chrono_literals;

namespace {

/**
 * 80x24 terminal, title bar on, 3x3 grid of 26x7 cells starting at row 1:
 *
 * | Menu   | Box      | Button |
 * | Label  | Check    |        |
 * | Slider (all three columns) |
 */
struct Fixture {
        explicit Fixture (Config config = {})
        {
                auto d = std::make_unique<MemoryDisplay> (Dimensions{80, 24});
                disp = d.get ();
                cui = std::make_unique<Cui> (3, 3, std::move (d), std::move (config));

                auto &ws = cui->widgetSet ();
                menu = &ws.addScrollMenu ("Menu", {});
                box = &ws.addTextBox ("Box", {.column = 1});
                button = &ws.addButton ("Button", {.column = 2}, [this] { ++presses; });
                label = &ws.addLabel ("Label", {.row = 1});
                check = &ws.addCheckBoxMenu ("Check", {.row = 1, .column = 1});
                slider = &ws.addSlider ("Slider", {.row = 2, .columnSpan = 3});

                menu->addItemList ({"one", "two", "three"});
                check->addItemList ({"a", "b"});
        }

        void key (Key k) { cui->processEvent (KeyEvent{k}); }
        void click (Point p, MouseEvent e = MouseEvent::leftClick) { cui->processEvent (MouseInput{p, e}); }
        void idle () { cui->processEvent (std::monostate{}); }
        Widget *selected () { return cui->selectedWidget (); }

        MemoryDisplay *disp{};
        std::unique_ptr<Cui> cui;
        ScrollMenu *menu{};
        TextBox *box{};
        Button *button{};
        Label *label{};
        CheckBoxMenu *check{};
        SliderWidget *slider{};
        int presses{};
};

struct NoAutoPress : public Fixture {
        NoAutoPress () : Fixture{Config{.autoFocusButtons = false}} {}
};

} // namespace

TEST_CASE ("Construction", "[cui]")
{
        SECTION ("Display setup")
        {
                auto d = std::make_unique<MemoryDisplay> (Dimensions{80, 24});
                auto *disp = d.get ();
                Cui cui{3, 3, std::move (d)};

                REQUIRE (disp->mouseEnabled ());
                REQUIRE (!disp->cursorVisible ());
                REQUIRE (disp->colorPairOf (colors::blackOnWhite) == std::pair<int16_t, int16_t>{0, 7});
                REQUIRE (cui.absoluteSize () == Dimensions{80, 24});
                REQUIRE (cui.focusMode () == FocusMode::overview);
                REQUIRE (cui.widgetSet ().grid ().titleBarOffset () == 1);
                REQUIRE (cui.widgetSet ().grid ().height () == 22);
                REQUIRE (cui.selectedWidget () == nullptr);
        }

        SECTION ("No title bar")
        {
                Cui cui{3, 3, std::make_unique<MemoryDisplay> (Dimensions{80, 24}), Config{.mouse = false, .title = ""}};
                REQUIRE (cui.widgetSet ().grid ().titleBarOffset () == 0);
                REQUIRE (cui.widgetSet ().grid ().height () == 23);
                REQUIRE (!static_cast<MemoryDisplay &> (cui.display ()).mouseEnabled ());
        }

        SECTION ("Errors")
        {
                REQUIRE_THROWS_AS ((Cui{3, 3, nullptr}), MissingParentError);
                REQUIRE_THROWS_AS ((Cui{3, 3, std::make_unique<MemoryDisplay> (Dimensions{10, 5})}), TooSmallError);
        }
}

/****************************************************************************/

TEST_CASE_METHOD (Fixture, "Overview navigation", "[cui]")
{
        REQUIRE (selected () == menu);

        key (Key::right);
        REQUIRE (selected () == box);
        key (Key::right);
        REQUIRE (selected () == button);
        key (Key::right);
        REQUIRE (selected () == button);

        key (Key::down);
        REQUIRE (selected () == slider);

        // Nearest row first, the label can not be selected.
        key (Key::up);
        REQUIRE (selected () == check);
        key (Key::left);
        REQUIRE (selected () == check);
        key (Key::up);
        REQUIRE (selected () == box);

        REQUIRE (cui->focusMode () == FocusMode::overview);
        REQUIRE (!box->isSelected ());
}

TEST_CASE_METHOD (Fixture, "Focus mode", "[cui]")
{
        key (Key::enter);
        REQUIRE (cui->focusMode () == FocusMode::focused);
        REQUIRE (menu->isSelected ());
        REQUIRE (cui->statusBarText () == menu->helpText ());

        // Arrows scroll the menu instead of moving the selection.
        key (Key::down);
        REQUIRE (menu->get () == "two");
        REQUIRE (selected () == menu);

        key (Key::escape);
        REQUIRE (cui->focusMode () == FocusMode::overview);
        REQUIRE (!menu->isSelected ());
        REQUIRE (selected () == menu);
        REQUIRE (cui->statusBarText () == cui->config ().statusBarText);

        SECTION ("The exit key is an ordinary key in focus mode")
        {
                key (Key::right);
                key (Key::enter);
                key (Key::qLower);
                REQUIRE (box->get () == "q");
        }

        SECTION ("Moving the focus directly")
        {
                cui->moveFocus (*check);
                REQUIRE (cui->focusMode () == FocusMode::focused);
                REQUIRE (check->isSelected ());
                REQUIRE (selected () == check);

                cui->moveFocus (*box);
                REQUIRE (!check->isSelected ());
                REQUIRE (box->isSelected ());

                // Not selectable.
                cui->moveFocus (*label);
                REQUIRE (cui->focusMode () == FocusMode::overview);
                REQUIRE (selected () == box);
        }
}

TEST_CASE ("Removing the focused widget", "[cui]")
{
        Cui cui{3, 3, std::make_unique<MemoryDisplay> (Dimensions{80, 24})};
        auto &a = cui.widgetSet ().addTextBox ("A", {});
        auto &b = cui.widgetSet ().addTextBox ("B", {.column = 1});

        cui.processEvent (KeyEvent{Key::right});
        cui.processEvent (KeyEvent{Key::enter});
        REQUIRE (cui.focusMode () == FocusMode::focused);
        REQUIRE (cui.selectedWidget () == &b);

        REQUIRE (cui.widgetSet ().remove (b.id ()));
        REQUIRE (cui.selectedWidget () == &a);

        SECTION ("Keys do not reach the next widget")
        {
                cui.processEvent (KeyEvent{toKey ('x')});
                REQUIRE (cui.focusMode () == FocusMode::overview);
                REQUIRE (a.get ().empty ());
                REQUIRE (!a.isSelected ());

                cui.processEvent (KeyEvent{Key::enter});
                REQUIRE (cui.focusMode () == FocusMode::focused);
                REQUIRE (a.isSelected ());
        }

        SECTION ("Draw")
        {
                cui.draw ();
                REQUIRE (cui.focusMode () == FocusMode::overview);
                REQUIRE (cui.statusBarText () == cui.config ().statusBarText);
        }
}

TEST_CASE_METHOD (Fixture, "Buttons are pressed instead of focused", "[cui]")
{
        key (Key::right);
        key (Key::right);
        key (Key::enter);
        REQUIRE (presses == 1);
        REQUIRE (cui->focusMode () == FocusMode::overview);

        click ({60, 4});
        REQUIRE (presses == 2);
        REQUIRE (cui->focusMode () == FocusMode::overview);
}

TEST_CASE_METHOD (NoAutoPress, "Buttons can be focused", "[cui]")
{
        key (Key::right);
        key (Key::right);
        key (Key::enter);
        REQUIRE (presses == 0);
        REQUIRE (cui->focusMode () == FocusMode::focused);

        key (Key::enter);
        REQUIRE (presses == 1);
}

TEST_CASE_METHOD (Fixture, "Cycling", "[cui]")
{
        key (Key::ctrlRight);
        REQUIRE (selected () == box);
        REQUIRE (cui->focusMode () == FocusMode::focused);

        // Buttons are focused, not pressed, and the label is skipped.
        key (Key::ctrlRight);
        REQUIRE (selected () == button);
        REQUIRE (presses == 0);
        key (Key::ctrlRight);
        REQUIRE (selected () == check);
        key (Key::ctrlRight);
        key (Key::ctrlRight);
        REQUIRE (selected () == menu);

        key (Key::ctrlLeft);
        REQUIRE (selected () == slider);
        REQUIRE (slider->isSelected ());
        REQUIRE (!menu->isSelected ());

        SECTION ("A widget key command wins")
        {
                int cnt{};
                slider->addKeyCommand (Key::ctrlLeft, [&cnt] { ++cnt; });
                key (Key::ctrlLeft);
                REQUIRE (cnt == 1);
                REQUIRE (selected () == slider);
        }
}

TEST_CASE_METHOD (Fixture, "Overview key commands", "[cui]")
{
        int cnt{};
        cui->addKeyCommand (toKey ('x'), [&cnt] { ++cnt; });

        key (toKey ('x'));
        REQUIRE (cnt == 1);

        cui->moveFocus (*box);
        key (toKey ('x'));
        REQUIRE (cnt == 1);
        REQUIRE (box->get () == "x");
}

/****************************************************************************/

TEST_CASE_METHOD (Fixture, "Popups", "[cui]")
{
        SECTION ("Popups take every key")
        {
                auto &p = cui->showMessagePopup ("Title", "Text");
                REQUIRE (cui->popup () == &p);
                REQUIRE (cui->statusBarText () == p.helpText ());

                key (Key::qLower);
                key (Key::right);
                REQUIRE (cui->popup () == &p);
                REQUIRE (selected () == menu);

                key (Key::enter);
                REQUIRE (cui->popup () == nullptr);
                REQUIRE (cui->focusMode () == FocusMode::overview);
        }

        SECTION ("Colors")
        {
                REQUIRE (cui->showErrorPopup ("E", "e").color () == colors::redOnBlack);
                REQUIRE (cui->showYesNoPopup ("Q", nullptr).color () == colors::yellowOnBlack);
                cui->showWarningPopup ("W", "w");
                REQUIRE (cui->popup ()->color () == colors::yellowOnBlack);
        }

        SECTION ("A popup command can open the next popup")
        {
                cui->showYesNoPopup ("Sure?", [this] (bool yes) {
                        if (yes) {
                                cui->showTextBoxPopup ("Name", [] (auto const &) {});
                        }
                });

                key (Key::yLower);
                REQUIRE (cui->popup () != nullptr);
                REQUIRE (cui->popup ()->title () == "Name");
        }

        SECTION ("Menu popup")
        {
                std::optional<std::string> picked;
                cui->showMenuPopup ({"x", "y"}, "Pick", [&picked] (auto const &s) { picked = s; });
                key (Key::down);
                key (Key::enter);
                REQUIRE (picked == "y");
                REQUIRE (cui->popup () == nullptr);
        }

        SECTION ("Form popup")
        {
                FormPopup::Result result;
                cui->showFormPopup ("Form", {{.name = "a", .required = true}}, [&result] (auto const &r) { result = r; });
                key (Key::enter);
                REQUIRE (cui->popup () != nullptr);
                key (Key::enter);
                key (toKey ('z'));
                key (Key::enter);
                REQUIRE (result.at ("a") == "z");
                REQUIRE (cui->popup () == nullptr);
        }

        SECTION ("File dialog")
        {
                auto &dialog = cui->showFileDialog (DialogType::openDir, nullptr, std::filesystem::temp_directory_path ());
                REQUIRE (dialog.dialogType () == DialogType::openDir);
                key (Key::escape);
                REQUIRE (cui->popup () == nullptr);
        }

        SECTION ("Clicks outside the popup are dropped")
        {
                cui->showMessagePopup ("Title", "Text");
                click ({35, 4});
                REQUIRE (cui->focusMode () == FocusMode::overview);
                REQUIRE (cui->popup () != nullptr);
        }

        SECTION ("A new popup replaces the old one")
        {
                cui->showMessagePopup ("One", "1");
                auto &two = cui->showMessagePopup ("Two", "2");
                REQUIRE (cui->popup () == &two);
                key (Key::enter);
                REQUIRE (cui->popup () == nullptr);
        }
}

TEST_CASE_METHOD (Fixture, "Loading", "[cui]")
{
        SECTION ("Icon")
        {
                int done{};
                cui->showLoadingIconPopup ("Wait", "Working", [&done] { ++done; });
                REQUIRE (cui->isLoading ());

                // Input is ignored while loading.
                key (Key::escape);
                key (Key::qLower);
                REQUIRE (cui->popup () != nullptr);
                REQUIRE (done == 0);

                cui->draw ();
                REQUIRE (disp->contains ("Working ..."));

                cui->stopLoadingPopup ();
                cui->draw ();
                REQUIRE (cui->popup () == nullptr);

                idle ();
                idle ();
                REQUIRE (done == 1);
        }

        SECTION ("Bar")
        {
                cui->showLoadingBarPopup ("Copying", 3);

                for (int i = 0; i < 3; ++i) {
                        cui->incrementLoadingBar ();
                }

                REQUIRE (cui->loadingProgress () == 3);
                cui->draw ();
                REQUIRE (!cui->isLoading ());
                REQUIRE (cui->popup () == nullptr);
        }

        SECTION ("Post loading callback set separately")
        {
                int done{};
                cui->setPostLoadingCallback ([&done] { ++done; });
                idle ();
                REQUIRE (done == 1);
        }

        SECTION ("Loop polls faster while loading")
        {
                int draws{};
                cui->setOnDraw ([this, &draws] {
                        if (++draws == 2) {
                                cui->stop ();
                        }
                });

                cui->showLoadingIconPopup ("Wait", "Working");
                cui->start ();
                REQUIRE (disp->lastTimeout () == Timeout{250ms});
        }
}

/****************************************************************************/

TEST_CASE_METHOD (Fixture, "Mouse", "[cui]")
{
        SECTION ("Click focuses")
        {
                click ({35, 4});
                REQUIRE (selected () == box);
                REQUIRE (cui->focusMode () == FocusMode::focused);
        }

        SECTION ("Click on a focused menu picks an item")
        {
                cui->moveFocus (*menu);
                click ({5, 3});
                REQUIRE (menu->get () == "two");
        }

        SECTION ("Click on the first click also reaches the widget")
        {
                click ({30, 10});
                REQUIRE (selected () == check);
                REQUIRE (check->get () == std::vector<std::string>{"b"});
        }

        SECTION ("Labels are not focused")
        {
                click ({10, 10});
                REQUIRE (selected () == menu);
                REQUIRE (cui->focusMode () == FocusMode::overview);
        }

        SECTION ("Title bar")
        {
                click ({10, 0});
                REQUIRE (cui->focusMode () == FocusMode::overview);
        }
}

TEST_CASE_METHOD (Fixture, "Resize", "[cui]")
{
        disp->resize ({20, 8});
        cui->processEvent (disp->poll ({}));
        REQUIRE (cui->isTooSmall ());

        cui->draw ();
        REQUIRE (disp->line (0).starts_with ("Error: TerminalToo"));

        disp->resize ({120, 40});
        idle ();
        REQUIRE (!cui->isTooSmall ());
        REQUIRE (cui->absoluteSize () == Dimensions{120, 40});
        REQUIRE (menu->width () == 40);
        REQUIRE (slider->startPosition () == Point{0, 25});

        SECTION ("Popups follow")
        {
                auto &p = cui->showMessagePopup ("T", "t");
                disp->resize ({80, 24});
                idle ();
                REQUIRE (p.startPosition () == Point{20, 8});
        }
}

/****************************************************************************/

TEST_CASE_METHOD (Fixture, "Drawing", "[cui]")
{
        cui->draw ();

        REQUIRE (disp->line (0).find ("termgrid") == 36);
        REQUIRE (disp->attributes ({0, 0}).color == colors::blackOnWhite);
        REQUIRE (disp->line (23).starts_with ("Press - q - to exit."));
        REQUIRE (disp->line (1).find (" Menu ") != std::string::npos);
        REQUIRE (disp->contains ("Label"));
        REQUIRE (!disp->cursorVisible ());
        REQUIRE (disp->refreshCount () == 1);

        SECTION ("Focused text box shows the cursor")
        {
                cui->moveFocus (*box);
                cui->draw ();
                REQUIRE (disp->cursorVisible ());
                REQUIRE (disp->cursor () == box->editor ().cursorPosition ());
        }

        SECTION ("Popups hide the cursor of the widgets")
        {
                cui->moveFocus (*box);
                cui->showMessagePopup ("Popup", "Text");
                cui->draw ();
                REQUIRE (!disp->cursorVisible ());
                REQUIRE (disp->contains ("Text"));
        }

        SECTION ("Unicode borders")
        {
                cui->toggleUnicodeBorders ();
                cui->draw ();
                REQUIRE (disp->at ({1, 1}) == "╭");
        }

        SECTION ("Title and status")
        {
                cui->setTitle ("App");
                cui->setStatusBarText ("Status");
                cui->draw ();
                REQUIRE (disp->line (0).find ("App") == 38);
                REQUIRE (disp->line (23).starts_with ("Status "));
        }

        SECTION ("Errors while drawing are shown")
        {
                cui->setOnDraw ([] { throw std::runtime_error ("bad thing"); });
                cui->draw ();
                REQUIRE (disp->line (23).starts_with ("Error: bad thing"));
                REQUIRE (disp->attributes ({0, 23}).color == colors::redOnBlack);
        }
}

/****************************************************************************/

TEST_CASE_METHOD (Fixture, "Widget sets", "[cui]")
{
        auto second = cui->createWidgetSet (2, 2);
        auto &back = second->addButton ("Back", {});
        std::unique_ptr<WidgetSet> stash;
        back.setCommand ([this, &stash] { stash = cui->applyWidgetSet (std::move (stash)); });

        button->setCommand ([this, &stash] { stash = cui->applyWidgetSet (std::move (stash)); });
        stash = std::move (second);

        cui->moveFocus (*box);

        SECTION ("Applying returns the previous set")
        {
                auto old = cui->applyWidgetSet (std::move (stash));
                REQUIRE (old->get (box->id ()) == box);
                REQUIRE (cui->widgetSet ().size () == 1);
                REQUIRE (cui->focusMode () == FocusMode::overview);
                REQUIRE (!box->isSelected ());
                REQUIRE (cui->widgetSet ().grid ().rows () == 2);
        }

        SECTION ("A button can switch sets")
        {
                key (Key::escape);
                key (Key::right);
                key (Key::right);
                key (Key::enter);
                REQUIRE (cui->widgetSet ().size () == 1);
                REQUIRE (stash->size () == 6);

                key (Key::enter);
                REQUIRE (cui->widgetSet ().size () == 6);
        }

        SECTION ("Also by mouse")
        {
                click ({60, 4});
                REQUIRE (cui->widgetSet ().size () == 1);

                click ({5, 5});
                REQUIRE (cui->widgetSet ().size () == 6);
        }

        SECTION ("Nothing to apply")
        {
                REQUIRE_THROWS_AS (cui->applyWidgetSet (nullptr), MissingParentError);
        }
}

/****************************************************************************/

TEST_CASE_METHOD (Fixture, "Main loop", "[cui]")
{
        bool exited{};
        cui->runOnExit ([&exited] { exited = true; });

        disp->pushKey (Key::right);
        disp->pushKey (Key::enter);
        disp->pushKeys ("hq");
        disp->pushKey (Key::escape);
        disp->pushKeys ("q");

        cui->start ();

        REQUIRE (exited);
        REQUIRE (!cui->isRunning ());
        REQUIRE (box->get () == "hq");
        REQUIRE (disp->pendingEvents () == 0);
        REQUIRE (disp->refreshCount () == 6);
}

TEST_CASE ("Exit key can be disabled", "[cui]")
{
        auto d = std::make_unique<MemoryDisplay> (Dimensions{80, 24});
        auto *disp = d.get ();
        Cui cui{3, 3, std::move (d), Config{.exitKey = std::nullopt}};
        cui.addKeyCommand (Key::escape, [&cui] { cui.stop (); });

        disp->pushKeys ("qQ");
        disp->pushKey (Key::escape);
        cui.start ();
        REQUIRE (disp->pendingEvents () == 0);
}

/****************************************************************************/

TEST_CASE_METHOD (Fixture, "Live debug", "[cui]")
{
        cui->logger ()->error ("oops");
        cui->logger ()->info ("not shown");

        cui->toggleLiveDebug ();
        REQUIRE (cui->isLiveDebugEnabled ());
        REQUIRE (cui->statusBarText () == cui->liveDebug ().helpText ());

        cui->draw ();
        REQUIRE (disp->contains ("error | oops"));
        REQUIRE (!disp->contains ("not shown"));

        // Keys stay in the overlay.
        key (Key::qLower);
        key (Key::right);
        REQUIRE (selected () == menu);

        key (Key::escape);
        REQUIRE (!cui->isLiveDebugEnabled ());

        SECTION ("Level")
        {
                cui->setLiveDebugLevel (spdlog::level::info);
                cui->logger ()->info ("now shown");
                cui->toggleLiveDebug ();
                REQUIRE (cui->liveDebug ().list ().size () == 2);
                REQUIRE (cui->liveDebug ().list ().get ()->ends_with ("info | now shown"));
                cui->draw ();
                REQUIRE (disp->contains ("now shown"));
        }
}

TEST_CASE_METHOD (Fixture, "Logging to a file", "[cui]")
{
        auto path = std::filesystem::temp_directory_path () / "termgrid-cui-test.log";
        cui->enableLogging (path.string (), spdlog::level::debug);
        cui->logger ()->debug ("hello file");
        cui->logger ()->flush ();

        std::ifstream in{path};
        std::stringstream text;
        text << in.rdbuf ();
        REQUIRE (text.str ().find ("hello file") != std::string::npos);
        REQUIRE (text.str ().find ("[Cui] Logging to") != std::string::npos);

        std::filesystem::remove (path);
}
