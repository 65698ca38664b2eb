/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "colors.h"
#include "debug.h"
#include "display.h"
#include "errors.h"
#include "fileDialog.h"
#include "form.h"
#include "geometry.h"
#include "grid.h"
#include "keys.h"
#include "logging.h"
#include "popups.h"
#include "renderer.h"
#include "widgetSet.h"
#include "widgets.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tg {

/**
 * Settings of the root controller. All fields have usable defaults, so
 * Config{.title = "app"} style initialization is enough.
 */
struct Config {
        /// Stops the loop when pressed in overview mode with no popup shown. std::nullopt disables it.
        std::optional<Key> exitKey{Key::qLower};

        /// Moving the focus onto a button (Enter, click) presses it instead of focusing it.
        bool autoFocusButtons{true};
        Key forwardCycleKey{Key::ctrlRight};
        Key reverseCycleKey{Key::ctrlLeft};

        /// How long poll waits for input. Empty blocks until something happens.
        Timeout pollTimeout{};

        /// Used instead of pollTimeout while a loading popup animates.
        std::chrono::milliseconds loadingTimeout{250};

        BorderStyle borders{BorderStyle::ascii};
        bool mouse{true};

        /// Text of the title bar. The bar (first row) is not reserved at all when this is empty.
        std::string title{"termgrid"};
        std::string statusBarText{"Press - q - to exit. Arrow Keys to move between widgets. Enter to enter focus mode."};
        ColorPair titleBarColor{colors::blackOnWhite};
        ColorPair statusBarColor{colors::blackOnWhite};
};

enum class FocusMode { overview, focused };

/**
 * Root controller. Owns the display, the active widget set and at most one popup, and
 * runs the input / render loop. Keys go to the live debug overlay, the popup, the
 * focused widget or the overview navigation, in that order of precedence.
 */
class Cui : public IRoot {
public:
        /**
         * rows and columns describe the grid of the first widget set. Throws
         * MissingParentError without a display and TooSmallError if the terminal can not
         * hold the grid. When logger is empty a logger named "termgrid" is created.
         */
        Cui (Dimension rows, Dimension columns, std::unique_ptr<IDisplay> display, Config config = {}, Logger logger = {});
        Cui (Cui const &) = delete;
        Cui &operator= (Cui const &) = delete;
        Cui (Cui &&) = delete;
        Cui &operator= (Cui &&) = delete;
        ~Cui () override;

        /*--------------------------------------------------------------------------*/
        /* Widget sets                                                              */
        /*--------------------------------------------------------------------------*/

        WidgetSet &widgetSet () { return *widgetSet_; }
        WidgetSet const &widgetSet () const { return *widgetSet_; }

        /// A new set sized for the current terminal. It is not shown until applied.
        std::unique_ptr<WidgetSet> createWidgetSet (Dimension rows, Dimension columns) const;

        /// Shows set, returns the one shown before. The focus goes back to overview.
        std::unique_ptr<WidgetSet> applyWidgetSet (std::unique_ptr<WidgetSet> set);

        /// Overview mode key command of the active set.
        void addKeyCommand (Key key, std::function<void ()> command) { widgetSet_->addKeyCommand (key, std::move (command)); }

        /*--------------------------------------------------------------------------*/
        /* Focus                                                                    */
        /*--------------------------------------------------------------------------*/

        FocusMode focusMode () const { return focusMode_; }

        /// Widget highlighted in overview mode (and the focused one in focused mode).
        Widget *selectedWidget ();

        /**
         * Selects w and enters focused mode. If autoPress is set and buttons are auto
         * focused, a button is pressed instead and the mode stays overview.
         */
        void moveFocus (Widget &w, bool autoPress = true);

        /// Back to overview mode, the selection stays.
        void loseFocus ();

        /// Focuses the next (previous) selectable widget in creation order.
        void cycleWidgets (bool reverse = false);

        /*--------------------------------------------------------------------------*/
        /* Popups                                                                   */
        /*--------------------------------------------------------------------------*/

        MessagePopup &showMessagePopup (std::string title, std::string text, ColorPair color = colors::whiteOnBlack);
        void showWarningPopup (std::string title, std::string text) override;
        MessagePopup &showErrorPopup (std::string title, std::string text);
        YesNoPopup &showYesNoPopup (std::string title, YesNoPopup::Command command);
        TextBoxPopup &showTextBoxPopup (std::string title, TextBoxPopup::Command command, bool password = false);
        MenuPopup &showMenuPopup (std::vector<std::string> const &items, std::string title, MenuPopup::Command command,
                                  bool runCommandIfNone = false);

        /// callback runs once the loading stops (see stopLoadingPopup).
        LoadingIconPopup &showLoadingIconPopup (std::string title, std::string message, std::function<void ()> callback = {});
        LoadingBarPopup &showLoadingBarPopup (std::string title, int numItems, std::function<void ()> callback = {});

        FormPopup &showFormPopup (std::string title, std::vector<FormPopup::FieldSpec> const &fields, FormPopup::Command command);
        FileDialogPopup &showFileDialog (DialogType type, FileDialogPopup::Command command, std::filesystem::path const &initialDir = ".",
                                         std::vector<std::string> extensions = {}, bool showHidden = false);

        /// Drops the popup. It is destroyed when the next event is processed.
        void closePopup () override;
        Popup *popup () { return popup_.get (); }

        /*--------------------------------------------------------------------------*/
        /* Loading. Safe to call from any thread.                                   */
        /*--------------------------------------------------------------------------*/

        void incrementLoadingBar () { ++progress; }
        void stopLoadingPopup () override;
        bool isLoading () const override { return loading; }
        int loadingProgress () const override { return progress; }

        /// Runs (once) in the loop after the loading stops.
        void setPostLoadingCallback (std::function<void ()> cb) { postLoading = std::move (cb); }

        /*--------------------------------------------------------------------------*/
        /* Look                                                                     */
        /*--------------------------------------------------------------------------*/

        Dimensions absoluteSize () const override { return size_; }

        void setTitle (std::string t) { config_.title = std::move (t); }
        void setStatusBarText (std::string t) { config_.statusBarText = std::move (t); }

        /// What the status bar shows now: help of the popup, of the focused widget, or the default text.
        std::string const &statusBarText () const;

        void toggleUnicodeBorders ();
        void setBorderCharacters (BorderCharacters const &b) { renderer_.setBorderCharacters (b); }
        void setRefreshTimeout (std::chrono::milliseconds t) { config_.pollTimeout = t; }

        /// Called at the end of every draw.
        void setOnDraw (std::function<void ()> f) { onDraw = std::move (f); }

        /// Called when the loop ends.
        void runOnExit (std::function<void ()> f) { onExit = std::move (f); }

        /*--------------------------------------------------------------------------*/
        /* Logging                                                                  */
        /*--------------------------------------------------------------------------*/

        void toggleLiveDebug ();
        bool isLiveDebugEnabled () const { return liveDebugEnabled; }
        LiveDebugElement &liveDebug () { return *liveDebug_; }

        /// Minimum level of the messages caught for the live debug overlay (error by default).
        void setLiveDebugLevel (spdlog::level::level_enum level);

        /// Appends everything at level or above to the file at path (truncated first).
        void enableLogging (std::string const &path, spdlog::level::level_enum level = spdlog::level::debug);

        Logger const &logger () const { return logger_; }

        /*--------------------------------------------------------------------------*/
        /* Loop                                                                     */
        /*--------------------------------------------------------------------------*/

        /// Draws and handles events until stop is called or the exit key is pressed.
        void start ();
        void stop ();
        bool isRunning () const { return running; }

        /// One iteration of the loop without waiting: handles e (and any resize).
        void processEvent (Event const &e);

        /// Renders the whole screen.
        void draw ();

        bool isTooSmall () const { return tooSmall; }

        IDisplay &display () { return *display_; }
        Renderer &renderer () { return renderer_; }
        Palette &palette () { return palette_; }
        Config const &config () const { return config_; }

private:
        template <typename P, typename... Args> P &openPopup (Args &&...args)
        {
                auto p = std::make_unique<P> (*this, std::forward<Args> (args)..., logger_);
                auto &ref = *p;

                if (popup_) {
                        retired.push_back (std::move (popup_));
                }

                logger_->debug ("[Cui] Opening popup '{}'", ref.title ());
                popup_ = std::move (p);
                return ref;
        }

        /// Back to overview if the focused widget no longer exists.
        void dropStaleFocus ();

        Dimensions gridArea () const;
        void handleResize (Dimensions size);
        void handleMouse (MouseInput const &m);
        void handleKey (Key key);
        void handleOverviewKey (Key key);

        /// Nearest selectable widget in the direction of an arrow key.
        Widget *neighbor (Widget const &from, Key direction);

        void drawTitleBar ();
        void drawStatusBar ();

        Config config_;
        Logger logger_;
        std::shared_ptr<LiveDebugSink> liveDebugSink;
        std::unique_ptr<IDisplay> display_;
        Palette palette_;
        Renderer renderer_;
        Dimensions size_;
        Coordinate titleBarOffset;
        std::unique_ptr<WidgetSet> widgetSet_;
        std::unique_ptr<Popup> popup_;
        std::vector<std::unique_ptr<Popup>> retired;
        std::unique_ptr<LiveDebugElement> liveDebug_;
        FocusMode focusMode_{FocusMode::overview};
        bool liveDebugEnabled{};
        bool tooSmall{};
        bool running{};
        std::atomic<bool> loading{};
        std::atomic<int> progress{};
        std::function<void ()> postLoading;
        std::function<void ()> onDraw;
        std::function<void ()> onExit;
};

} // namespace tg
