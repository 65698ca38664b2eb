/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "termgrid.h"
#include <algorithm>
#include <fmt/format.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace tg {
namespace {

        std::unique_ptr<IDisplay> checked (std::unique_ptr<IDisplay> display)
        {
                if (!display) {
                        throw MissingParentError ("Cui needs a display");
                }

                return display;
        }

        BorderCharacters const &borderCharacters (BorderStyle style) { return (style == BorderStyle::unicode) ? (borders::unicode) : (borders::ascii); }

} // namespace

/****************************************************************************/

Cui::Cui (Dimension rows, Dimension columns, std::unique_ptr<IDisplay> display, Config config, Logger logger)
    : config_{std::move (config)},
      logger_{(logger) ? (std::move (logger)) : (std::make_shared<spdlog::logger> ("termgrid"))},
      liveDebugSink{std::make_shared<LiveDebugSink> (liveDebugBufferSize)},
      display_{checked (std::move (display))},
      palette_{*display_},
      renderer_{*display_, borderCharacters (config_.borders)},
      size_{display_->size ()},
      titleBarOffset{(config_.title.empty ()) ? (0) : (1)},
      widgetSet_{createWidgetSet (rows, columns)}
{
        liveDebugSink->set_pattern (std::string{liveDebugPattern});
        liveDebugSink->set_level (spdlog::level::err);
        logger_->sinks ().push_back (liveDebugSink);
        liveDebug_ = std::make_unique<LiveDebugElement> (*this, liveDebugSink, logger_);

        palette_.initialize ();
        display_->enableMouse (config_.mouse);
        display_->showCursor (false);
        logger_->info ("[Cui] {}x{} grid on a {}x{} terminal", rows, columns, size_.width, size_.height);
}

/*--------------------------------------------------------------------------*/

Cui::~Cui ()
{
        auto &sinks = logger_->sinks ();
        std::erase (sinks, liveDebugSink);
}

/****************************************************************************/
/* Widget sets                                                              */
/****************************************************************************/

Dimensions Cui::gridArea () const { return {size_.width, size_.height - titleBarOffset - 1}; }

std::unique_ptr<WidgetSet> Cui::createWidgetSet (Dimension rows, Dimension columns) const
{
        return std::make_unique<WidgetSet> (rows, columns, gridArea (), titleBarOffset, logger_);
}

/*--------------------------------------------------------------------------*/

std::unique_ptr<WidgetSet> Cui::applyWidgetSet (std::unique_ptr<WidgetSet> set)
{
        if (!set) {
                throw MissingParentError ("Can not apply an empty widget set");
        }

        loseFocus ();

        try {
                set->resize (gridArea ());
                tooSmall = false;
        }
        catch (TooSmallError const &e) {
                logger_->error ("[Cui] {}", e.what ());
                tooSmall = true;
        }

        std::swap (set, widgetSet_);
        logger_->debug ("[Cui] Applied a widget set with {} widgets", widgetSet_->size ());
        logLayout (*widgetSet_, *logger_);
        return set;
}

/****************************************************************************/
/* Focus                                                                    */
/****************************************************************************/

Widget *Cui::selectedWidget ()
{
        auto id = widgetSet_->selectedWidget ();
        return (id) ? (widgetSet_->get (*id)) : (nullptr);
}

/*--------------------------------------------------------------------------*/

void Cui::moveFocus (Widget &w, bool autoPress)
{
        loseFocus ();

        if (widgetSet_->get (w.id ()) != &w || !widgetSet_->setSelectedWidget (w.id ())) {
                logger_->warn ("[Cui] Widget '{}' can not take the focus", w.title ());
                return;
        }

        if (config_.autoFocusButtons && autoPress && w.kind () == ElementKind::button) {
                static_cast<Button &> (w).press ();
                return;
        }

        w.setSelected (true);
        focusMode_ = FocusMode::focused;
        logger_->debug ("[Cui] Focused '{}'", w.title ());
}

/*--------------------------------------------------------------------------*/

void Cui::loseFocus ()
{
        if (focusMode_ != FocusMode::focused) {
                return;
        }

        focusMode_ = FocusMode::overview;

        if (auto *w = selectedWidget ()) {
                w->setSelected (false);
        }
}

/*--------------------------------------------------------------------------*/

void Cui::dropStaleFocus ()
{
        if (focusMode_ != FocusMode::focused) {
                return;
        }

        // The focused widget was removed from the set, the selection moved to a widget which was never focused.
        if (auto *w = selectedWidget (); w == nullptr || !w->isSelected ()) {
                logger_->debug ("[Cui] Focused widget is gone, back to overview");
                focusMode_ = FocusMode::overview;
        }
}

/*--------------------------------------------------------------------------*/

void Cui::cycleWidgets (bool reverse)
{
        auto const &all = widgetSet_->widgets ();

        if (all.empty ()) {
                return;
        }

        auto n = all.size ();
        size_t current = (reverse) ? (0) : (n - 1);

        if (auto id = widgetSet_->selectedWidget ()) {
                auto i = std::ranges::find_if (all, [id] (auto const &w) { return w->id () == *id; });
                current = size_t (std::distance (all.begin (), i));
        }

        for (size_t step = 1; step <= n; ++step) {
                auto idx = (reverse) ? ((current + n - step) % n) : ((current + step) % n);

                if (auto &w = *all.at (idx); w.isSelectable ()) {
                        moveFocus (w, false);
                        return;
                }
        }
}

/*--------------------------------------------------------------------------*/

Widget *Cui::neighbor (Widget const &from, Key direction)
{
        auto const &p = from.placement ();
        auto const &grid = widgetSet_->grid ();
        bool backward = (direction == Key::left || direction == Key::up);
        std::vector<Widget *> candidates;

        auto collect = [this, &from, &candidates] (Dimension row, Dimension column) {
                for (auto const &w : widgetSet_->widgets ()) {
                        if (w.get () != &from && w->isRowColumnInside (row, column) && std::ranges::find (candidates, w.get ()) == candidates.end ()) {
                                candidates.push_back (w.get ());
                        }
                }
        };

        if (direction == Key::left || direction == Key::right) {
                auto first = (backward) ? (0) : (p.column + p.columnSpan);
                auto last = (backward) ? (p.column) : (grid.columns ());

                for (auto column = first; column < last; ++column) {
                        for (auto row = p.row; row < p.row + p.rowSpan; ++row) {
                                collect (row, column);
                        }
                }
        }
        else {
                auto first = (backward) ? (0) : (p.row + p.rowSpan);
                auto last = (backward) ? (p.row) : (grid.rows ());

                for (auto row = first; row < last; ++row) {
                        for (auto column = p.column; column < p.column + p.columnSpan; ++column) {
                                collect (row, column);
                        }
                }
        }

        if (backward) {
                std::ranges::reverse (candidates);
        }

        auto i = std::ranges::find_if (candidates, [] (Widget const *w) { return w->isSelectable (); });
        return (i == candidates.end ()) ? (nullptr) : (*i);
}

/****************************************************************************/
/* Popups                                                                   */
/****************************************************************************/

MessagePopup &Cui::showMessagePopup (std::string title, std::string text, ColorPair color)
{
        return openPopup<MessagePopup> (std::move (title), std::move (text), color);
}

void Cui::showWarningPopup (std::string title, std::string text)
{
        openPopup<MessagePopup> (std::move (title), std::move (text), colors::yellowOnBlack);
}

MessagePopup &Cui::showErrorPopup (std::string title, std::string text)
{
        return openPopup<MessagePopup> (std::move (title), std::move (text), colors::redOnBlack);
}

YesNoPopup &Cui::showYesNoPopup (std::string title, YesNoPopup::Command command)
{
        return openPopup<YesNoPopup> (std::move (title), colors::yellowOnBlack, std::move (command));
}

TextBoxPopup &Cui::showTextBoxPopup (std::string title, TextBoxPopup::Command command, bool password)
{
        return openPopup<TextBoxPopup> (std::move (title), colors::whiteOnBlack, std::move (command), password);
}

MenuPopup &Cui::showMenuPopup (std::vector<std::string> const &items, std::string title, MenuPopup::Command command, bool runCommandIfNone)
{
        return openPopup<MenuPopup> (items, std::move (title), colors::whiteOnBlack, std::move (command), runCommandIfNone);
}

/*--------------------------------------------------------------------------*/

LoadingIconPopup &Cui::showLoadingIconPopup (std::string title, std::string message, std::function<void ()> callback)
{
        loading = true;
        progress = 0;

        if (callback) {
                postLoading = std::move (callback);
        }

        return openPopup<LoadingIconPopup> (std::move (title), std::move (message), colors::yellowOnBlack);
}

LoadingBarPopup &Cui::showLoadingBarPopup (std::string title, int numItems, std::function<void ()> callback)
{
        loading = true;
        progress = 0;

        if (callback) {
                postLoading = std::move (callback);
        }

        return openPopup<LoadingBarPopup> (std::move (title), numItems, colors::yellowOnBlack);
}

/*--------------------------------------------------------------------------*/

FormPopup &Cui::showFormPopup (std::string title, std::vector<FormPopup::FieldSpec> const &fields, FormPopup::Command command)
{
        return openPopup<FormPopup> (fields, std::move (title), colors::whiteOnBlack, std::move (command));
}

FileDialogPopup &Cui::showFileDialog (DialogType type, FileDialogPopup::Command command, std::filesystem::path const &initialDir,
                                      std::vector<std::string> extensions, bool showHidden)
{
        return openPopup<FileDialogPopup> (std::move (command), initialDir, type, std::move (extensions), showHidden, colors::whiteOnBlack);
}

/*--------------------------------------------------------------------------*/

void Cui::closePopup ()
{
        if (!popup_) {
                return;
        }

        logger_->debug ("[Cui] Closing popup '{}'", popup_->title ());
        retired.push_back (std::move (popup_));
}

/*--------------------------------------------------------------------------*/

void Cui::stopLoadingPopup ()
{
        loading = false;
        logger_->debug ("[Cui] Loading stopped");
}

/****************************************************************************/
/* Look and logging                                                         */
/****************************************************************************/

std::string const &Cui::statusBarText () const
{
        if (liveDebugEnabled) {
                return liveDebug_->helpText ();
        }

        if (popup_) {
                return popup_->helpText ();
        }

        if (focusMode_ == FocusMode::focused) {
                if (auto id = widgetSet_->selectedWidget ()) {
                        if (auto const *w = widgetSet_->get (*id)) {
                                return w->helpText ();
                        }
                }
        }

        return config_.statusBarText;
}

/*--------------------------------------------------------------------------*/

void Cui::toggleUnicodeBorders ()
{
        config_.borders = (config_.borders == BorderStyle::ascii) ? (BorderStyle::unicode) : (BorderStyle::ascii);
        renderer_.setBorderCharacters (borderCharacters (config_.borders));
}

/*--------------------------------------------------------------------------*/

void Cui::toggleLiveDebug ()
{
        liveDebugEnabled = !liveDebugEnabled;

        if (liveDebugEnabled) {
                liveDebug_->updateHeightWidth ();
                liveDebug_->update ();
        }
}

void Cui::setLiveDebugLevel (spdlog::level::level_enum level)
{
        liveDebugSink->set_level (level);

        if (level < logger_->level ()) {
                logger_->set_level (level);
        }
}

/*--------------------------------------------------------------------------*/

void Cui::enableLogging (std::string const &path, spdlog::level::level_enum level)
{
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt> (path, true);
        sink->set_pattern (std::string{logPattern});
        sink->set_level (level);
        logger_->sinks ().push_back (sink);

        if (level < logger_->level ()) {
                logger_->set_level (level);
        }

        logger_->info ("[Cui] Logging to {}", path);
}

/****************************************************************************/
/* Loop                                                                     */
/****************************************************************************/

void Cui::start ()
{
        running = true;
        logger_->info ("[Cui] Starting");
        draw ();

        while (running) {
                auto timeout = (loading) ? (Timeout{config_.loadingTimeout}) : (config_.pollTimeout);
                processEvent (display_->poll (timeout));

                if (running) {
                        draw ();
                }
        }

        logger_->info ("[Cui] Stopped");

        if (onExit) {
                onExit ();
        }
}

void Cui::stop ()
{
        logger_->debug ("[Cui] Stopping");
        running = false;
}

/*--------------------------------------------------------------------------*/

void Cui::processEvent (Event const &e)
{
        retired.clear ();
        dropStaleFocus ();

        if (auto size = display_->size (); std::holds_alternative<ResizeEvent> (e) || size != size_) {
                handleResize (size);
        }

        if (auto const *m = std::get_if<MouseInput> (&e)) {
                handleMouse (*m);
        }

        if (!loading && postLoading) {
                auto callback = std::move (postLoading);
                postLoading = nullptr;
                callback ();
        }

        if (auto const *k = std::get_if<KeyEvent> (&e)) {
                handleKey (k->key);
        }
}

/*--------------------------------------------------------------------------*/

void Cui::handleResize (Dimensions size)
{
        size_ = size;
        logger_->info ("[Cui] Resized to {}x{}", size.width, size.height);

        if (popup_) {
                popup_->updateHeightWidth ();
        }

        liveDebug_->updateHeightWidth ();

        try {
                widgetSet_->resize (gridArea ());
                tooSmall = false;
        }
        catch (TooSmallError const &e) {
                logger_->error ("[Cui] {}", e.what ());
                tooSmall = true;
        }
}

/*--------------------------------------------------------------------------*/

void Cui::handleMouse (MouseInput const &m)
{
        if (liveDebugEnabled) {
                if (liveDebug_->containsPosition (m.position)) {
                        liveDebug_->handleMousePress (m.position, m.event);
                }

                return;
        }

        if (popup_) {
                if (auto *p = popup_.get (); p->containsPosition (m.position)) {
                        p->handleMousePress (m.position, m.event);
                }

                return;
        }

        auto const &all = widgetSet_->widgets ();
        auto i = std::ranges::find_if (all, [&m] (auto const &w) { return w->containsPosition (m.position); });

        if (i == all.end ()) {
                return;
        }

        auto *set = widgetSet_.get ();
        auto *hit = i->get ();
        auto id = hit->id ();

        if (hit->isSelectable () && !(focusMode_ == FocusMode::focused && selectedWidget () == hit)) {
                moveFocus (*hit, true);

                // A button command may have replaced the widget set.
                if (widgetSet_.get () != set || set->get (id) != hit) {
                        return;
                }
        }

        hit->handleMousePress (m.position, m.event);
}

/*--------------------------------------------------------------------------*/

void Cui::handleKey (Key key)
{
        if (key == Key::unknown) {
                return;
        }

        if (liveDebugEnabled) {
                if (key == Key::escape) {
                        toggleLiveDebug ();
                }
                else {
                        liveDebug_->handleKeyPress (key);
                }

                return;
        }

        if (popup_) {
                // Loading popups ignore input, they close when the loading stops.
                if (auto *p = popup_.get (); !p->isLoadingPopup ()) {
                        p->handleKeyPress (key);
                }

                return;
        }

        auto *selected = selectedWidget ();
        bool claimed = focusMode_ == FocusMode::focused && selected != nullptr && selected->hasKeyCommand (key);

        if (!claimed && (key == config_.forwardCycleKey || key == config_.reverseCycleKey)) {
                cycleWidgets (key == config_.reverseCycleKey);
                return;
        }

        if (focusMode_ == FocusMode::focused && selected != nullptr) {
                if (key == Key::escape) {
                        loseFocus ();
                }
                else {
                        selected->handleKeyPress (key);
                }

                return;
        }

        handleOverviewKey (key);
}

/*--------------------------------------------------------------------------*/

void Cui::handleOverviewKey (Key key)
{
        if (config_.exitKey && key == *config_.exitKey) {
                stop ();
                return;
        }

        auto *selected = selectedWidget ();

        if (key == Key::enter && selected != nullptr && selected->isSelectable ()) {
                moveFocus (*selected, true);
                return;
        }

        auto const &commands = widgetSet_->keyCommands ();

        if (auto i = commands.find (key); i != commands.end ()) {
                // Copied, the command may replace the widget set together with this map.
                auto command = i->second;
                command ();
                return;
        }

        if (isArrow (key) && selected != nullptr) {
                if (auto *n = neighbor (*selected, key)) {
                        widgetSet_->setSelectedWidget (n->id ());
                        logger_->debug ("[Cui] Selected '{}'", n->title ());
                }
        }
}

/****************************************************************************/
/* Drawing                                                                  */
/****************************************************************************/

void Cui::drawTitleBar ()
{
        if (titleBarOffset == 0) {
                return;
        }

        renderer_.setColorMode (config_.titleBarColor);
        renderer_.print ({0, 0}, detail::align (config_.title, size_.width, Alignment::center));
        renderer_.unsetColorMode ();
}

void Cui::drawStatusBar ()
{
        renderer_.setColorMode (config_.statusBarColor);
        renderer_.print ({0, size_.height - 1}, detail::align (statusBarText (), size_.width, Alignment::left));
        renderer_.unsetColorMode ();
}

/*--------------------------------------------------------------------------*/

void Cui::draw ()
{
        dropStaleFocus ();
        display_->clear ();
        renderer_.resetCursor ();
        renderer_.unsetColorMode ();
        renderer_.resetColorRules ();

        try {
                if (tooSmall) {
                        renderer_.setColorMode (colors::redOnBlack);
                        renderer_.print ({0, 0}, "Error: TerminalTooSmall - please resize terminal");
                        renderer_.unsetColorMode ();
                }
                else {
                        drawTitleBar ();
                        drawStatusBar ();
                        auto selectedId = widgetSet_->selectedWidget ();

                        for (auto const &w : widgetSet_->widgets ()) {
                                if (selectedId != w->id ()) {
                                        w->draw (renderer_);
                                }
                        }

                        // Last, so its cursor is the one left on the screen.
                        if (auto *w = selectedWidget ()) {
                                w->draw (renderer_);
                        }

                        if (popup_) {
                                renderer_.resetCursor ();
                                popup_->draw (renderer_);
                        }

                        if (liveDebugEnabled) {
                                renderer_.resetCursor ();
                                liveDebug_->draw (renderer_);
                        }

                        if (onDraw) {
                                onDraw ();
                        }
                }
        }
        catch (std::exception const &e) {
                logger_->error ("[Cui] Drawing failed: {}", e.what ());
                renderer_.resetCursor ();
                renderer_.resetColorRules ();
                renderer_.setColorMode (colors::redOnBlack);
                renderer_.print ({0, size_.height - 1}, detail::align (fmt::format ("Error: {}", e.what ()), size_.width, Alignment::left));
                renderer_.unsetColorMode ();
        }

        if (auto const &c = renderer_.cursor ()) {
                display_->moveCursor (*c);
                display_->showCursor (true);
        }
        else {
                display_->showCursor (false);
        }

        display_->refresh ();
}

} // namespace tg
