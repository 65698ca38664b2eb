/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "element.h"
#include "selectableList.h"
#include "textEditor.h"
#include <array>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tg {

/**
 * What popups need from the root controller. Popups keep a reference to it to learn
 * the screen size and to close themselves.
 */
class IRoot {
public:
        IRoot () = default;
        IRoot (IRoot const &) = default;
        IRoot &operator= (IRoot const &) = default;
        IRoot (IRoot &&) noexcept = default;
        IRoot &operator= (IRoot &&) noexcept = default;
        virtual ~IRoot () = default;

        /// Size of the whole terminal.
        virtual Dimensions absoluteSize () const = 0;

        /// Closes the active popup. The object lives until the current event is handled.
        virtual void closePopup () = 0;

        virtual void showWarningPopup (std::string title, std::string text) = 0;

        virtual bool isLoading () const = 0;
        virtual int loadingProgress () const = 0;
        virtual void stopLoadingPopup () = 0;
};

/**
 * Modal element centered over the screen. Exactly one is active at a time (owned by
 * the root), or it is nested inside another popup which then owns it.
 */
class Popup : public UIElement {
public:
        Popup (IRoot &root, std::string title, std::string text, ColorPair color, Logger logger);

        ElementKind kind () const override { return ElementKind::popup; }

        /// (w/4, h/3) to (3w/4, 2h/3) of the screen.
        Point absoluteStartPos () const override;
        Point absoluteStopPos () const override;

        /**
         * Marks the popup closed. A top level popup also asks the root to drop it, a
         * nested one is dropped by its parent.
         */
        void close ();
        bool isClosed () const { return closed; }

        /// Nested popups do not talk to the root when closed.
        void setNested (bool n) { nested = n; }

        /// Loading popups are not given any key input.
        virtual bool isLoadingPopup () const { return false; }

        std::string const &text () const { return text_; }
        void setText (std::string t) { text_ = std::move (t); }

protected:
        /// Frame with the title, interior blanked.
        void drawFrame (Renderer &r) const;

        IRoot &root;
        std::string text_;

private:
        bool closed{};
        bool nested{};
};

/****************************************************************************/

/**
 * Text and nothing else. Enter, Space or Escape close it.
 */
class MessagePopup : public Popup {
public:
        MessagePopup (IRoot &root, std::string title, std::string text, ColorPair color, Logger logger);

        void handleKeyPress (Key key) override;
        void draw (Renderer &r) override;
};

/*--------------------------------------------------------------------------*/

/**
 * y or n. The popup closes before the command runs.
 */
class YesNoPopup : public Popup {
public:
        using Command = std::function<void (bool)>;

        YesNoPopup (IRoot &root, std::string title, ColorPair color, Command command, Logger logger);

        void handleKeyPress (Key key) override;
        void draw (Renderer &r) override;

private:
        void answer (bool yes);

        Command command;
};

/*--------------------------------------------------------------------------*/

class TextBoxPopup : public Popup {
public:
        using Command = std::function<void (std::string const &)>;

        TextBoxPopup (IRoot &root, std::string title, ColorPair color, Command command, bool password, Logger logger);

        void updateHeightWidth () override;
        void handleKeyPress (Key key) override;
        void draw (Renderer &r) override;

        TextEditor &editor () { return editor_; }

private:
        TextEditor editor_;
        Command command;
};

/*--------------------------------------------------------------------------*/

class MenuPopup : public Popup {
public:
        using Command = std::function<void (std::optional<std::string> const &)>;

        /**
         * Enter runs command with the selected item. Escape closes the popup and, only if
         * runCommandIfNone is set, runs command with nothing.
         */
        MenuPopup (IRoot &root, std::vector<std::string> const &items, std::string title, ColorPair color, Command command,
                   bool runCommandIfNone, Logger logger);

        void handleKeyPress (Key key) override;
        void handleMousePress (Point const &pos, MouseEvent event) override;
        void draw (Renderer &r) override;

        SelectableList<std::string> &list () { return list_; }

private:
        SelectableList<std::string> list_;
        Command command;
        bool runCommandIfNone;
};

/****************************************************************************/

/**
 * Spinner shown while a background task runs. Closes when the root stops loading.
 */
class LoadingIconPopup : public Popup {
public:
        static constexpr std::array<char, 4> icons{'\\', '|', '/', '-'};

        LoadingIconPopup (IRoot &root, std::string title, std::string message, ColorPair color, Logger logger);

        bool isLoadingPopup () const override { return true; }

        /// Advances the animation one frame.
        void draw (Renderer &r) override;

        int frame () const { return frame_; }

private:
        int frame_{};
};

/*--------------------------------------------------------------------------*/

/**
 * Progress bar of a background task. The task reports progress through the root
 * (incrementLoadingBar), the popup closes once all numItems are done.
 */
class LoadingBarPopup : public Popup {
public:
        LoadingBarPopup (IRoot &root, std::string title, int numItems, ColorPair color, Logger logger);

        bool isLoadingPopup () const override { return true; }
        void draw (Renderer &r) override;

        /// "####---- (done/total)" fitted in width.
        std::string generateBar (Dimension width, int done) const;

        int numItems () const { return total; }

private:
        int total;
        int frame_{};
};

} // namespace tg
