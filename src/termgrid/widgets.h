/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "checkboxList.h"
#include "element.h"
#include "grid.h"
#include "selectableList.h"
#include "slider.h"
#include "textBlockEditor.h"
#include "textEditor.h"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tg {

using WidgetId = ElementId;

/**
 * Where a widget lives in its grid, and how far its frame is inset from the cell
 * borders.
 */
struct Placement {
        Dimension row{};
        Dimension column{};
        Dimension rowSpan{1};
        Dimension columnSpan{1};
        Dimension padx{1};
        Dimension pady{0};
};

/**
 * Element bound to a range of grid cells. Throws MissingParentError without a grid
 * and OutOfBoundsError if the cells do not fit in it.
 */
class Widget : public UIElement {
public:
        Widget (WidgetId id, std::string title, Grid const *grid, Placement const &placement, Logger logger);

        Point absoluteStartPos () const override;
        Point absoluteStopPos () const override;

        /// Runs the key command bound to key, if any.
        void handleKeyPress (Key key) override;
        void handleMousePress (Point const &pos, MouseEvent event) override;

        void addKeyCommand (Key key, std::function<void ()> command);
        bool hasKeyCommand (Key key) const { return keyCommands.contains (key); }
        void addMouseCommand (MouseEvent event, std::function<void ()> command);

        void addTextColorRule (ColorRule rule) { rules.push_back (std::move (rule)); }
        std::vector<ColorRule> const &colorRules () const { return rules; }

        Placement const &placement () const { return placement_; }
        Grid const &grid () const { return *grid_; }

        /// True if the cell (row, column) is covered by this widget.
        bool isRowColumnInside (Dimension row, Dimension column) const;

protected:
        /// Sets up the renderer for this widget and draws the frame.
        void beginDraw (Renderer &r, bool withBorder = true, bool withTitle = true) const;
        void endDraw (Renderer &r) const;

        std::map<Key, std::function<void ()>> keyCommands;
        std::map<MouseEvent, std::function<void ()>> mouseCommands;

private:
        Grid const *grid_;
        Placement placement_;
        std::vector<ColorRule> rules;
};

/****************************************************************************/

namespace detail {

        /// Items of a list drawn one per row inside the element's frame.
        template <typename Item> void drawList (Renderer &r, UIElement const &element, SelectableList<Item> const &list)
        {
                auto [padx, pady] = element.padding ();
                auto firstRow = element.startPosition ().y () + pady + 1;
                auto labels = list.visibleLabels (element.viewportHeight ());

                for (int i = 0; i < int (labels.size ()); ++i) {
                        bool sel = list.topViewIndex () + i == list.selectedIndex ();
                        r.drawText (element, labels.at (i), firstRow + i, element.textAlignment (), true, sel);
                }
        }

        /// Selects the item under a click. Returns true if one was hit.
        template <typename Item> bool clickList (UIElement const &element, SelectableList<Item> &list, Point const &pos)
        {
                auto [padx, pady] = element.padding ();
                auto firstRow = element.startPosition ().y () + pady + 1;
                auto row = pos.y () - firstRow;

                if (row < 0 || row >= element.viewportHeight () || list.topViewIndex () + row >= int (list.size ())) {
                        return false;
                }

                list.setSelectedIndex (list.topViewIndex () + row);
                return true;
        }

        /// Scrolling keys shared by every menu.
        template <typename Item> bool scrollList (SelectableList<Item> &list, Key key, int viewportHeight)
        {
                switch (key) {
                case Key::up:
                        list.scrollUp ();
                        return true;

                case Key::down:
                        list.scrollDown (viewportHeight);
                        return true;

                case Key::home:
                        list.jumpToTop ();
                        return true;

                case Key::end:
                        list.jumpToBottom (viewportHeight);
                        return true;

                case Key::pageUp:
                        list.jumpUp ();
                        return true;

                case Key::pageDown:
                        list.jumpDown (viewportHeight);
                        return true;

                default:
                        return false;
                }
        }

} // namespace detail

/****************************************************************************/
/* Label                                                                    */
/****************************************************************************/

/**
 * Single line of text, centered in its cells. Can not be focused.
 */
class Label : public Widget {
public:
        Label (WidgetId id, std::string title, Grid const *grid, Placement const &placement, Logger logger);

        ElementKind kind () const override { return ElementKind::label; }
        bool isSelectable () const override { return false; }
        void draw (Renderer &r) override;

        void toggleBorder () { border = !border; }

private:
        bool border{};
};

/**
 * Multi line text (ascii art, banners). Lines come from the title.
 */
class BlockLabel : public Widget {
public:
        BlockLabel (WidgetId id, std::string title, Grid const *grid, Placement const &placement, bool center, Logger logger);

        ElementKind kind () const override { return ElementKind::blockLabel; }
        bool isSelectable () const override { return false; }
        void draw (Renderer &r) override;

        void toggleBorder () { border = !border; }

private:
        std::vector<std::string> lines;
        bool center;
        bool border{};
};

/****************************************************************************/
/* Menus                                                                    */
/****************************************************************************/

class ScrollMenu : public Widget {
public:
        using Command = std::function<void (std::string const &)>;

        ScrollMenu (WidgetId id, std::string title, Grid const *grid, Placement const &placement, Logger logger);

        ElementKind kind () const override { return ElementKind::scrollMenu; }
        void handleKeyPress (Key key) override;
        void handleMousePress (Point const &pos, MouseEvent event) override;
        void draw (Renderer &r) override;

        SelectableList<std::string> &list () { return list_; }
        SelectableList<std::string> const &list () const { return list_; }

        void addItem (std::string item) { list_.addItem (std::move (item)); }
        void addItemList (std::vector<std::string> const &items) { list_.addItemList (items); }
        void clear () { list_.clear (); }
        std::optional<std::string> get () const { return list_.get (); }

        /// Called with the selected item on Enter.
        void setCommand (Command c) { command = std::move (c); }

private:
        SelectableList<std::string> list_;
        Command command;
};

/*--------------------------------------------------------------------------*/

class CheckBoxMenu : public Widget {
public:
        using Command = std::function<void (std::string const &, bool)>;

        CheckBoxMenu (WidgetId id, std::string title, Grid const *grid, Placement const &placement, char checkedChar, Logger logger);

        ElementKind kind () const override { return ElementKind::checkBoxMenu; }
        void handleKeyPress (Key key) override;
        void handleMousePress (Point const &pos, MouseEvent event) override;
        void draw (Renderer &r) override;

        CheckboxList &list () { return list_; }
        CheckboxList const &list () const { return list_; }

        void addItem (std::string item) { list_.addItem (std::move (item)); }
        void addItemList (std::vector<std::string> const &items) { list_.addItemList (items); }
        std::vector<std::string> get () const { return list_.checkedItems (); }

        /// Called with the item and its new state whenever it is toggled.
        void setCommand (Command c) { command = std::move (c); }

private:
        void toggle ();

        CheckboxList list_;
        Command command;
};

/****************************************************************************/
/* Button                                                                   */
/****************************************************************************/

class Button : public Widget {
public:
        Button (WidgetId id, std::string title, Grid const *grid, Placement const &placement, std::function<void ()> command, Logger logger);

        ElementKind kind () const override { return ElementKind::button; }
        void handleKeyPress (Key key) override;

        /// A click on an already focused button presses it.
        void handleMousePress (Point const &pos, MouseEvent event) override;
        void draw (Renderer &r) override;

        /// Runs the command.
        void press ();
        void setCommand (std::function<void ()> c) { command = std::move (c); }

private:
        std::function<void ()> command;
};

/****************************************************************************/
/* Text                                                                     */
/****************************************************************************/

class TextBox : public Widget {
public:
        TextBox (WidgetId id, std::string title, Grid const *grid, Placement const &placement, std::string initialText, bool password,
                 Logger logger);

        ElementKind kind () const override { return ElementKind::textBox; }
        void updateHeightWidth () override;
        void handleKeyPress (Key key) override;
        void draw (Renderer &r) override;

        TextEditor &editor () { return editor_; }
        TextEditor const &editor () const { return editor_; }

        std::string const &get () const { return editor_.get (); }
        void setText (std::string t) { editor_.setText (std::move (t)); }
        void clear () { editor_.clear (); }

private:
        TextEditor editor_;
};

/*--------------------------------------------------------------------------*/

class ScrollTextBlock : public Widget {
public:
        ScrollTextBlock (WidgetId id, std::string title, Grid const *grid, Placement const &placement, std::string_view initialText,
                         Logger logger);

        ElementKind kind () const override { return ElementKind::textBlock; }
        void updateHeightWidth () override;
        void handleKeyPress (Key key) override;
        void draw (Renderer &r) override;

        TextBlockEditor &editor () { return editor_; }
        TextBlockEditor const &editor () const { return editor_; }

        std::string get () const { return editor_.get (); }
        void setText (std::string_view t) { editor_.setText (t); }
        void write (std::string_view t) { editor_.write (t); }
        void clear () { editor_.clear (); }

private:
        TextBlockEditor editor_;
};

/****************************************************************************/
/* Slider                                                                   */
/****************************************************************************/

enum class VerticalAlignment { top, middle, bottom };

class SliderWidget : public Widget {
public:
        SliderWidget (WidgetId id, std::string title, Grid const *grid, Placement const &placement, int min, int max, int step, int init,
                      Logger logger);

        ElementKind kind () const override { return ElementKind::slider; }
        void handleKeyPress (Key key) override;
        void draw (Renderer &r) override;

        SliderState &state () { return state_; }
        SliderState const &state () const { return state_; }
        int value () const { return state_.value (); }

        void toggleTitle () { titleEnabled = !titleEnabled; }
        void toggleBorder () { borderEnabled = !borderEnabled; }
        void toggleValue () { valueEnabled = !valueEnabled; }

        /// Throws InvalidValueError unless c is exactly one character.
        void setBarChar (std::string_view c);
        void alignTo (VerticalAlignment a) { verticalAlignment = a; }

        /// Bar of the given width, value appended when enabled.
        std::string generateBar (Dimension width) const;

private:
        SliderState state_;
        bool titleEnabled{true};
        bool borderEnabled{true};
        bool valueEnabled{true};
        char barChar{'#'};
        VerticalAlignment verticalAlignment{VerticalAlignment::middle};
};

} // namespace tg
