/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "colors.h"
#include "geometry.h"
#include "keys.h"
#include "logging.h"
#include "renderer.h"
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace tg {

using ElementId = uint32_t;

/**
 * Closed set of concrete element types. Used where behavior depends on the type
 * (buttons are pressed by auto focus), instead of inspecting types at runtime.
 */
enum class ElementKind {
        label,
        blockLabel,
        scrollMenu,
        checkBoxMenu,
        button,
        textBox,
        textBlock,
        slider,
        popup,
        formField,
        fileSelect,
        fileNameInput,
        dialogButton,
        liveDebug
};

using MouseHandler = std::function<void (Point const &, MouseEvent)>;

/**
 * Base of every widget, popup and popup sub element. Knows where it is (computed by
 * the subclass, cached by updateHeightWidth), how it is colored and how it reacts to
 * input. Elements are owned by exactly one container and cannot be copied.
 */
class UIElement {
public:
        UIElement (ElementId id, std::string title, Logger logger);
        UIElement (UIElement const &) = delete;
        UIElement &operator= (UIElement const &) = delete;
        UIElement (UIElement &&) noexcept = delete;
        UIElement &operator= (UIElement &&) noexcept = delete;
        virtual ~UIElement () = default;

        virtual ElementKind kind () const = 0;

        /// Top left corner, computed from the container (grid, root size or parent).
        virtual Point absoluteStartPos () const = 0;

        /// One past the bottom right corner.
        virtual Point absoluteStopPos () const = 0;

        /**
         * Re-derives the cached position and size. Subclasses extend it to re-layout
         * their viewports. Called after every resize and after a widget set is applied.
         */
        virtual void updateHeightWidth ();

        virtual void handleKeyPress (Key /* key */) {}

        /// Runs the user mouse handler, if any.
        virtual void handleMousePress (Point const &pos, MouseEvent event);

        /// Draws the element. Must not change its state (animation counters aside).
        virtual void draw (Renderer &renderer) = 0;

        virtual bool isSelectable () const { return true; }

        /*---------------------------------------------------------------------------*/

        Dimensions absoluteDimensions () const;

        /// Cached values, valid after updateHeightWidth.
        Point startPosition () const { return start_; }
        Point stopPosition () const { return stop_; }
        Dimension height () const { return height_; }
        Dimension width () const { return width_; }
        Rect rect () const { return {start_, {width_, height_}}; }

        /// Number of text rows inside the border.
        Dimension viewportHeight () const { return std::max (height_ - 2 * pady - 2, 0); }

        bool containsPosition (Point const &pos) const { return rect ().contains (pos); }

        /*---------------------------------------------------------------------------*/

        ElementId id () const { return id_; }

        std::string const &title () const { return title_; }
        void setTitle (std::string t) { title_ = std::move (t); }

        std::pair<Dimension, Dimension> padding () const { return {padx, pady}; }
        void setPadding (Dimension x, Dimension y);

        ColorPair color () const { return color_; }

        /// Changes the main color. Derived colors that were equal to the old one follow.
        void setColor (ColorPair c);

        ColorPair selectedColor () const { return selectedColor_; }
        void setSelectedColor (ColorPair c) { selectedColor_ = c; }

        /// Border color, which is the focus border color while selected.
        ColorPair borderColor () const { return (selected_) ? (focusBorderColor_) : (borderColor_); }
        void setBorderColor (ColorPair c) { borderColor_ = c; }
        void setFocusBorderColor (ColorPair c) { focusBorderColor_ = c; }

        bool isSelected () const { return selected_; }
        void setSelected (bool s) { selected_ = s; }

        std::string const &helpText () const { return helpText_; }
        void setHelpText (std::string t) { helpText_ = std::move (t); }

        Alignment textAlignment () const { return alignment; }
        void setTextAlignment (Alignment a) { alignment = a; }

        void setMousePressHandler (MouseHandler h) { mouseHandler = std::move (h); }

protected:
        ElementId id_;
        std::string title_;
        Dimension padx{1};
        Dimension pady{0};
        ColorPair color_{colors::whiteOnBlack};
        ColorPair borderColor_{colors::whiteOnBlack};
        ColorPair focusBorderColor_{colors::whiteOnBlack};
        ColorPair selectedColor_{colors::whiteOnBlack};
        bool selected_{};
        std::string helpText_{"No help text available."};
        Alignment alignment{Alignment::left};
        MouseHandler mouseHandler;
        Logger logger;

private:
        Point start_{};
        Point stop_{};
        Dimension height_{};
        Dimension width_{};
};

} // namespace tg
