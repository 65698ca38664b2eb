/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "display.h"
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace tg {

/**
 * Display backed by a character buffer. Input comes from a queue filled by the
 * application (or a test), poll returns an empty event when the queue is drained.
 */
class MemoryDisplay : public IDisplay {
public:
        explicit MemoryDisplay (Dimensions size = {80, 24}, int maxColorPairs = 256);

        void print (Point const &pos, std::string_view str, Attributes const &attr) override;
        void clear () override;
        void refresh () override { ++refreshes; }

        void initColorPair (ColorPair id, int16_t fg, int16_t bg) override { pairs[id] = {fg, bg}; }
        int maxColorPairs () const override { return maxPairs; }

        Dimensions size () const override { return size_; }
        Event poll (Timeout timeout) override;

        void moveCursor (Point const &pos) override { cursor_ = pos; }
        void showCursor (bool visible) override { cursorVisible_ = visible; }
        void enableMouse (bool enabled) override { mouse_ = enabled; }

        /*---------------------------------------------------------------------------*/

        void push (Event const &e) { events.push_back (e); }
        void pushKey (Key k) { push (KeyEvent{k}); }
        void pushKeys (std::string_view chars);
        void pushClick (Point const &pos, MouseEvent ev = MouseEvent::leftClick) { push (MouseInput{pos, ev}); }

        /// Changes the buffer size and queues the resize event a terminal would send.
        void resize (Dimensions const &size);

        /// One row of the screen, one character per column.
        std::string line (Coordinate y) const;
        std::string at (Point const &pos) const;
        Attributes attributes (Point const &pos) const;

        /// True if any row contains str.
        bool contains (std::string_view str) const;

        Point cursor () const { return cursor_; }
        bool cursorVisible () const { return cursorVisible_; }
        bool mouseEnabled () const { return mouse_; }
        int refreshCount () const { return refreshes; }
        size_t pendingEvents () const { return events.size (); }
        Timeout lastTimeout () const { return lastTimeout_; }
        std::pair<int16_t, int16_t> colorPairOf (ColorPair id) const { return pairs.at (id); }

private:
        struct Cell {
                std::string chr{" "};
                Attributes attr{};
        };

        Dimensions size_;
        int maxPairs;
        std::vector<std::vector<Cell>> cells;
        std::deque<Event> events;
        std::map<ColorPair, std::pair<int16_t, int16_t>> pairs;
        Point cursor_{};
        bool cursorVisible_{};
        bool mouse_{};
        int refreshes{};
        Timeout lastTimeout_{};
};

} // namespace tg
