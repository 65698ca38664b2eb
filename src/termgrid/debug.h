/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "element.h"
#include "popups.h"
#include "selectableList.h"
#include <memory>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <string>
#include <string_view>
#include <vector>

namespace tg {
class WidgetSet;

using LiveDebugSink = spdlog::sinks::ringbuffer_sink_mt;
constexpr size_t liveDebugBufferSize = 100;
constexpr std::string_view liveDebugPattern = "%Y-%m-%d %H:%M:%S.%e - %l | %v";

std::string_view kindName (ElementKind kind);

/// Dumps id, kind and geometry of every widget at debug level.
void logLayout (WidgetSet const &set, spdlog::logger &logger);

/**
 * Overlay listing the last messages caught by the live debug sink, newest first.
 * Cui owns it and routes every key to it while it is shown.
 */
class LiveDebugElement : public UIElement {
public:
        LiveDebugElement (IRoot &root, std::shared_ptr<LiveDebugSink> sink, Logger logger);

        ElementKind kind () const override { return ElementKind::liveDebug; }

        /// (w/7 + 2, h/7 + 2) to (6 * (w/7) - 2, 6 * (h/7) - 2).
        Point absoluteStartPos () const override;
        Point absoluteStopPos () const override;
        void handleKeyPress (Key key) override;
        void handleMousePress (Point const &pos, MouseEvent event) override;
        void draw (Renderer &r) override;

        /// Re-reads the sink. The selection survives as long as the contents do not change.
        void update ();

        SelectableList<std::string> const &list () const { return list_; }

private:
        IRoot &root;
        std::shared_ptr<LiveDebugSink> sink;
        SelectableList<std::string> list_;
        std::vector<std::string> snapshot;
};

} // namespace tg
