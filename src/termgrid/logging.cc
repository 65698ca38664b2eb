/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "logging.h"
#include <spdlog/sinks/null_sink.h>

namespace tg {

Logger nullLogger ()
{
        static Logger instance = std::make_shared<spdlog::logger> ("null", std::make_shared<spdlog::sinks::null_sink_mt> ());
        return instance;
}

} // namespace tg
