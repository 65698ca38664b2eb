/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include <memory>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>
#include <string_view>

namespace tg {

using Logger = std::shared_ptr<spdlog::logger>;

/// Logger which drops everything. Default for elements created outside of a Cui.
Logger nullLogger ();

/// Returns l, or the null logger if l is empty.
inline Logger orNull (Logger l) { return (l) ? (l) : (nullLogger ()); }

constexpr std::string_view logPattern = "%Y-%m-%d %H:%M:%S.%e - %n - %l | %v";

} // namespace tg
