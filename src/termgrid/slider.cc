/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "slider.h"
#include "errors.h"
#include <algorithm>
#include <fmt/format.h>

namespace tg {

SliderState::SliderState (int min, int max, int init, int step, Logger logger)
    : min_{min}, max_{max}, step_{step}, value_{init}, logger{orNull (std::move (logger))}
{
        if (min > max) {
                throw InvalidValueError (fmt::format ("Slider min {} is greater than max {}", min, max));
        }

        if (init < min || init > max) {
                throw InvalidValueError (fmt::format ("Initial slider value {} out of range [{}, {}]", init, min, max));
        }

        setStep (step);
}

/****************************************************************************/

int SliderState::update (int offset)
{
        value_ = std::clamp (value_ + offset * step_, min_, max_);
        logger->debug ("[Slider] value: {}", value_);
        return value_;
}

/****************************************************************************/

void SliderState::setStep (int step)
{
        if (step < 1) {
                throw InvalidValueError (fmt::format ("Slider step must be positive, got {}", step));
        }

        step_ = step;
}

/*--------------------------------------------------------------------------*/

void SliderState::setValue (int v) { value_ = std::clamp (v, min_, max_); }

} // namespace tg
