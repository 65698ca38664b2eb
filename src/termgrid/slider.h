/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "logging.h"

namespace tg {

/**
 * Bounded integer value changed in steps. The value is clamped into [min, max] on
 * every update.
 */
class SliderState {
public:
        /// Throws InvalidValueError for init outside [min, max], min > max or step < 1.
        SliderState (int min, int max, int init, int step, Logger logger = {});

        /// value = clamp (value + offset * step). Returns the new value.
        int update (int offset);

        int value () const { return value_; }
        int min () const { return min_; }
        int max () const { return max_; }
        int step () const { return step_; }

        void setStep (int step);

        /// Clamped.
        void setValue (int v);

private:
        int min_;
        int max_;
        int step_;
        int value_;
        Logger logger;
};

} // namespace tg
