/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include <stdexcept>
#include <string>

namespace tg {

/**
 * Base of everything termgrid throws. Construction errors are always
 * propagated to the caller, nothing inside the library swallows them.
 */
class Error : public std::runtime_error {
public:
        using std::runtime_error::runtime_error;
};

/// Terminal (or the grid area) too small for the requested number of rows / columns.
class TooSmallError : public Error {
public:
        using Error::Error;
};

/// Widget placed (partially) outside its grid.
class OutOfBoundsError : public Error {
public:
        using Error::Error;
};

/// Element created without the grid, root or display it depends on.
class MissingParentError : public Error {
public:
        using Error::Error;
};

class InvalidValueError : public Error {
public:
        using Error::Error;
};

class DuplicateFormKeyError : public Error {
public:
        using Error::Error;
};

} // namespace tg
