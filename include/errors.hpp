#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <stdexcept>
#include <string>


///////////////////////////
///       ERRORS        ///
///////////////////////////
/**
 * @brief Raised when an event or occurrence cannot enter the catalog.
 *
 * Covers non-positive durations, unparseable start timestamps, empty titles
 * and venues that the transit table does not know about. Always thrown
 * before any optimization starts.
 */
class MalformedEventError : public std::runtime_error {
public:
    explicit MalformedEventError(const std::string& what)
            : std::runtime_error(what) {}
};

/**
 * @brief Raised when a transit table is incomplete or inconsistent.
 *
 * Covers missing venue pairs, asymmetric entries and negative minutes.
 */
class InfeasibleTransitTableError : public std::runtime_error {
public:
    explicit InfeasibleTransitTableError(const std::string& what)
            : std::runtime_error(what) {}
};
