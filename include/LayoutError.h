/**
 * @file LayoutError.h
 * @brief Error codes and the exception type raised when a layout session cannot be built.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <stdexcept>
#include <string>

/** @brief Failure categories of the layout engine. Only the first two are ever thrown. */
enum class LayoutErrc {
    InvalidLink,        /**< a link endpoint names an id absent from the node set (fatal to init) */
    DuplicateNodeId,    /**< two nodes share an id (fatal to init) */
    OutOfRangeIndex,    /**< pin with an index outside the node array (command dropped) */
    NumericInstability, /**< non-finite coordinate sanitized to 0 */
    UnknownCommand      /**< unrecognised command type (ignored) */
};

/** @brief Stable lowercase name of an error code, used in log lines. */
const char* layoutErrcName(LayoutErrc code);

/**
 * @class LayoutError
 * @brief Thrown by LayoutEngine::init when the supplied graph is rejected as a whole.
 */
class LayoutError : public std::runtime_error {
public:
    LayoutError(LayoutErrc code, const std::string& what)
        : std::runtime_error(std::string(layoutErrcName(code)) + ": " + what), errc(code) {}

    LayoutErrc code() const noexcept { return errc; }

private:
    LayoutErrc errc;
};
