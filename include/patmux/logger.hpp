/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>
#include <string_view>

/**
 * Contains support for logging.
 */
namespace logger {

/**
 * Initialise logging. Messages are appended to filename, or go to stderr
 * if filename is "-". Calling it again re-opens the log, e.g: after it
 * has been rotated.
 */
void initialise(const std::string &filename);

/**
 * Log a message. Does nothing until logging has been initialised.
 */
void message(std::string_view m);
}

#endif /* LOGGER_HPP */
