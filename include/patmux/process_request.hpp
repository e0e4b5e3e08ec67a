/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#ifndef PROCESS_REQUEST_HPP
#define PROCESS_REQUEST_HPP

#include "patmux/request.hpp"
#include "patmux/router.hpp"

/**
 * process a single request with the router, turning anything the handler
 * throws into an error response (or just a log message, if the response
 * was already under way).
 */
void process_request(request &req, const router &r);

#endif /* PROCESS_REQUEST_HPP */
