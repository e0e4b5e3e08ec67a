/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#include "patmux/process_request.hpp"
#include "patmux/http.hpp"
#include "patmux/logger.hpp"
#include "patmux/request_helpers.hpp"

#include <algorithm>
#include <chrono>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>


namespace {

void respond_error(const http::exception &e, request &r) {
  logger::message(fmt::format("Returning with http error {} with reason {}",
                  e.code(), e.what()));

  std::string message(e.what());

  std::string message_error_header = message.substr(0, 250);                           // limit HTTP header to 250 chars
  std::replace(message_error_header.begin(), message_error_header.end(), '\n', ' ');   // replace newline by space (newlines screw up HTTP header)

  r.status(e.code())
    .add_header("Content-Type", "text/plain")
    .add_header("Content-Length", std::to_string(message.size()))
    .add_header("Error", message_error_header)
    .add_header("Cache-Control", "no-cache");

  if (auto not_allowed = dynamic_cast<const http::method_not_allowed*>(&e)) {
    r.add_header("Allow", fmt::format("{}", fmt::join(not_allowed->allowed_methods, ", ")));
  }

  r.put(message);   // output the message as well

  r.finish();
}

} // anonymous namespace

void process_request(request &req, const router &r) {
  const auto start_time = std::chrono::steady_clock::now();

  const auto method = get_request_method(req);
  const auto path = get_request_path(req);

  try {
    r.serve(req);

  } catch (const http::exception &e) {
    if (req.headers_sent()) {
      logger::message(fmt::format("Error {} after response started for {} {}: {}",
                                  e.code(), method, path, e.what()));
    } else {
      respond_error(e, req);
    }

  } catch (const std::exception &e) {
    if (req.headers_sent()) {
      logger::message(fmt::format("Error after response started for {} {}: {}",
                                  method, path, e.what()));
    } else {
      // errors which the handler didn't map to an HTTP status are our
      // fault, as far as the client is concerned.
      respond_error(http::server_error(e.what()), req);
    }
  }

  const auto end_time = std::chrono::steady_clock::now();
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

  logger::message(fmt::format("Completed {} {} in {:d} ms", method, path, elapsed.count()));
}
