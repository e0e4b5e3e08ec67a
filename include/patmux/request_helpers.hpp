/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#ifndef REQUEST_HELPERS_HPP
#define REQUEST_HELPERS_HPP

#include "patmux/request.hpp"
#include "patmux/route_table.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * Lookup a string from the request environment. Throws 500 error if the
 * string isn't there and no default value is given.
 */
std::string fcgi_get_env(const request &req,
                         const char *name,
                         const char *default_value = nullptr);

/**
 * get the raw query string. a query string rewritten by the router wins
 * over $QUERY_STRING, which wins over whatever follows the '?' in
 * $REQUEST_URI.
 */
std::string get_query_string(const request &req);

/**
 * get the decoded request path: the path part of $REQUEST_URI with its
 * percent-escapes decoded ('+' stays '+'), or $PATH_INFO as it is if
 * $REQUEST_URI is missing. empty if neither is set.
 */
std::string get_request_path(const request &req);

/**
 * get the request method, e.g: "GET". empty if the transport didn't
 * provide one.
 */
std::string get_request_method(const request &req);

/**
 * append the route variables to the request's query string, so that
 * handlers can read them like any other query parameter. each one is
 * added as query_escape(":" + name) "=" query_escape(value), joined with
 * '&' and appended after any existing query with another '&'.
 *
 * the order of the added parameters is unspecified. an empty vars leaves
 * the query string untouched.
 */
void register_vars(request &req, const route_vars &vars);

/**
 * the query parameters, decoded, in the order they appear. route variables
 * show up here with their ':' prefix.
 */
std::vector<std::pair<std::string, std::string> > get_query_params(const request &req);

/**
 * value of the route variable name, as seen through the query string.
 */
std::optional<std::string> get_route_var(const request &req, const std::string &name);

/**
 * read a request body through read_chunk, which fills the buffer it is
 * given and returns how many bytes it wrote: 0 at the end of the body,
 * negative on error. the body may not grow beyond the configured max
 * payload, and has to be as long as content_length says, if that's set.
 */
std::string read_payload(const char *content_length,
                         const std::function<int(char *, int)> &read_chunk);

#endif /* REQUEST_HELPERS_HPP */
