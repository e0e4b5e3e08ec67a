/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#include "patmux/request_helpers.hpp"
#include "patmux/http.hpp"
#include "patmux/options.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <cstring>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace {

// prefix which sets route variables apart from ordinary query parameters.
const char route_var_prefix = ':';

}

std::string fcgi_get_env(const request &req, const char *name, const char *default_value) {
  assert(name);
  const char *v = req.get_param(name);

  if (v == nullptr) {
    if (default_value) {
      v = default_value;
    } else {
      throw http::server_error(fmt::format("request didn't set the ${} environment variable.", name));
    }
  }

  return std::string(v);
}

std::string get_query_string(const request &req) {
  if (const auto &rewritten = req.query_string_override(); rewritten) {
    return *rewritten;
  }

  // try the query string that's supposed to be present first
  const auto *query_string = req.get_param("QUERY_STRING");

  // if that isn't present, then this may be being invoked as part of a
  // 404 handler, so look at the request uri instead.
  if (query_string == nullptr || strlen(query_string) == 0) {
    const char *request_uri = req.get_param("REQUEST_URI");

    if ((request_uri == nullptr) || (strlen(request_uri) == 0)) {
      return {};
    }

    const char *request_uri_end = request_uri + strlen(request_uri);
    const auto *question_mark = std::find(request_uri, request_uri_end, '?');
    if (question_mark == request_uri_end) {
      return {};
    } else {
      return {question_mark + 1};
    }

  } else {
    return {query_string};
  }
}

std::string get_request_path(const request &req) {
  const char *request_uri = req.get_param("REQUEST_URI");

  if ((request_uri == nullptr) || (strlen(request_uri) == 0)) {
    // the web server has already decoded PATH_INFO, so it is used as it
    // is. decoding it again would turn a literal "%2F" into a '/'.
    const char *path_info = req.get_param("PATH_INFO");

    // no path at all is treated like an empty one, which the router
    // canonicalises to "/".
    if (path_info == nullptr) {
      return {};
    }
    return {path_info};
  }

  const char *request_uri_end = request_uri + strlen(request_uri);
  // the only valid position for the '?' char is at the beginning of the
  // query string.
  const auto *question_mark = std::find(request_uri, request_uri_end, '?');
  return http::path_unescape(std::string_view(request_uri, question_mark - request_uri));
}

std::string get_request_method(const request &req) {
  return fcgi_get_env(req, "REQUEST_METHOD", "");
}

void register_vars(request &req, const route_vars &vars) {
  if (vars.empty())
    return;

  std::vector<std::string> parts;
  parts.reserve(vars.size());
  for (const auto &[key, value] : vars) {
    parts.push_back(fmt::format("{}={}",
                                http::query_escape(route_var_prefix + key),
                                http::query_escape(value)));
  }

  auto q = fmt::format("{}", fmt::join(parts, "&"));
  auto existing = get_query_string(req);

  if (existing.empty()) {
    req.set_query_string(std::move(q));
  } else {
    req.set_query_string(fmt::format("{}&{}", existing, q));
  }
}

std::vector<std::pair<std::string, std::string> > get_query_params(const request &req) {
  auto params = http::parse_params(get_query_string(req));
  for (auto &[key, value] : params) {
    key = http::urldecode(key);
    value = http::urldecode(value);
  }
  return params;
}

std::optional<std::string> get_route_var(const request &req, const std::string &name) {
  const auto key = route_var_prefix + name;
  const auto params = get_query_params(req);
  auto itr = std::ranges::find_if(params,
    [&key](const auto &param) -> bool {
      return param.first == key;
    });
  if (itr == params.end())
    return {};
  return itr->second;
}

std::string read_payload(const char *content_length,
                         const std::function<int(char *, int)> &read_chunk) {

  const unsigned long expected = content_length ? http::parse_content_length(content_length) : 0;
  const auto limit = global_settings::get_payload_max_size();

  std::string body;
  std::array<char, 16384> chunk;
  int len = 0;

  while ((len = read_chunk(chunk.data(), static_cast<int>(chunk.size()))) > 0) {
    body.append(chunk.data(), len);

    if (body.size() > limit)
      throw http::payload_too_large(fmt::format("Payload exceeds limit of {:d} bytes", limit));
  }

  if (len < 0)
    throw http::server_error("Error reading the request payload");

  if (expected > 0 && body.size() != expected)
    throw http::server_error("HTTP Header field 'Content-Length' differs from actual payload length");

  return body;
}
