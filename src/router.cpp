/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#include "patmux/router.hpp"
#include "patmux/clean_path.hpp"
#include "patmux/logger.hpp"
#include "patmux/options.hpp"
#include "patmux/request.hpp"
#include "patmux/request_helpers.hpp"

#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace {

/**
 * clears the context when the dispatch ends, whether the handler
 * returned or threw.
 */
class context_clearer {
public:
  context_clearer(request_context &ctx, bool enabled) : m_ctx(ctx), m_enabled(enabled) {}
  ~context_clearer() {
    if (m_enabled)
      m_ctx.clear();
  }

  context_clearer(const context_clearer &) = delete;
  context_clearer& operator=(const context_clearer &) = delete;

private:
  request_context &m_ctx;
  bool m_enabled;
};

void respond_redirect(request &req, const std::string &location) {
  req.status(301)
     .add_header("Location", location)
     .add_header("Content-Length", "0");
  req.finish();
}

} // anonymous namespace

router::router()
  : m_keep_context(global_settings::get_keep_context()),
    m_skip_clean(global_settings::get_skip_clean()) {
}

route& router::add(std::string_view method, std::string_view pattern, handler_func h) {
  return m_table.add_route(method, pattern, std::move(h));
}

route& router::OPTIONS(std::string_view pattern, handler_func h) {
  return add("OPTIONS", pattern, std::move(h));
}

route& router::DELETE(std::string_view pattern, handler_func h) {
  return add("DELETE", pattern, std::move(h));
}

route& router::HEAD(std::string_view pattern, handler_func h) {
  return add("HEAD", pattern, std::move(h));
}

route& router::GET(std::string_view pattern, handler_func h) {
  return add("GET", pattern, std::move(h));
}

route& router::POST(std::string_view pattern, handler_func h) {
  return add("POST", pattern, std::move(h));
}

route& router::PUT(std::string_view pattern, handler_func h) {
  return add("PUT", pattern, std::move(h));
}

route& router::PATCH(std::string_view pattern, handler_func h) {
  return add("PATCH", pattern, std::move(h));
}

void router::set_not_found_handler(handler_func h) {
  m_not_found = h ? std::move(h) : default_not_found_handler();
}

const handler_func& router::not_found_handler() const {
  std::call_once(m_not_found_init, [this]() {
    if (!m_not_found)
      m_not_found = default_not_found_handler();
  });
  return m_not_found;
}

void router::set_method_not_allowed_handler(handler_func h) {
  m_method_not_allowed = std::move(h);
}

const handler_func& router::method_not_allowed_handler() const {
  return m_method_not_allowed;
}

void router::set_keep_context(bool keep) { m_keep_context = keep; }

bool router::keep_context() const { return m_keep_context; }

void router::set_skip_clean(bool skip) { m_skip_clean = skip; }

bool router::skip_clean() const { return m_skip_clean; }

const route *router::get(std::string_view name) const {
  return m_table.get(name);
}

void router::serve(request &req) const {
  request_context ctx(req);
  serve(req, ctx);
}

void router::serve(request &req, request_context &ctx) const {

  const auto path = get_request_path(req);

  if (!m_skip_clean) {
    if (auto canonical = clean_path(path); canonical != path) {
      logger::message(fmt::format("Redirecting {} to canonical path {}", path, canonical));
      respond_redirect(req, canonical);
      return;
    }
  }

  const auto method = get_request_method(req);
  const handler_func *selected = nullptr;

  auto m = m_table.match(method, path);

  if (m && m.matched->get_handler()) {
    selected = &m.matched->get_handler();
    register_vars(req, m.vars);
    ctx.matched = m.matched;
    ctx.vars = std::move(m.vars);

  } else if (m.method_mismatch() && m_method_not_allowed) {
    logger::message(fmt::format("Method {} not allowed for {}, allowed: {}",
                                method, path, fmt::join(m.allowed, ", ")));
    ctx.set(allowed_methods_key, m.allowed);
    selected = &m_method_not_allowed;
  }

  if (selected == nullptr) {
    selected = &not_found_handler();
  }

  context_clearer clearer(ctx, !m_keep_context);

  (*selected)(req, ctx);
}

std::unique_ptr<router> make_router() {
  return std::make_unique<router>();
}

handler_func default_not_found_handler() {
  return [](request &req, request_context &) {
    static const std::string body = "404 page not found\n";

    req.status(404)
       .add_header("Content-Type", "text/plain; charset=utf-8")
       .add_header("X-Content-Type-Options", "nosniff")
       .add_header("Content-Length", std::to_string(body.size()))
       .put(body);
    req.finish();
  };
}

handler_func default_method_not_allowed_handler() {
  return [](request &req, request_context &ctx) {
    auto allowed = ctx.get<std::vector<std::string> >(allowed_methods_key)
                     .value_or(std::vector<std::string>{});

    req.status(405)
       .add_header("Allow", fmt::format("{}", fmt::join(allowed, ", ")))
       .add_header("Content-Length", "0")
       .add_header("Cache-Control", "no-cache");
    req.finish();
  };
}
