/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#ifndef ROUTER_HPP
#define ROUTER_HPP

#include "patmux/route_table.hpp"
#include "patmux/request_context.hpp"

#include <memory>
#include <mutex>
#include <string_view>

struct request;

// key under which a method-not-allowed handler finds the methods the path
// would have accepted, as a std::vector<std::string>.
inline constexpr const char *allowed_methods_key = "patmux.allowed_methods";

/**
 * pattern-style HTTP method router.
 *
 * handlers are registered under a method and a path template (see
 * match::path_template). for each request, the router:
 *
 *  1. redirects (301) to the canonical path if the request path isn't
 *     canonical, and stops there.
 *  2. looks up the first route matching the path and the method, and if
 *     there is one, appends its variables to the query string.
 *  3. calls the route's handler, or the not-found handler if nothing
 *     matched.
 *
 * registration must be finished before requests are served. after that,
 * serve() may be called from several threads at once.
 */
class router {
public:
  router();
  ~router() = default;

  router(const router &) = delete;
  router& operator=(const router &) = delete;

  // register a handler for a method and a path template. an empty method
  // or a malformed template throws std::invalid_argument.
  route& add(std::string_view method, std::string_view pattern, handler_func h);

  route& OPTIONS(std::string_view pattern, handler_func h);
  route& DELETE(std::string_view pattern, handler_func h);
  route& HEAD(std::string_view pattern, handler_func h);
  route& GET(std::string_view pattern, handler_func h);
  route& POST(std::string_view pattern, handler_func h);
  route& PUT(std::string_view pattern, handler_func h);
  route& PATCH(std::string_view pattern, handler_func h);

  // handler used when no route matches. an empty handler means the
  // default 404 one, which is also what you get if this is never called.
  void set_not_found_handler(handler_func h);
  const handler_func& not_found_handler() const;

  // handler used when a route matched the path but not the method. if
  // none is set, such requests go to the not-found handler.
  void set_method_not_allowed_handler(handler_func h);
  const handler_func& method_not_allowed_handler() const;

  // whether the request context is left alone after the handler returns,
  // instead of being cleared.
  void set_keep_context(bool keep);
  bool keep_context() const;

  // whether non-canonical paths are routed as they are, instead of being
  // redirected.
  void set_skip_clean(bool skip);
  bool skip_clean() const;

  // route registered under name, or nullptr.
  const route *get(std::string_view name) const;

  const route_table &table() const { return m_table; }

  /**
   * dispatch a request. the context only lives for the duration of the
   * call.
   */
  void serve(request &req) const;

  /**
   * dispatch a request with a context owned by the caller. it is cleared
   * once the handler returns, unless keep_context() is set.
   */
  void serve(request &req, request_context &ctx) const;

private:
  route_table m_table;

  mutable std::once_flag m_not_found_init;
  mutable handler_func m_not_found;
  handler_func m_method_not_allowed;

  bool m_keep_context;
  bool m_skip_clean;
};

/**
 * create a new router with no routes and no not-found handler set.
 */
std::unique_ptr<router> make_router();

/**
 * replies 404 with a plain text "404 page not found".
 */
handler_func default_not_found_handler();

/**
 * replies 405 with an Allow header listing the methods from the context.
 */
handler_func default_method_not_allowed_handler();

#endif /* ROUTER_HPP */
