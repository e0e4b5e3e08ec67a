/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#ifndef ROUTE_TABLE_HPP
#define ROUTE_TABLE_HPP

#include <functional>
#include <initializer_list>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

struct request;
struct request_context;

/**
 * variables extracted from the path by a route template, keyed by the
 * variable name. there is no defined iteration order.
 */
using route_vars = std::unordered_map<std::string, std::string>;

/**
 * a handler gets the request (which is also where the response goes) and
 * the context of this one dispatch.
 */
using handler_func = std::function<void(request &, request_context &)>;

namespace match {

/**
 * a compiled path template.
 *
 * templates are literal text with variables in them. a variable is either
 * "{name}", "{name:regex}" or a ":name" which starts a path segment. the
 * first and last match one or more characters other than '/', the middle
 * one matches the ECMAScript regex given. groups inside such a regex must
 * be non-capturing.
 *
 * the template only has to match a prefix of the path, so "/foo" matches
 * "/foo", "/foo/bar" and also "/foobar".
 */
class path_template {
public:
  // throws std::invalid_argument if the template can't be parsed.
  explicit path_template(std::string_view tpl);

  // try to match the start of path. on success, the variables are added
  // to vars.
  bool match(std::string_view path, route_vars &vars) const;

  // build a path from the template, substituting vars. throws
  // std::invalid_argument if one is missing or doesn't fit its regex.
  std::string expand(const route_vars &vars) const;

  const std::string &str() const { return m_template; }
  const std::vector<std::string> &var_names() const { return m_names; }

private:
  // the template is a sequence of these, alternating between literal text
  // and variables.
  struct part {
    bool is_var;
    std::string text;     // the literal, or the variable name
    std::string pattern;  // variable regex source
    std::regex full;      // variable regex anchored at both ends
  };

  std::string m_template;
  std::vector<part> m_parts;
  std::vector<std::string> m_names;
  std::regex m_regex;
};

} // namespace match

/**
 * a registered route: a path template, the methods it answers to and the
 * handler to call. the only thing which changes after registration is
 * whatever the caller configures through the reference it got back.
 */
class route {
public:
  // throws std::invalid_argument for an empty method or a bad template.
  route(std::string_view method, std::string_view pattern, handler_func h);

  route(const route &) = delete;
  route& operator=(const route &) = delete;

  // configuration, chainable. methods() adds to the ones the route
  // already has, and rejects an empty method.
  route& name(std::string n);
  route& methods(std::initializer_list<std::string_view> ms);
  route& handler(handler_func h);

  const std::string &get_name() const { return m_name; }
  const std::string &get_pattern() const { return m_template.str(); }
  const std::vector<std::string> &get_methods() const { return m_methods; }
  const handler_func &get_handler() const { return m_handler; }

  bool match_path(std::string_view path, route_vars &vars) const;

  bool allows_method(std::string_view method) const;

  // build a path which this route would match, from its variables.
  std::string url_path(const route_vars &vars) const;

private:
  match::path_template m_template;
  std::vector<std::string> m_methods;
  handler_func m_handler;
  std::string m_name;
};

/**
 * the outcome of looking up a request in the route table.
 */
struct route_match {
  // the route which matched, or nullptr.
  const route *matched = nullptr;

  // variables from the matched route's template.
  route_vars vars;

  // if no route matched but some matched the path, these are the methods
  // they would have accepted, in registration order.
  std::vector<std::string> allowed;

  explicit operator bool() const { return matched != nullptr; }

  bool method_mismatch() const { return matched == nullptr && !allowed.empty(); }
};

/**
 * list of routes, tried in the order they were added. the first route
 * matching both the path and the method wins. adding a route never
 * removes or shadows one added earlier for the same pattern.
 *
 * add_route is not safe to call while match is running in other threads.
 * concurrent calls to match alone are fine.
 */
class route_table {
public:
  route_table() = default;
  ~route_table() = default;

  route_table(const route_table &) = delete;
  route_table& operator=(const route_table &) = delete;
  route_table(route_table &&) = default;
  route_table& operator=(route_table &&) = default;

  // the returned reference stays valid for the lifetime of the table.
  route& add_route(std::string_view method, std::string_view pattern, handler_func h);

  route_match match(std::string_view method, std::string_view path) const;

  // find a route by the name given to it, or nullptr.
  const route *get(std::string_view name) const;

  std::size_t size() const { return m_routes.size(); }
  bool empty() const { return m_routes.empty(); }

private:
  std::vector<std::unique_ptr<route> > m_routes;
};

#endif /* ROUTE_TABLE_HPP */
