/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#ifndef REQUEST_CONTEXT_HPP
#define REQUEST_CONTEXT_HPP

#include "patmux/route_table.hpp"

#include <any>
#include <map>
#include <optional>
#include <string>

struct request;

/**
 * state belonging to one dispatch of one request. the router fills in
 * the route and its variables, handlers may stash anything else they need
 * to pass along under a key of their choosing.
 */
struct request_context
{
    request& req;
    const route *matched = nullptr;
    route_vars vars = {};

    explicit request_context(request &r) : req(r) {}

    void set(const std::string &key, std::any value) { values[key] = std::move(value); }

    bool contains(const std::string &key) const { return values.count(key) > 0; }

    // the value for key, if there is one and it has type T.
    template <typename T>
    std::optional<T> get(const std::string &key) const {
      auto itr = values.find(key);
      if (itr == values.end())
        return {};
      if (const T *v = std::any_cast<T>(&itr->second))
        return *v;
      return {};
    }

    void clear() {
      matched = nullptr;
      vars.clear();
      values.clear();
    }

private:
    std::map<std::string, std::any> values;
};

#endif /* REQUEST_CONTEXT_HPP */
