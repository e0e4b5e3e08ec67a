/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#include "patmux/route_table.hpp"
#include "patmux/util.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>

namespace {

// the default for variables without an explicit regex: one segment.
const char *const default_var_pattern = "[^/]+";

bool is_name_char(char c) {
  return ((c >= 'a') && (c <= 'z')) ||
         ((c >= 'A') && (c <= 'Z')) ||
         ((c >= '0') && (c <= '9')) ||
         (c == '_');
}

std::string regex_escape(std::string_view s) {
  std::string result;
  for (char c : s) {
    switch (c) {
    case '\\': case '^': case '$': case '.': case '|': case '?':
    case '*': case '+': case '(': case ')': case '[': case ']':
    case '{': case '}':
      result += '\\';
      [[fallthrough]];
    default:
      result += c;
    }
  }
  return result;
}

std::regex compile(const std::string &source, std::string_view tpl) {
  try {
    return std::regex(source, std::regex::ECMAScript);
  } catch (const std::regex_error &e) {
    throw std::invalid_argument(
        fmt::format("Invalid regular expression in route template {}: {}", tpl, e.what()));
  }
}

} // anonymous namespace

namespace match {

path_template::path_template(std::string_view tpl) : m_template(tpl) {

  std::string literal;

  auto flush_literal = [&]() {
    if (!literal.empty()) {
      m_parts.push_back(part{false, std::move(literal), {}, {}});
      literal.clear();
    }
  };

  auto add_var = [&](std::string_view name, std::string_view pattern) {
    if (name.empty())
      throw std::invalid_argument(fmt::format("Missing variable name in route template {}", tpl));
    if (pattern.empty())
      throw std::invalid_argument(fmt::format("Empty pattern for variable {} in route template {}", name, tpl));
    if (std::ranges::find(m_names, name) != m_names.end())
      throw std::invalid_argument(fmt::format("Duplicated variable {} in route template {}", name, tpl));

    flush_literal();
    m_names.emplace_back(name);
    m_parts.push_back(part{true, std::string(name), std::string(pattern),
                           compile(fmt::format("^(?:{})$", pattern), tpl)});
  };

  std::size_t i = 0;
  while (i < tpl.size()) {
    const char c = tpl[i];

    if (c == '{') {
      // braces may nest inside the regex, e.g: {id:[0-9]{2,4}}
      int level = 0;
      std::size_t j = i;
      for (; j < tpl.size(); ++j) {
        if (tpl[j] == '{') {
          ++level;
        } else if (tpl[j] == '}' && --level == 0) {
          break;
        }
      }
      if (j == tpl.size())
        throw std::invalid_argument(fmt::format("Unbalanced braces in route template {}", tpl));

      auto body = tpl.substr(i + 1, j - i - 1);
      auto colon = body.find(':');
      if (colon == std::string_view::npos) {
        add_var(body, default_var_pattern);
      } else {
        add_var(body.substr(0, colon), body.substr(colon + 1));
      }
      i = j + 1;

    } else if (c == '}') {
      throw std::invalid_argument(fmt::format("Unbalanced braces in route template {}", tpl));

    } else if (c == ':' && (i == 0 || tpl[i - 1] == '/') &&
               i + 1 < tpl.size() && is_name_char(tpl[i + 1])) {
      std::size_t j = i + 1;
      while (j < tpl.size() && is_name_char(tpl[j]))
        ++j;
      add_var(tpl.substr(i + 1, j - i - 1), default_var_pattern);
      i = j;

    } else {
      literal += c;
      ++i;
    }
  }
  flush_literal();

  std::string source = "^";
  for (const auto &p : m_parts) {
    if (p.is_var) {
      source += fmt::format("({})", p.pattern);
    } else {
      source += regex_escape(p.text);
    }
  }

  m_regex = compile(source, tpl);

  if (m_regex.mark_count() != m_names.size())
    throw std::invalid_argument(
        fmt::format("Route template {} contains capturing groups, use (?:pattern) instead", tpl));
}

bool path_template::match(std::string_view path, route_vars &vars) const {

  std::cmatch m;
  if (!std::regex_search(path.data(), path.data() + path.size(), m, m_regex,
                         std::regex_constants::match_continuous)) {
    return false;
  }

  for (std::size_t idx = 0; idx < m_names.size(); ++idx) {
    vars[m_names[idx]] = m[idx + 1].str();
  }
  return true;
}

std::string path_template::expand(const route_vars &vars) const {

  std::string result;
  for (const auto &p : m_parts) {
    if (!p.is_var) {
      result += p.text;
      continue;
    }

    auto itr = vars.find(p.text);
    if (itr == vars.end())
      throw std::invalid_argument(fmt::format("Missing route variable {} for {}", p.text, m_template));

    if (!std::regex_match(itr->second, p.full))
      throw std::invalid_argument(fmt::format("Variable {} with value \"{}\" doesn't match {} in {}",
                                              p.text, itr->second, p.pattern, m_template));
    result += itr->second;
  }
  return result;
}

} // namespace match

route::route(std::string_view method, std::string_view pattern, handler_func h)
  : m_template(pattern),
    m_handler(std::move(h)) {
  methods({method});
}

route& route::name(std::string n) {
  m_name = std::move(n);
  return *this;
}

route& route::methods(std::initializer_list<std::string_view> ms) {
  for (auto m : ms) {
    if (m.empty())
      throw std::invalid_argument(fmt::format("Empty method for route {}", m_template.str()));
    auto upper = to_upper_ascii(m);
    if (std::ranges::find(m_methods, upper) == m_methods.end())
      m_methods.push_back(std::move(upper));
  }
  return *this;
}

route& route::handler(handler_func h) {
  m_handler = std::move(h);
  return *this;
}

bool route::match_path(std::string_view path, route_vars &vars) const {
  return m_template.match(path, vars);
}

bool route::allows_method(std::string_view method) const {
  return std::ranges::find(m_methods, method) != m_methods.end();
}

std::string route::url_path(const route_vars &vars) const {
  return m_template.expand(vars);
}

route& route_table::add_route(std::string_view method, std::string_view pattern, handler_func h) {
  m_routes.push_back(std::make_unique<route>(method, pattern, std::move(h)));
  return *m_routes.back();
}

route_match route_table::match(std::string_view method, std::string_view path) const {

  // it probably isn't necessary to have any more sophisticated data structure
  // than a list at this point. also means the semantics for rule matching are
  // pretty clear - the first match wins.
  route_match result;

  for (const auto &rptr : m_routes) {
    route_vars vars;
    if (!rptr->match_path(path, vars))
      continue;

    if (rptr->allows_method(method)) {
      result.matched = rptr.get();
      result.vars = std::move(vars);
      result.allowed.clear();
      return result;
    }

    // the path was right, so remember what the client could have used.
    for (const auto &m : rptr->get_methods()) {
      if (std::ranges::find(result.allowed, m) == result.allowed.end())
        result.allowed.push_back(m);
    }
  }

  return result;
}

const route *route_table::get(std::string_view name) const {
  auto itr = std::ranges::find_if(m_routes, [name](const auto &rptr) {
    return !rptr->get_name().empty() && rptr->get_name() == name;
  });
  return itr == m_routes.end() ? nullptr : itr->get();
}
