/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#include "patmux/clean_path.hpp"


std::string lexical_clean(std::string_view p) {

  if (p.empty())
    return ".";

  const bool rooted = (p[0] == '/');
  const std::size_t n = p.size();

  std::string out;
  out.reserve(n);

  // r is the next byte to read from p. dotdot is the point in out past
  // which a ".." may remove an element.
  std::size_t r = 0;
  std::size_t dotdot = 0;

  if (rooted) {
    out += '/';
    r = 1;
    dotdot = 1;
  }

  while (r < n) {
    if (p[r] == '/') {
      // empty path element
      ++r;

    } else if (p[r] == '.' && (r + 1 == n || p[r + 1] == '/')) {
      // . element
      ++r;

    } else if (p[r] == '.' && p[r + 1] == '.' && (r + 2 == n || p[r + 2] == '/')) {
      // .. element: remove to last /
      r += 2;

      if (out.size() > dotdot) {
        std::size_t w = out.size() - 1;
        while (w > dotdot && out[w] != '/')
          --w;
        out.resize(w);

      } else if (!rooted) {
        // cannot backtrack, but not rooted, so append .. element.
        if (!out.empty())
          out += '/';
        out += "..";
        dotdot = out.size();
      }

    } else {
      // real path element. add slash if needed
      if ((rooted && out.size() != 1) || (!rooted && !out.empty()))
        out += '/';

      for (; r < n && p[r] != '/'; ++r)
        out += p[r];
    }
  }

  if (out.empty())
    return ".";

  return out;
}

std::string clean_path(std::string_view p) {

  if (p.empty())
    return "/";

  std::string rooted;
  if (p[0] != '/') {
    rooted.reserve(p.size() + 1);
    rooted += '/';
  }
  rooted += p;

  auto cleaned = lexical_clean(rooted);

  // lexical_clean drops the trailing slash, but "/foo/" and "/foo" may
  // well be different routes.
  if (rooted.back() == '/' && cleaned != "/")
    cleaned += '/';

  return cleaned;
}
