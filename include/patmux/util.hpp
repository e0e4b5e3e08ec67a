/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#ifndef UTIL_HPP
#define UTIL_HPP

#include <algorithm>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

inline char toupper_ascii(char c) {

  if (c >= 'a' && c <= 'z') {
    return c - ('a' - 'A');
  }
  return c;
}

// HTTP method names are case-sensitive on the wire, but routes are
// registered in upper case like everybody writes them.
inline std::string to_upper_ascii(std::string_view s) {
  std::string result(s);
  std::ranges::transform(result, result.begin(), toupper_ascii);
  return result;
}

template <typename T>
concept StringLike = std::is_same_v<std::remove_cvref_t<T>, std::string> ||
                     std::is_same_v<std::remove_cvref_t<T>, std::string_view>;

// split on every occurrence of delim. empty parts are kept, so that
// "a//b" gives three parts.
template <StringLike T>
inline std::vector<T> split(const T &str, char delim) {

  std::vector<T> result;
  typename T::size_type start = 0;

  while (true) {
    auto pos = str.find(delim, start);
    if (pos == T::npos) {
      result.push_back(str.substr(start));
      break;
    }
    result.push_back(str.substr(start, pos - start));
    start = pos + 1;
  }

  return result;
}

#endif
