/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#ifndef CLEAN_PATH_HPP
#define CLEAN_PATH_HPP

#include <string>
#include <string_view>

/**
 * returns the shortest path name equivalent to p by purely lexical
 * processing:
 *
 *  1. replace multiple slashes with a single slash.
 *  2. eliminate each . path name element (the current directory).
 *  3. eliminate each inner .. path name element (the parent directory)
 *     along with the non-.. element that precedes it.
 *  4. eliminate .. elements that begin a rooted path, i.e. "/.." is "/".
 *
 * the result never ends in a slash unless it is the root "/". an empty
 * result is returned as ".".
 */
std::string lexical_clean(std::string_view p);

/**
 * returns the canonical request path for p: always rooted, cleaned with
 * lexical_clean, and keeping a trailing slash when p had one (other than
 * for the root itself). applying it to its own output changes nothing.
 *
 * percent-escapes are not touched, "/a%2Fb" and "/a/b" stay distinct.
 */
std::string clean_path(std::string_view p);

#endif /* CLEAN_PATH_HPP */
