/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#include "patmux/http.hpp"
#include "patmux/options.hpp"
#include "patmux/util.hpp"

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>   // for isxdigit
#include <cstdlib>
#include <iterator> // for distance
#include <sstream>


namespace {

char hexToChar(char first, char second) {

  int digit = (first >= 'A' ? ((first & 0xDF) - 'A') + 10 : (first - '0'));
  digit *= 16;
  digit += (second >= 'A' ? ((second & 0xDF) - 'A') + 10 : (second - '0'));
  return static_cast<char>(digit);
}

template <typename Iter>
std::string percent_decode(Iter begin, Iter end, bool plus_is_space) {
  std::string result;

  for (auto iter = begin; iter != end; ++iter) {
    switch (*iter) {
    case '+':
      result.append(1, plus_is_space ? ' ' : '+');
      break;
    case '%':
      // Don't assume well-formed input
      if (std::distance(iter, end) > 2 &&
          std::isxdigit(static_cast<unsigned char>(*(iter + 1))) &&
          std::isxdigit(static_cast<unsigned char>(*(iter + 2)))) {
        char c = *++iter;
        result.append(1, hexToChar(c, *++iter));
      }
      // Just pass the % through untouched
      else {
        result.append(1, '%');
      }
      break;

    default:
      result.append(1, *iter);
      break;
    }
  }

  return result;
}

bool is_unreserved(char c) {
  return ((c >= 'a') && (c <= 'z')) ||
         ((c >= 'A') && (c <= 'Z')) ||
         ((c >= '0') && (c <= '9')) ||
         (c == '-') ||
         (c == '.') ||
         (c == '_') ||
         (c == '~');
}

// a CR or LF inside a header line would end it early, and let whatever
// follows be read as another header.
std::string header_safe(std::string_view s) {
  std::string result(s);
  std::ranges::replace_if(result, [](char c) { return c == '\r' || c == '\n'; }, ' ');
  return result;
}

} // anonymous namespace

namespace http {

const char *status_message(int code) {

  switch (code) {
  case 200:
    return "OK";
  case 201:
    return "Created";
  case 204:
    return "No Content";
  case 301:
    return "Moved Permanently";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 413:
    return "Payload Too Large";
  default:
    return "Internal Server Error";
  }
}

std::string format_header(int status, const headers_t &headers) {
  std::string hdr{};
  hdr += fmt::format("Status: {} {}\r\n", status, status_message(status));
  for (const auto& [name, value] : headers) {
    hdr += fmt::format("{}: {}\r\n", header_safe(name), header_safe(value));
  }
  hdr += "\r\n";
  return hdr;
}

exception::exception(int c, std::string m)
    : code_(c), message_(std::move(m)) {}

int exception::code() const { return code_; }

const char *exception::header() const { return status_message(code()); }

const char *exception::what() const noexcept { return message_.c_str(); }

server_error::server_error(const std::string &message)
    : exception(500, message) {}

bad_request::bad_request(const std::string &message)
    : exception(400, message) {}

method_not_allowed::method_not_allowed(std::vector<std::string> methods)
    : exception(405, fmt::format("{}", fmt::join(methods, ", "))),
      allowed_methods(std::move(methods)) {}

payload_too_large::payload_too_large(const std::string &message)
    : exception(413, message) {}


std::string urldecode(const std::string &s) {
  return percent_decode(s.begin(), s.end(), true);
}

std::string path_unescape(std::string_view s) {
  return percent_decode(s.begin(), s.end(), false);
}

std::string query_escape(std::string_view s) {
  static const char hex[] = { '0', '1', '2', '3', '4', '5', '6', '7',
                              '8', '9', 'A', 'B', 'C', 'D', 'E', 'F' };
  std::ostringstream ostr;

  for (char c : s) {
    if (is_unreserved(c)) {
      ostr << c;

    } else if (c == ' ') {
      ostr << '+';

    } else {
      auto idx = (unsigned char)(c);
      ostr << "%" << hex[idx >> 4] << hex[idx & 0xf];
    }
  }

  return ostr.str();
}

std::vector<std::pair<std::string, std::string>> parse_params(const std::string &p) {
  // Split the query string into components
  std::vector<std::pair<std::string, std::string>> queryKVPairs;
  if (!p.empty()) {
    auto temp = split(p, '&');

    for (const auto &kvPair : temp) {
      // values may legitimately contain '=' once decoded, so only split on
      // the first one.
      auto eq = kvPair.find('=');

      if (eq != std::string::npos) {
        queryKVPairs.emplace_back(kvPair.substr(0, eq), kvPair.substr(eq + 1));

      } else if (!kvPair.empty()) {
        queryKVPairs.emplace_back(kvPair, std::string());
      }
    }
  }
  return queryKVPairs;
}

unsigned long parse_content_length(const std::string &content_length_str) {

  char *end = nullptr;

  const long length = strtol(content_length_str.c_str(), &end, 10);

  if (end == content_length_str) {
    throw http::bad_request("CONTENT_LENGTH not a decimal number");
  } else if ('\0' != *end) {
    throw http::bad_request("CONTENT_LENGTH: extra characters at end of input");
  } else if (length < 0) {
    throw http::bad_request("CONTENT_LENGTH: invalid value");
  } else if (length > global_settings::get_payload_max_size())
    throw http::payload_too_large(fmt::format("CONTENT_LENGTH exceeds limit of {:d} bytes", global_settings::get_payload_max_size()));

  return length;
}

} // namespace http
