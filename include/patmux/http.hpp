/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#ifndef HTTP_HPP
#define HTTP_HPP

#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * Contains the generic HTTP functions and classes used by the router.
 * FastCGI-specific stuff is elsewhere, so this should be re-usable with
 * any transport which can implement the request interface.
 */
namespace http {

  using headers_t = std::vector<std::pair<std::string, std::string> >;

  // CR and LF in header names and values are written as spaces.
  std::string format_header(int status, const headers_t &headers);

  /**
   * return a static string description for an HTTP status code.
   */
  const char *status_message(int code);


/**
 * Base class for HTTP protocol related exceptions.
 *
 * Not directly constructable - use the derived classes instead.
 */
class exception : public std::exception {
private:
  /// numerical status code, for more information see
  /// http://en.wikipedia.org/wiki/List_of_HTTP_status_codes
  const int code_;

  /// specific error message, meant entirely for humans to read.
  const std::string message_;

protected:
  exception(int c, std::string m);

public:
  ~exception() noexcept override = default;

  int code() const;
  const char* header() const;
  const char* what() const noexcept override;
};

/**
 * An error which has caused the current request to fail which is
 * due to an internal error or code bug.
 */
class server_error : public exception {
public:
  explicit server_error(const std::string &message);
};

/**
 * The client's request is badly-formed and cannot be serviced.
 */
class bad_request : public exception {
public:
  explicit bad_request(const std::string &message);
};

/**
 * The path is known, but not with the method the client used. The
 * methods which would have been accepted are kept for the Allow header.
 */
class method_not_allowed : public exception {
public:
  explicit method_not_allowed(std::vector<std::string> methods);
  std::vector<std::string> allowed_methods;
};

/**
 * The request is larger than the server is willing or able to process.
 */
class payload_too_large : public exception {
public:
  explicit payload_too_large(const std::string &message);
};

/**
 * Decodes a form-encoded string: '+' is a space and %XX an octet.
 */
std::string urldecode(const std::string &s);

/**
 * Decodes a URL path. Unlike urldecode, a '+' stays a '+'.
 */
std::string path_unescape(std::string_view s);

/**
 * Encodes a string so it can be placed inside a query string. Unreserved
 * characters (RFC 3986) are kept, a space becomes '+' and everything else
 * becomes %XX.
 */
std::string query_escape(std::string_view s);

/**
 * Parses a query string into an array of key-value pairs.
 *
 * Duplicate keys are kept, in the order they appear. The string should
 * still be url-encoded, so that an encoded '&' or '=' inside a key or
 * value survives the split.
 */
std::vector<std::pair<std::string, std::string> > parse_params(const std::string &p);

// parse CONTENT_LENGTH HTTP header
unsigned long parse_content_length(const std::string &);

} // namespace http

#endif /* HTTP_HPP */
