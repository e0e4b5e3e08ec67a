/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#ifndef FCGI_REQUEST_HPP
#define FCGI_REQUEST_HPP

#include "patmux/request.hpp"
#include <memory>
#include <string>

/**
 * request accepted on a FastCGI listening socket. the same object is
 * re-used for every request: accept_r() waits for the next one.
 */
struct fcgi_request : public request {
  explicit fcgi_request(int socket);
  ~fcgi_request() override;
  const char *get_param(const char *key) const override;
  std::string get_payload() override;

  // returns a negative value if a signal interrupted the wait, throws on
  // any other error.
  int accept_r();

  // listen on "host:port", ":port" or a UNIX socket path. negative if that
  // failed.
  static int open_socket(const std::string &where, int backlog);

  void dispose() override;

protected:
  void write_header_info(int status, const http::headers_t &headers) override;
  output_buffer& get_buffer_internal() override;
  void finish_internal() override;

private:
  struct pimpl;
  std::unique_ptr<pimpl> m_impl;
  std::unique_ptr<output_buffer> m_buffer;
};

#endif /* FCGI_REQUEST_HPP */
