/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#include "patmux/fcgi_request.hpp"
#include "patmux/output_buffer.hpp"
#include "patmux/request_helpers.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include <fcgiapp.h>


struct fcgi_request::pimpl {
  FCGX_Request req{};
};

namespace {

// response body, written into the out stream of the current request.
class fcgi_output : public output_buffer {
public:
  explicit fcgi_output(FCGX_Request &req) : m_req(req) {}

  int write(const char *buffer, int len) noexcept override {
    const int n = FCGX_PutStr(buffer, len, m_req.out);
    if (n > 0)
      m_written += n;
    return n;
  }

  int written() const override { return m_written; }

  int close() noexcept override { return FCGX_FClose(m_req.out); }

  int flush() noexcept override { return FCGX_FFlush(m_req.out); }

private:
  FCGX_Request &m_req;
  int m_written = 0;
};

} // anonymous namespace

fcgi_request::fcgi_request(int socket) : m_impl(std::make_unique<pimpl>()) {
  if (FCGX_Init() != 0)
    throw std::runtime_error("FCGX_Init failed");

  // with FCGI_FAIL_ACCEPT_ON_INTR a signal wakes up accept_r, so that the
  // server loop gets to look at its flags.
  if (FCGX_InitRequest(&m_impl->req, socket, FCGI_FAIL_ACCEPT_ON_INTR) != 0)
    throw std::runtime_error("FCGX_InitRequest failed");

  m_buffer = std::make_unique<fcgi_output>(m_impl->req);
}

fcgi_request::~fcgi_request() { FCGX_Free(&m_impl->req, true); }

const char *fcgi_request::get_param(const char *key) const {
  return FCGX_GetParam(key, m_impl->req.envp);
}

std::string fcgi_request::get_payload() {
  return read_payload(get_param("CONTENT_LENGTH"), [this](char *buffer, int len) {
    return FCGX_GetStr(buffer, len, m_impl->req.in);
  });
}

void fcgi_request::write_header_info(int status, const http::headers_t &headers) {
  m_buffer->write(http::format_header(status, headers));
}

output_buffer& fcgi_request::get_buffer_internal() { return *m_buffer; }

// the response is completed by the next FCGX_Accept_r, or by dispose().
void fcgi_request::finish_internal() {}

void fcgi_request::dispose() { FCGX_Finish_r(&m_impl->req); }

int fcgi_request::accept_r() {
  const int status = FCGX_Accept_r(&m_impl->req);
  if (status < 0 && errno != EINTR)
    throw std::system_error(errno, std::generic_category(), "Accepting a FastCGI request failed");

  reset();
  m_buffer = std::make_unique<fcgi_output>(m_impl->req);
  return status;
}

int fcgi_request::open_socket(const std::string &where, int backlog) {
  return FCGX_OpenSocket(where.c_str(), backlog);
}
