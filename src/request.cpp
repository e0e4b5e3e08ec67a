/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#include "patmux/request.hpp"
#include "patmux/output_buffer.hpp"

#include <stdexcept>

#include <fmt/core.h>


void request::set_query_string(std::string qs) {
  m_query_string = std::move(qs);
}

const std::optional<std::string>& request::query_string_override() const {
  return m_query_string;
}

request& request::status(int code) {
  check_workflow(status_HEADERS);
  m_status = code;
  return *this;
}

request& request::add_header(const std::string &key, const std::string &value) {
  check_workflow(status_HEADERS);
  m_headers.emplace_back(key, value);
  return *this;
}

output_buffer& request::get_buffer() {
  check_workflow(status_BODY);
  return get_buffer_internal();
}

int request::put(const char *ptr, int len) {
  return get_buffer().write(ptr, len);
}

int request::put(std::string_view str) {
  return get_buffer().write(str);
}

void request::flush() { get_buffer().flush(); }

bool request::headers_sent() const {
  return m_workflow_status >= status_BODY;
}

void request::finish() {
  check_workflow(status_FINISHED);
  finish_internal();
}

void request::check_workflow(workflow_status this_stage) {
  if (m_workflow_status < this_stage) {
    if ((status_HEADERS > m_workflow_status) &&
        (status_HEADERS <= this_stage)) {
      // must be in HEADERS workflow stage to set headers.
      m_workflow_status = status_HEADERS;
    }

    if ((status_BODY > m_workflow_status) && (status_BODY <= this_stage)) {
      // must be in BODY workflow stage to write output
      m_workflow_status = status_BODY;
      write_header_info(m_status, m_headers);
    }

    m_workflow_status = this_stage;

  } else if (m_workflow_status > this_stage) {
    // oops - workflow is more advanced than the function which called
    // this, so a workflow violation has occurred.
    throw std::runtime_error(fmt::format("Can't move backwards in the request workflow from {:d} to {:d}.",
        static_cast<int>(m_workflow_status), static_cast<int>(this_stage)));
  }
}

void request::reset() {
  m_workflow_status = status_NONE;
  m_status = 500;
  m_headers.clear();
  m_query_string.reset();
}
