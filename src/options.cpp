/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#include "patmux/options.hpp"

#include <stdexcept>

namespace {

const std::string_view env_prefix = "PATMUX_";

}

po::options_description server_options(const std::string &caption) {
  po::options_description desc(caption);

  // clang-format off
  desc.add_options()
    ("help", "display this help and exit")
    ("logfile", po::value<std::string>(), "file to write log messages to, or - for stderr")
    ("port", po::value<int>(), "FCGI port number to listen on, e.g: 8000")
    ("socket", po::value<std::string>(), "FCGI address (e.g: :8000 or 127.0.0.1:8000) or UNIX domain socket to listen on")
    ("configfile", po::value<std::string>(), "file with more options, one name=value per line")
    ;
  // clang-format on

  po::options_description routing("Routing");

  // clang-format off
  routing.add_options()
    ("keep-context", po::value<bool>(), "leave the request context alone after the handler returns")
    ("skip-clean", po::value<bool>(), "route non-canonical paths as they are instead of redirecting")
    ("method-not-allowed", po::value<bool>(), "reply 405 instead of 404 when only the method didn't match")
    ("max-payload", po::value<long>(), "largest request body accepted, in bytes")
    ;
  // clang-format on

  desc.add(routing);
  return desc;
}

std::string option_from_environment(std::string_view var, const po::options_description &desc) {
  if (!var.starts_with(env_prefix))
    return {};

  std::string option;
  for (char c : var.substr(env_prefix.size())) {
    if (c == '_')
      option += '-';
    else if (c >= 'A' && c <= 'Z')
      option += static_cast<char>(c - 'A' + 'a');
    else
      option += c;
  }

  if (desc.find_nothrow(option, false) == nullptr)
    return {};

  return option;
}

global_settings_base::~global_settings_base() = default;

std::unique_ptr<global_settings_base> global_settings::settings = std::make_unique<global_settings_default>();


void global_settings_via_options::init_fallback_values(const global_settings_base &def) {

  m_payload_max_size = def.get_payload_max_size();
  m_keep_context = def.get_keep_context();
  m_skip_clean = def.get_skip_clean();
  m_method_not_allowed = def.get_method_not_allowed();
}

void global_settings_via_options::set_new_options(const po::variables_map &options) {

  set_payload_max_size(options);
  set_keep_context(options);
  set_skip_clean(options);
  set_method_not_allowed(options);
}

void global_settings_via_options::set_payload_max_size(const po::variables_map &options)  {
  if (options.count("max-payload")) {
    auto payload_max_size = options["max-payload"].as<long>();
    if (payload_max_size <= 0)
      throw std::invalid_argument("max-payload must be a positive number");
    if (payload_max_size > UINT32_MAX)
      throw std::invalid_argument("max-payload must be 4GB or less");
    m_payload_max_size = payload_max_size;
  }
}

void global_settings_via_options::set_keep_context(const po::variables_map &options) {
  if (options.count("keep-context")) {
    m_keep_context = options["keep-context"].as<bool>();
  }
}

void global_settings_via_options::set_skip_clean(const po::variables_map &options) {
  if (options.count("skip-clean")) {
    m_skip_clean = options["skip-clean"].as<bool>();
  }
}

void global_settings_via_options::set_method_not_allowed(const po::variables_map &options) {
  if (options.count("method-not-allowed")) {
    m_method_not_allowed = options["method-not-allowed"].as<bool>();
  }
}
