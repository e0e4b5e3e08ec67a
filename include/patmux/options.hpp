/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <memory>
#include <cstdint>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

/**
 * every option patmux understands, whether it comes from the command
 * line, the environment or a config file.
 */
po::options_description server_options(const std::string &caption);

/**
 * option name for an environment variable, e.g: PATMUX_MAX_PAYLOAD is
 * "max-payload". empty if the variable doesn't start with PATMUX_, or
 * names no option in desc.
 */
std::string option_from_environment(std::string_view var, const po::options_description &desc);

class global_settings_base {

public:
  virtual ~global_settings_base();

  virtual uint32_t get_payload_max_size() const = 0;
  virtual bool get_keep_context() const = 0;
  virtual bool get_skip_clean() const = 0;
  virtual bool get_method_not_allowed() const = 0;
};

class global_settings_default : public global_settings_base {

public:
  uint32_t get_payload_max_size() const override {
    return 50000000L;
  }

  bool get_keep_context() const override {
    return false;
  }

  bool get_skip_clean() const override {
    return false;
  }

  bool get_method_not_allowed() const override {
    return false;
  }
};

class global_settings_via_options : public global_settings_base {

public:
  global_settings_via_options() = delete;

  explicit global_settings_via_options(const po::variables_map & options) {

    init_fallback_values(global_settings_default{}); // use default values as fallback
    set_new_options(options);
  }

  global_settings_via_options(const po::variables_map & options,
                              const global_settings_base & fallback) {

    init_fallback_values(fallback);
    set_new_options(options);
  }

  uint32_t get_payload_max_size() const override {
    return m_payload_max_size;
  }

  bool get_keep_context() const override {
    return m_keep_context;
  }

  bool get_skip_clean() const override {
    return m_skip_clean;
  }

  bool get_method_not_allowed() const override {
    return m_method_not_allowed;
  }

private:
  void init_fallback_values(const global_settings_base &def);
  void set_new_options(const po::variables_map &options);
  void set_payload_max_size(const po::variables_map &options);
  void set_keep_context(const po::variables_map &options);
  void set_skip_clean(const po::variables_map &options);
  void set_method_not_allowed(const po::variables_map &options);

  uint32_t m_payload_max_size;
  bool m_keep_context;
  bool m_skip_clean;
  bool m_method_not_allowed;
};

class global_settings final {

public:
  global_settings() = delete;

  static void set_configuration(std::unique_ptr<global_settings_base> && b) { settings = std::move(b); }

  // Maximum Size of HTTP body payload accepted by handlers
  static uint32_t get_payload_max_size() { return settings->get_payload_max_size(); }

  // Don't clear the request context after a handler returns
  static bool get_keep_context() { return settings->get_keep_context(); }

  // Route non-canonical paths as they are instead of redirecting them
  static bool get_skip_clean() { return settings->get_skip_clean(); }

  // Answer 405 instead of 404 when only the method didn't match
  static bool get_method_not_allowed() { return settings->get_method_not_allowed(); }

private:
  static std::unique_ptr<global_settings_base> settings;  // gets initialized with global_settings_default instance
};


#endif
