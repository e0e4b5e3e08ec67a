/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#include <iostream>

#include <boost/program_options.hpp>
#include <fmt/core.h>

#include <atomic>
#include <csignal>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>

#include "patmux/fcgi_request.hpp"
#include "patmux/http.hpp"
#include "patmux/logger.hpp"
#include "patmux/options.hpp"
#include "patmux/process_request.hpp"
#include "patmux/request_helpers.hpp"
#include "patmux/router.hpp"


namespace po = boost::program_options;

namespace {

// set from the signal handlers, looked at between requests.
std::atomic<bool> stop_requested = false;
std::atomic<bool> reopen_log_requested = false;

static_assert(std::atomic<bool>::is_always_lock_free);

void on_sigterm(int) { stop_requested = true; }

void on_sighup(int) { reopen_log_requested = true; }

void install_handler(int sig, void (*handler)(int)) {
  struct sigaction sa{};
  sa.sa_handler = handler;
  sigemptyset(&sa.sa_mask);
  if (sigaction(sig, &sa, nullptr) < 0)
    throw std::runtime_error(fmt::format("Can't install handler for signal {}", sig));
}

/**
 * the command line wins over PATMUX_* environment variables, which win over
 * the config file. returns false if the caller should just exit.
 */
bool read_options(int argc, char **argv, po::variables_map &options) {
  const auto desc = server_options(PACKAGE_STRING ": Allowed options");

  po::store(po::parse_command_line(argc, argv, desc), options);

  if (options.count("help")) {
    std::cout << desc << std::endl;
    return false;
  }

  po::store(po::parse_environment(desc, [&desc](const std::string &var) {
    auto option = option_from_environment(var, desc);
    if (option.empty() && var.starts_with("PATMUX_"))
      std::cerr << "Ignoring unknown environment variable: " << var << std::endl;
    return option;
  }), options);

  if (options.count("configfile")) {
    const auto fname = options["configfile"].as<std::string>();
    std::ifstream in(fname);
    if (!in)
      throw std::runtime_error(fmt::format("Can't read config file {}", fname));
    po::store(po::parse_config_file(in, desc), options);
  }

  po::notify(options);

  if (!options.count("socket") && !options.count("port"))
    throw po::error("either --socket or --port is required");

  return true;
}

/**
 * a few routes to try the router out with.
 */
void add_demo_routes(router &r) {

  r.GET("/hello/{name}", [](request &req, request_context &) {
    auto body = fmt::format("Hello, {}!\n", get_route_var(req, "name").value_or("world"));
    req.status(200)
       .add_header("Content-Type", "text/plain; charset=utf-8")
       .add_header("Content-Length", std::to_string(body.size()))
       .put(body);
    req.finish();
  }).name("hello");

  r.GET("/items/:id", [](request &req, request_context &ctx) {
    auto body = fmt::format("item {}\n", ctx.vars.at("id"));
    req.status(200)
       .add_header("Content-Type", "text/plain; charset=utf-8")
       .add_header("Content-Length", std::to_string(body.size()))
       .put(body);
    req.finish();
  }).name("item");

  r.POST("/items", [&r](request &req, request_context &) {
    auto payload = req.get_payload();
    if (payload.empty())
      throw http::bad_request("An item needs a body");

    auto location = r.get("item")->url_path({{"id", std::to_string(payload.size())}});
    req.status(201)
       .add_header("Location", location)
       .add_header("Content-Length", "0");
    req.finish();
  });

  r.DELETE("/items/{id:[0-9]+}", [](request &req, request_context &) {
    req.status(204);
    req.finish();
  });

  r.OPTIONS("/", [](request &req, request_context &) {
    req.status(200)
       .add_header("Allow", "GET, POST, DELETE, OPTIONS")
       .add_header("Content-Length", "0");
    req.finish();
  });
}

int listen_on(const po::variables_map &options) {
  const int backlog = 128;
  const auto where = options.count("socket")
                       ? options["socket"].as<std::string>()
                       : fmt::format(":{:d}", options["port"].as<int>());

  const int socket = fcgi_request::open_socket(where, backlog);
  if (socket < 0)
    throw std::runtime_error(fmt::format("Can't listen on {}", where));
  return socket;
}

void open_log(const po::variables_map &options) {
  if (options.count("logfile"))
    logger::initialise(options["logfile"].as<std::string>());
}

/**
 * serve requests on socket until SIGTERM.
 */
void serve(int socket, const po::variables_map &options) {
  auto r = make_router();
  if (global_settings::get_method_not_allowed())
    r->set_method_not_allowed_handler(default_method_not_allowed_handler());
  add_demo_routes(*r);

  fcgi_request req(socket);
  logger::message(fmt::format("{} serving {} routes", PACKAGE_STRING, r->table().size()));

  while (!stop_requested) {
    if (reopen_log_requested.exchange(false)) {
      open_log(options);
      logger::message("Reopened log file");
    }

    // a negative result means a signal came in while waiting.
    if (req.accept_r() >= 0)
      process_request(req, *r);
  }

  req.dispose();
  logger::message("Stopped");
}

} // anonymous namespace


int main(int argc, char **argv) {
  try {
    po::variables_map options;
    if (!read_options(argc, argv, options))
      return 0;

    global_settings::set_configuration(std::make_unique<global_settings_via_options>(options));
    open_log(options);

    const int socket = listen_on(options);

    install_handler(SIGTERM, on_sigterm);
    install_handler(SIGHUP, on_sighup);

    serve(socket, options);

  } catch (const po::error &e) {
    std::cerr << "Error: " << e.what() << "\n(\"patmux --help\" for help)" << std::endl;
    return 1;

  } catch (const std::exception &e) {
    logger::message(e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
