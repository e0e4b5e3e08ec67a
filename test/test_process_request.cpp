/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#include "patmux/http.hpp"
#include "patmux/process_request.hpp"
#include "patmux/router.hpp"

#include "test_request.hpp"

#include <stdexcept>
#include <string>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

TEST_CASE("Successful requests pass through", "[process_request]") {
  auto r = make_router();
  r->GET("/ok", [](request &req, request_context &) {
    req.status(200).put("fine");
    req.finish();
  });

  test_request req("GET", "/ok");
  process_request(req, *r);

  CHECK(req.response_status() == 200);
  CHECK(req.body().str() == "fine");
}

TEST_CASE("Redirects and not found are not errors", "[process_request]") {
  auto r = make_router();

  {
    test_request req("GET", "/a/./b");
    process_request(req, *r);
    CHECK(req.response_status() == 301);
    CHECK_FALSE(req.response_header("Error"));
  }
  {
    test_request req("GET", "/a/b");
    process_request(req, *r);
    CHECK(req.response_status() == 404);
    CHECK_FALSE(req.response_header("Error"));
  }
}

TEST_CASE("HTTP errors become error responses", "[process_request]") {
  auto r = make_router();
  r->POST("/items", [](request &, request_context &) {
    throw http::bad_request("An item needs a body");
  });
  r->PUT("/items", [](request &, request_context &) {
    throw http::method_not_allowed({"GET", "POST"});
  });

  SECTION("Bad request") {
    test_request req("POST", "/items");
    process_request(req, *r);

    CHECK(req.response_status() == 400);
    CHECK(req.response_header("Error") == "An item needs a body");
    CHECK(req.response_header("Content-Type") == "text/plain");
    CHECK(req.body().str() == "An item needs a body");
  }

  SECTION("Method not allowed carries an Allow header") {
    test_request req("PUT", "/items");
    process_request(req, *r);

    CHECK(req.response_status() == 405);
    CHECK(req.response_header("Allow") == "GET, POST");
  }
}

TEST_CASE("Other errors become server errors", "[process_request]") {
  auto r = make_router();
  r->GET("/boom", [](request &, request_context &) {
    throw std::runtime_error("boom\nwith a second line");
  });

  test_request req("GET", "/boom");
  process_request(req, *r);

  CHECK(req.response_status() == 500);
  CHECK(req.response_header("Error") == "boom with a second line");
  CHECK(req.body().str() == "boom\nwith a second line");
}

TEST_CASE("Errors after the response started are only logged", "[process_request]") {
  auto r = make_router();
  r->GET("/half", [](request &req, request_context &) {
    req.status(200).put("partial");
    throw http::server_error("too late");
  });

  test_request req("GET", "/half");
  REQUIRE_NOTHROW(process_request(req, *r));

  CHECK(req.response_status() == 200);
  CHECK(req.body().str() == "partial");
  CHECK_FALSE(req.finished());
}

TEST_CASE("Payload limits are enforced", "[process_request]") {
  auto r = make_router();
  r->POST("/upload", [](request &req, request_context &) {
    auto payload = req.get_payload();
    req.status(200).put(std::to_string(payload.size()));
    req.finish();
  });

  SECTION("Content length mismatch") {
    test_request req("POST", "/upload");
    req.set_header("CONTENT_LENGTH", "10");
    req.set_payload("abc");
    process_request(req, *r);
    CHECK(req.response_status() == 500);
  }

  SECTION("Invalid content length") {
    test_request req("POST", "/upload");
    req.set_header("CONTENT_LENGTH", "ten");
    req.set_payload("abc");
    process_request(req, *r);
    CHECK(req.response_status() == 400);
  }

  SECTION("Valid payload") {
    test_request req("POST", "/upload");
    req.set_header("CONTENT_LENGTH", "3");
    req.set_payload("abc");
    process_request(req, *r);
    CHECK(req.response_status() == 200);
    CHECK(req.body().str() == "3");
  }
}
