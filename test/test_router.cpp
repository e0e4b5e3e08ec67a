/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#include "patmux/router.hpp"
#include "patmux/request_context.hpp"
#include "patmux/request_helpers.hpp"

#include "test_request.hpp"

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

namespace {

/**
 * handler which just counts how often it was called, and replies with a
 * body saying who it is.
 */
struct counting_handler {
  std::string name;
  int calls = 0;

  handler_func func() {
    return [this](request &req, request_context &) {
      ++calls;
      req.status(200)
         .add_header("Content-Type", "text/plain")
         .put(name);
      req.finish();
    };
  }
};

}

TEST_CASE("Non-canonical paths are redirected", "[router]") {
  auto r = make_router();
  counting_handler h{"h"};
  r->GET("/", h.func());

  SECTION("Dot segments") {
    test_request req("GET", "/a/../b");
    r->serve(req);

    CHECK(req.response_status() == 301);
    CHECK(req.response_header("Location") == "/b");
    CHECK(req.body().str().empty());
    CHECK(req.finished());
  }

  SECTION("Doubled slashes, and the query doesn't go along") {
    test_request req("GET", "//x//y/?q=1");
    r->serve(req);

    CHECK(req.response_status() == 301);
    CHECK(req.response_header("Location") == "/x/y/");
  }

  SECTION("Missing path") {
    test_request req;
    req.set_header("REQUEST_METHOD", "GET");
    r->serve(req);

    CHECK(req.response_status() == 301);
    CHECK(req.response_header("Location") == "/");
  }

  // the route would have matched any path, yet it never ran.
  CHECK(h.calls == 0);
}

TEST_CASE("Line breaks in a redirected path stay inside Location", "[router]") {
  auto r = make_router();
  counting_handler h{"h"};
  r->GET("/", h.func());

  test_request req("GET", "//%0D%0ASet-Cookie:%20evil=1");
  r->serve(req);

  CHECK(req.response_status() == 301);
  CHECK(req.header().str() ==
        "Status: 301 Moved Permanently\r\n"
        "Location: /  Set-Cookie: evil=1\r\n"
        "Content-Length: 0\r\n"
        "\r\n");
  CHECK(h.calls == 0);
}

TEST_CASE("Canonical paths are not redirected", "[router]") {
  auto r = make_router();
  counting_handler h{"h"};
  r->GET("/", h.func());

  for (const std::string p : {"/", "/b", "/a/b/", "/x.y"}) {
    test_request req("GET", p);
    r->serve(req);
    CHECK(req.response_status() == 200);
  }
  CHECK(h.calls == 4);
}

TEST_CASE("Skipping the canonical path redirect", "[router]") {
  auto r = make_router();
  counting_handler h{"h"};
  r->GET("/a", h.func());
  r->set_skip_clean(true);
  CHECK(r->skip_clean());

  test_request req("GET", "/a/../b");
  r->serve(req);

  CHECK(req.response_status() == 200);
  CHECK(h.calls == 1);
}

TEST_CASE("Route variables reach the handler", "[router]") {
  auto r = make_router();

  std::string seen_query;
  std::optional<std::string> seen_var;
  std::string seen_ctx_var;
  const route *seen_route = nullptr;

  auto &item = r->GET("/items/:id", [&](request &req, request_context &ctx) {
    seen_query = get_query_string(req);
    seen_var = get_route_var(req, "id");
    seen_ctx_var = ctx.vars.at("id");
    seen_route = ctx.matched;
    req.status(200);
    req.finish();
  });

  SECTION("Without a query") {
    test_request req("GET", "/items/42");
    r->serve(req);

    CHECK(req.response_status() == 200);
    CHECK(seen_query == "%3Aid=42");
    CHECK(seen_var == "42");
    CHECK(seen_ctx_var == "42");
    CHECK(seen_route == &item);
  }

  SECTION("Existing query is kept in front") {
    test_request req("GET", "/items/42?sort=asc");
    r->serve(req);

    CHECK(seen_query == "sort=asc&%3Aid=42");
    CHECK(seen_var == "42");
  }

  SECTION("Transport environment is untouched") {
    test_request req("GET", "/items/42?sort=asc");
    r->serve(req);

    CHECK(std::string(req.get_param("QUERY_STRING")) == "sort=asc");
  }
}

TEST_CASE("Escaped route variables", "[router]") {
  auto r = make_router();

  std::string seen_query;
  std::optional<std::string> seen_var;

  r->GET("/hello/{name}", [&](request &req, request_context &) {
    seen_query = get_query_string(req);
    seen_var = get_route_var(req, "name");
    req.status(200);
    req.finish();
  });

  test_request req("GET", "/hello/a%20b?sort=asc");
  r->serve(req);

  CHECK(req.response_status() == 200);
  CHECK(seen_query == "sort=asc&%3Aname=a+b");
  CHECK(seen_var == "a b");
}

TEST_CASE("Path info is used without a request uri", "[router]") {
  auto r = make_router();
  std::optional<std::string> seen_var;

  r->GET("/items/:id", [&](request &req, request_context &) {
    seen_var = get_route_var(req, "id");
    req.status(204);
    req.finish();
  });

  test_request req;
  req.set_header("REQUEST_METHOD", "GET");
  req.set_header("PATH_INFO", "/items/5");
  r->serve(req);

  CHECK(req.response_status() == 204);
  CHECK(seen_var == "5");
}

TEST_CASE("Escaped slashes in path info stay in the segment", "[router]") {
  auto r = make_router();
  counting_handler ab{"ab"};
  std::optional<std::string> seen_var;

  r->GET("/a/b", ab.func());
  r->GET("/{seg}", [&](request &req, request_context &ctx) {
    seen_var = ctx.vars.at("seg");
    req.status(200);
    req.finish();
  });

  test_request req;
  req.set_header("REQUEST_METHOD", "GET");
  req.set_header("PATH_INFO", "/a%2Fb");
  r->serve(req);

  CHECK(ab.calls == 0);
  CHECK(seen_var == "a%2Fb");
}

TEST_CASE("Unmatched requests get the default not found", "[router]") {
  auto r = make_router();
  counting_handler h{"h"};
  r->GET("/known", h.func());

  test_request req("DELETE", "/unknown");
  r->serve(req);

  CHECK(req.response_status() == 404);
  CHECK(req.body().str() == "404 page not found\n");
  CHECK(req.response_header("Content-Type") == "text/plain; charset=utf-8");
  CHECK(req.response_header("X-Content-Type-Options") == "nosniff");
  CHECK(h.calls == 0);
  CHECK(r->not_found_handler());
}

TEST_CASE("Custom not found handler", "[router]") {
  auto r = make_router();
  counting_handler nf{"nothing here"};
  r->set_not_found_handler(nf.func());

  {
    test_request req("GET", "/missing");
    r->serve(req);
    CHECK(req.response_status() == 200);
    CHECK(req.body().str() == "nothing here");
    CHECK(nf.calls == 1);
  }

  // clearing it brings back the default.
  r->set_not_found_handler(nullptr);
  {
    test_request req("GET", "/missing");
    r->serve(req);
    CHECK(req.response_status() == 404);
    CHECK(nf.calls == 1);
  }
}

TEST_CASE("Same path with different methods", "[router]") {
  auto r = make_router();
  counting_handler h1{"h1"}, h2{"h2"};
  r->GET("/x", h1.func());
  r->POST("/x", h2.func());

  {
    test_request req("GET", "/x");
    r->serve(req);
    CHECK(req.body().str() == "h1");
  }
  {
    test_request req("POST", "/x");
    r->serve(req);
    CHECK(req.body().str() == "h2");
  }

  CHECK(h1.calls == 1);
  CHECK(h2.calls == 1);
}

TEST_CASE("Registration helpers fix the method", "[router]") {
  auto r = make_router();
  counting_handler h{"h"};

  CHECK(r->OPTIONS("/o", h.func()).get_methods() == std::vector<std::string>{"OPTIONS"});
  CHECK(r->DELETE("/d", h.func()).get_methods() == std::vector<std::string>{"DELETE"});
  CHECK(r->HEAD("/h", h.func()).get_methods() == std::vector<std::string>{"HEAD"});
  CHECK(r->GET("/g", h.func()).get_methods() == std::vector<std::string>{"GET"});
  CHECK(r->POST("/po", h.func()).get_methods() == std::vector<std::string>{"POST"});
  CHECK(r->PUT("/pu", h.func()).get_methods() == std::vector<std::string>{"PUT"});
  CHECK(r->PATCH("/pa", h.func()).get_methods() == std::vector<std::string>{"PATCH"});
  CHECK(r->add("brew", "/b", h.func()).get_methods() == std::vector<std::string>{"BREW"});

  CHECK(r->table().size() == 8);
  CHECK_THROWS_AS(r->add("", "/any", h.func()), std::invalid_argument);

  test_request req("BREW", "/b");
  r->serve(req);
  CHECK(h.calls == 1);
}

TEST_CASE("Routes match by prefix, first registered wins", "[router]") {
  auto r = make_router();
  counting_handler broad{"broad"}, narrow{"narrow"};
  r->GET("/api", broad.func());
  r->GET("/api/v2", narrow.func());

  test_request req("GET", "/api/v2/things");
  r->serve(req);

  CHECK(req.body().str() == "broad");
  CHECK(narrow.calls == 0);
}

TEST_CASE("Routes configured after registration", "[router]") {
  auto r = make_router();
  counting_handler h{"h"};
  r->GET("/x", nullptr).name("x").methods({"PUT"}).handler(h.func());

  test_request req("PUT", "/x");
  r->serve(req);

  CHECK(req.response_status() == 200);
  CHECK(r->get("x") != nullptr);
  CHECK(r->get("y") == nullptr);
}

TEST_CASE("Route without a handler is not found", "[router]") {
  auto r = make_router();
  r->GET("/x", nullptr);

  test_request req("GET", "/x");
  r->serve(req);
  CHECK(req.response_status() == 404);
}

TEST_CASE("Method not allowed", "[router]") {
  auto r = make_router();
  counting_handler h{"h"};
  r->GET("/x", h.func());
  r->HEAD("/x", h.func());

  SECTION("Falls through to not found by default") {
    test_request req("PUT", "/x");
    r->serve(req);
    CHECK(req.response_status() == 404);
  }

  SECTION("Default 405 handler") {
    r->set_method_not_allowed_handler(default_method_not_allowed_handler());

    test_request req("PUT", "/x");
    r->serve(req);
    CHECK(req.response_status() == 405);
    CHECK(req.response_header("Allow") == "GET, HEAD");
    CHECK_FALSE(req.response_header("Content-Type"));
    CHECK(req.body().str().empty());
  }

  SECTION("Unknown paths are still not found") {
    r->set_method_not_allowed_handler(default_method_not_allowed_handler());

    test_request req("PUT", "/y");
    r->serve(req);
    CHECK(req.response_status() == 404);
  }

  SECTION("Custom handler sees the allowed methods") {
    std::vector<std::string> seen;
    r->set_method_not_allowed_handler([&](request &req, request_context &ctx) {
      seen = ctx.get<std::vector<std::string> >(allowed_methods_key).value();
      req.status(405);
      req.finish();
    });

    test_request req("DELETE", "/x/y");
    r->serve(req);
    CHECK(seen == std::vector<std::string>{"GET", "HEAD"});
  }

  CHECK(h.calls == 0);
}

TEST_CASE("Request context is cleared after dispatch", "[router]") {
  auto r = make_router();
  r->GET("/items/:id", [](request &req, request_context &ctx) {
    ctx.set("user", std::string("alice"));
    CHECK(ctx.get<std::string>("user") == "alice");
    CHECK_FALSE(ctx.get<int>("user"));
    req.status(200);
    req.finish();
  });

  SECTION("By default") {
    CHECK_FALSE(r->keep_context());

    test_request req("GET", "/items/1");
    request_context ctx(req);
    r->serve(req, ctx);

    CHECK_FALSE(ctx.contains("user"));
    CHECK(ctx.vars.empty());
    CHECK(ctx.matched == nullptr);
  }

  SECTION("Unless asked to keep it") {
    r->set_keep_context(true);

    test_request req("GET", "/items/1");
    request_context ctx(req);
    r->serve(req, ctx);

    CHECK(ctx.get<std::string>("user") == "alice");
    CHECK(ctx.vars.at("id") == "1");
    CHECK(ctx.matched != nullptr);
  }
}

TEST_CASE("Handler errors propagate", "[router]") {
  auto r = make_router();
  r->GET("/boom", [](request &, request_context &ctx) {
    ctx.set("touched", true);
    throw std::runtime_error("boom");
  });

  test_request req("GET", "/boom");
  request_context ctx(req);
  CHECK_THROWS_AS(r->serve(req, ctx), std::runtime_error);

  // the context is still cleared on the way out.
  CHECK_FALSE(ctx.contains("touched"));
}

TEST_CASE("Concurrent dispatch", "[router]") {
  auto r = make_router();
  std::atomic<int> found{0};

  r->GET("/items/:id", [&found](request &req, request_context &) {
    if (get_route_var(req, "id"))
      ++found;
    req.status(200);
    req.finish();
  });

  const int threads = 8;
  const int per_thread = 50;
  std::atomic<int> not_found{0};

  std::vector<std::thread> workers;
  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([&r, &not_found, t]() {
      for (int i = 0; i < per_thread; ++i) {
        test_request hit("GET", "/items/" + std::to_string(t * per_thread + i));
        r->serve(hit);

        test_request miss("GET", "/nothing");
        r->serve(miss);
        if (miss.response_status() == 404)
          ++not_found;
      }
    });
  }
  for (auto &w : workers)
    w.join();

  CHECK(found == threads * per_thread);
  CHECK(not_found == threads * per_thread);
}
