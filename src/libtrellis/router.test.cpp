#include <trellis/trellis>

#include <gtest/gtest.h>

using namespace std::literals;

namespace {
    using order_list = std::vector<std::string>;

    const auto methods = std::vector<std::string_view> {
        "GET",
        "POST",
        "PUT",
        "DELETE",
        "PATCH",
        "HEAD",
        "OPTIONS"
    };

    auto make_request(
        std::string_view method,
        std::string_view path
    ) -> trellis::request {
        auto req = trellis::request();

        req.method = method;
        req.path = path;

        return req;
    }

    auto reply(std::string body, int code = 200) -> trellis::handler {
        return [body = std::move(body), code](
            trellis::response_writer& writer,
            trellis::request&
        ) {
            writer.write_header(code);
            writer.write(body);
        };
    }

    auto set_header(
        std::string name,
        std::string value
    ) -> trellis::middleware {
        return [name, value](trellis::handler next) -> trellis::handler {
            return [name, value, next = std::move(next)](
                trellis::response_writer& writer,
                trellis::request& req
            ) {
                writer.headers().set(name, value);
                next(writer, req);
            };
        };
    }

    auto record(order_list& order, std::string name) -> trellis::middleware {
        return [&order, name](trellis::handler next) -> trellis::handler {
            return [&order, name, next = std::move(next)](
                trellis::response_writer& writer,
                trellis::request& req
            ) {
                order.push_back(name);
                next(writer, req);
            };
        };
    }

    auto serve(
        const trellis::router& router,
        trellis::request req
    ) -> trellis::response_recorder {
        auto recorder = trellis::response_recorder();
        router.serve(recorder, req);
        return recorder;
    }

    auto serve(
        const trellis::router& router,
        std::string_view method,
        std::string_view path
    ) -> trellis::response_recorder {
        return serve(router, make_request(method, path));
    }

    auto register_route(
        trellis::router& router,
        std::string_view method,
        std::string_view path,
        trellis::handler fn
    ) -> void {
        if (method == "GET") router.get(path, std::move(fn));
        else if (method == "POST") router.post(path, std::move(fn));
        else if (method == "PUT") router.put(path, std::move(fn));
        else if (method == "DELETE") router.del(path, std::move(fn));
        else if (method == "PATCH") router.patch(path, std::move(fn));
        else if (method == "HEAD") router.head(path, std::move(fn));
        else if (method == "OPTIONS") router.options(path, std::move(fn));
    }
}

TEST(Router, Construct) {
    const auto router = trellis::router();

    EXPECT_TRUE(router.chain().empty());
    EXPECT_EQ(""sv, router.base_path());
}

TEST(Router, ConstructWithMiddleware) {
    auto chain = std::vector<trellis::middleware> {
        set_header("X-Test", "middleware")
    };
    auto router = trellis::router(std::move(chain));

    EXPECT_EQ(1u, router.chain().size());

    router.get("/test", reply("ok"));
    auto res = serve(router, "GET", "/test");

    EXPECT_EQ("middleware"sv, res.headers().get("x-test"));
}

TEST(Router, Methods) {
    for (const auto method : methods) {
        auto router = trellis::router();
        register_route(router, method, "/test", reply(std::string(method)));

        auto res = serve(router, method, "/test");

        EXPECT_EQ(200, res.code) << method;
        EXPECT_EQ(method, res.body);
    }
}

TEST(Router, MethodMismatch) {
    auto router = trellis::router();
    router.post("/test", reply("created", 201));

    auto res = serve(router, "PUT", "/test");

    EXPECT_EQ(405, res.code);
    EXPECT_EQ("POST"sv, res.headers().get("allow"));
}

TEST(Router, Any) {
    auto router = trellis::router();
    router.any("/any", reply("any"));

    for (const auto method : methods) {
        auto res = serve(router, method, "/any");

        EXPECT_EQ(200, res.code) << method;
        EXPECT_EQ("any"sv, res.body) << method;
    }
}

TEST(Router, MiddlewareOrder) {
    auto order = order_list();
    auto router = trellis::router();

    router.use(record(order, "m1"), record(order, "m2"));
    router.get("/test", [&order](auto& writer, auto&) {
        order.push_back("handler");
        writer.write_header(200);
    });

    serve(router, "GET", "/test");

    EXPECT_EQ((order_list {"m1", "m2", "handler"}), order);
}

TEST(Router, RouteMiddlewareRunsInsideChain) {
    auto order = order_list();
    auto router = trellis::router();

    router.use(record(order, "router"));
    router.get(
        "/test",
        [&order](auto&, auto&) { order.push_back("handler"); },
        {record(order, "route")}
    );

    serve(router, "GET", "/test");

    EXPECT_EQ((order_list {"router", "route", "handler"}), order);
}

TEST(Router, UseDoesNotAffectEarlierRoutes) {
    auto router = trellis::router();

    router.get("/before", reply("before"));
    router.use(set_header("X-Late", "true"));
    router.get("/after", reply("after"));

    auto before = serve(router, "GET", "/before");
    auto after = serve(router, "GET", "/after");

    EXPECT_FALSE(before.headers().contains("x-late"));
    EXPECT_EQ("true"sv, after.headers().get("x-late"));
}

TEST(Router, Compose) {
    auto order = order_list();
    auto router = trellis::router();

    router.use(record(order, "router"));

    const auto fn = router.compose(
        [&order](auto&, auto&) { order.push_back("handler"); },
        {record(order, "route")}
    );

    auto recorder = trellis::response_recorder();
    auto req = make_request("GET", "/");
    fn(recorder, req);

    EXPECT_EQ((order_list {"router", "route", "handler"}), order);
}

TEST(Router, Group) {
    auto router = trellis::router();

    router.use(set_header("X-Root", "true"));
    router.group([](trellis::router& r) {
        r.use(set_header("X-Group", "true"));
        r.get("/group", reply("group response"));
    });
    router.get("/root", reply("root response"));

    auto group = serve(router, "GET", "/group");

    EXPECT_EQ("group response"sv, group.body);
    EXPECT_EQ("true"sv, group.headers().get("x-root"));
    EXPECT_EQ("true"sv, group.headers().get("x-group"));

    auto root = serve(router, "GET", "/root");

    EXPECT_EQ("root response"sv, root.body);
    EXPECT_EQ("true"sv, root.headers().get("x-root"));
    EXPECT_FALSE(root.headers().contains("x-group"));
    EXPECT_EQ(1u, router.chain().size());
}

TEST(Router, Route) {
    auto router = trellis::router();

    router.route("/api", [](trellis::router& r) {
        r.get("/users", reply("users"));
        r.post("/users", reply("user created", 201));
    });

    auto get = serve(router, "GET", "/api/users");

    EXPECT_EQ(200, get.code);
    EXPECT_EQ("users"sv, get.body);

    auto post = serve(router, "POST", "/api/users");

    EXPECT_EQ(201, post.code);
    EXPECT_EQ("user created"sv, post.body);

    EXPECT_EQ(404, serve(router, "GET", "/users").code);
}

TEST(Router, RouteAppliesParentChain) {
    auto order = order_list();
    auto router = trellis::router();

    router.use(record(order, "parent"));
    router.route(
        "/api",
        [&order](trellis::router& r) {
            r.get("/test", [&order](auto&, auto&) {
                order.push_back("handler");
            });
        },
        {record(order, "child")}
    );

    serve(router, "GET", "/api/test");

    EXPECT_EQ((order_list {"parent", "child", "handler"}), order);
}

TEST(Router, RouteInheritsNotFoundHandler) {
    auto router = trellis::router();

    router.set_not_found_handler(reply("custom not found", 404));

    const auto sub = router.route("/api", [](trellis::router& r) {
        r.get("/users", reply("users"));
    });

    auto res = serve(sub, "GET", "/api/missing");

    EXPECT_EQ(404, res.code);
    EXPECT_EQ("custom not found"sv, res.body);
}

TEST(Router, Mount) {
    auto router = trellis::router();
    router.mount("/mounted", reply("mounted handler"));

    auto res = serve(router, "GET", "/mounted/anything");

    EXPECT_EQ(200, res.code);
    EXPECT_EQ("mounted handler"sv, res.body);
}

TEST(Router, MountWithTrailingSlash) {
    auto router = trellis::router();
    router.mount("/files/", reply("files"));

    auto res = serve(router, "GET", "/files/readme.txt");

    EXPECT_EQ(200, res.code);
    EXPECT_EQ("files"sv, res.body);

    auto redirect = serve(router, "GET", "/files");

    EXPECT_EQ(307, redirect.code);
    EXPECT_EQ("/files/"sv, redirect.headers().get("location"));
}

TEST(Router, DefaultNotFound) {
    auto router = trellis::router();
    router.get("/exists", reply(""));

    auto res = serve(router, "GET", "/nonexistent");

    EXPECT_EQ(404, res.code);
    EXPECT_EQ("404 page not found\n"sv, res.body);
}

TEST(Router, CustomNotFound) {
    auto router = trellis::router();
    router.set_not_found_handler(reply("custom not found", 404));

    auto res = serve(router, "GET", "/nonexistent");

    EXPECT_EQ(404, res.code);
    EXPECT_EQ("custom not found"sv, res.body);
}

TEST(Router, NotFoundWritesJson) {
    const auto router = trellis::router();
    auto recorder = trellis::response_recorder();
    auto req = make_request("GET", "/missing");

    router.not_found(recorder, req);

    EXPECT_EQ(404, recorder.code);
    EXPECT_EQ("application/json"sv, recorder.headers().get("content-type"));
    EXPECT_EQ(R"({"error":"Not Found"})"sv, recorder.body);
}

TEST(Router, NotFoundDelegates) {
    auto router = trellis::router();
    router.set_not_found_handler(reply("custom", 410));

    auto recorder = trellis::response_recorder();
    auto req = make_request("GET", "/missing");

    router.not_found(recorder, req);

    EXPECT_EQ(410, recorder.code);
    EXPECT_EQ("custom"sv, recorder.body);
}

TEST(Router, PathParameters) {
    auto router = trellis::router();

    router.get("/users/{id}", [](auto& writer, trellis::request& req) {
        writer.write_header(200);
        writer.write("user " + std::string(req.path_value("id")));
    });

    auto res = serve(router, "GET", "/users/123");

    EXPECT_EQ(200, res.code);
    EXPECT_EQ("user 123"sv, res.body);
}

TEST(Router, TypedPathParameters) {
    auto router = trellis::router();
    auto id = 0;

    router.use(trellis::recover());
    router.get("/users/{id}", [&id](auto& writer, trellis::request& req) {
        id = req.path_param<int>("id");
        writer.write_header(204);
    });

    EXPECT_EQ(204, serve(router, "GET", "/users/42").code);
    EXPECT_EQ(42, id);

    EXPECT_EQ(400, serve(router, "GET", "/users/abc").code);
}

TEST(Router, AliasedRouteKeepsParamNames) {
    auto router = trellis::router();

    router.use(trellis::recover());
    router.route("/user_groups", [](trellis::router& r) {
        r.get("/{group_id}", [](auto& writer, trellis::request& req) {
            const auto id = req.path_param<int>("group_id");

            writer.write_header(200);
            writer.write("group " + std::to_string(id));
        });
    });

    for (const auto path : {"/user_groups/5"sv, "/user-groups/5"sv}) {
        auto res = serve(router, "GET", path);

        EXPECT_EQ(200, res.code) << path;
        EXPECT_EQ("group 5"sv, res.body) << path;
    }
}

TEST(Router, BasePath) {
    auto router = trellis::router();

    EXPECT_EQ(""sv, router.base_path());

    router.set_base_path("/api");
    EXPECT_EQ("/api"sv, router.base_path());

    router.append_path("v1");
    EXPECT_EQ("/api/v1"sv, router.base_path());

    router.append_path("/users/");
    EXPECT_EQ("/api/v1/users"sv, router.base_path());
}

TEST(Router, AppendPathToEmptyBase) {
    auto router = trellis::router();

    router.append_path("api");

    EXPECT_EQ("/api"sv, router.base_path());
}

TEST(Router, RoutesRespectBasePath) {
    auto router = trellis::router();

    router.set_base_path("/api");
    router.get("/users", reply("users"));

    auto res = serve(router, "GET", "/api/users");

    EXPECT_EQ(200, res.code);
    EXPECT_EQ("users"sv, res.body);

    EXPECT_EQ(404, serve(router, "GET", "/users").code);
}

TEST(Router, NestedRoutes) {
    auto router = trellis::router();

    router.route("/api", [](trellis::router& r) {
        r.route("/v1", [](trellis::router& r) {
            r.get("/users", reply("nested users"));
        });
    });

    auto res = serve(router, "GET", "/api/v1/users");

    EXPECT_EQ(200, res.code);
    EXPECT_EQ("nested users"sv, res.body);
}

TEST(Router, MountRespectsBasePath) {
    auto router = trellis::router();

    router.set_base_path("/api");
    router.mount("/service", reply("mounted"));

    auto res = serve(router, "GET", "/api/service/anything");

    EXPECT_EQ(200, res.code);
    EXPECT_EQ("mounted"sv, res.body);
}

TEST(Router, SubRouterInheritsBasePath) {
    auto router = trellis::router();
    router.set_base_path("/api");

    const auto sub = router.route("/v1", [](trellis::router& r) {
        r.get("/users", reply("sub-router"));
    });

    EXPECT_EQ("/api/v1"sv, sub.base_path());

    auto res = serve(router, "GET", "/api/v1/users");

    EXPECT_EQ(200, res.code);
    EXPECT_EQ("sub-router"sv, res.body);
}

TEST(Router, SetHandler) {
    auto router = trellis::router();

    router.set_handler(set_header("X-Top-Level", "true"));
    router.get("/test", reply("test"));

    auto res = serve(router, "GET", "/test");

    EXPECT_EQ("true"sv, res.headers().get("x-top-level"));
    EXPECT_EQ("test"sv, res.body);
}

TEST(Router, SetHandlerWrapsAllMethods) {
    auto router = trellis::router();

    router.set_handler(set_header("X-Top-Level", "applied"));
    for (const auto method : methods) {
        register_route(router, method, "/test", reply(std::string(method)));
    }

    for (const auto method : methods) {
        auto res = serve(router, method, "/test");

        EXPECT_EQ("applied"sv, res.headers().get("x-top-level")) << method;
        EXPECT_EQ(method, res.body);
    }
}

TEST(Router, SetHandlerSkipsNotFound) {
    auto router = trellis::router();

    router.set_handler(set_header("X-Top-Level", "applied"));
    router.set_not_found_handler([](auto& writer, auto&) {
        writer.headers().set("X-Not-Found", "custom");
        writer.write_header(404);
        writer.write("custom not found");
    });
    router.get("/exists", reply("exists"));

    auto found = serve(router, "GET", "/exists");

    EXPECT_EQ("applied"sv, found.headers().get("x-top-level"));
    EXPECT_EQ("exists"sv, found.body);

    auto missing = serve(router, "GET", "/nonexistent");

    EXPECT_FALSE(missing.headers().contains("x-top-level"));
    EXPECT_EQ("custom"sv, missing.headers().get("x-not-found"));
    EXPECT_EQ("custom not found"sv, missing.body);
}

TEST(Router, SetHandlerRunsFirst) {
    auto order = order_list();
    auto router = trellis::router();

    router.use(record(order, "router-1"), record(order, "router-2"));
    router.set_handler(record(order, "top-level"));
    router.get(
        "/test",
        [&order](auto& writer, auto&) {
            order.push_back("handler");
            writer.write_header(200);
        },
        {record(order, "route")}
    );

    serve(router, "GET", "/test");

    EXPECT_EQ(
        (order_list {"top-level", "router-1", "router-2", "route", "handler"}),
        order
    );
}

TEST(Router, SetHandlerModifiesRequest) {
    auto router = trellis::router();

    router.set_handler([](trellis::handler next) -> trellis::handler {
        return [next = std::move(next)](auto& writer, trellis::request& req) {
            req.headers.set("X-Modified", "by-top-level");
            next(writer, req);
        };
    });
    router.get("/test", [](auto& writer, trellis::request& req) {
        const auto modified = req.headers.get("x-modified");

        writer.write_header(200);
        writer.write("modified: " + std::string(modified));
    });

    auto res = serve(router, "GET", "/test");

    EXPECT_EQ(200, res.code);
    EXPECT_EQ("modified: by-top-level"sv, res.body);
}

TEST(Router, SetHandlerShortCircuits) {
    auto router = trellis::router();

    router.set_handler([](trellis::handler next) -> trellis::handler {
        return [next = std::move(next)](auto& writer, trellis::request& req) {
            if (req.headers.get("x-block") == "true") {
                writer.write_header(403);
                writer.write("blocked");
                return;
            }

            next(writer, req);
        };
    });
    router.get("/test", reply("allowed"));

    auto allowed = serve(router, "GET", "/test");

    EXPECT_EQ(200, allowed.code);
    EXPECT_EQ("allowed"sv, allowed.body);

    auto req = make_request("GET", "/test");
    req.headers.set("X-Block", "true");

    auto blocked = serve(router, std::move(req));

    EXPECT_EQ(403, blocked.code);
    EXPECT_EQ("blocked"sv, blocked.body);
}

TEST(Router, MiddlewareShortCircuits) {
    auto called = false;
    auto router = trellis::router();

    router.use([](trellis::handler) -> trellis::handler {
        return [](trellis::response_writer& writer, trellis::request&) {
            writer.write_header(401);
        };
    });
    router.get("/test", [&called](auto&, auto&) { called = true; });

    EXPECT_EQ(401, serve(router, "GET", "/test").code);
    EXPECT_FALSE(called);
}

TEST(Router, NoTopLevelHandler) {
    auto router = trellis::router();
    router.get("/test", reply("no top-level"));

    auto res = serve(router, "GET", "/test");

    EXPECT_EQ(200, res.code);
    EXPECT_EQ("no top-level"sv, res.body);
}

TEST(Router, TrailingSlashRedirectKeepsMethod) {
    for (const auto method : methods) {
        auto router = trellis::router();
        register_route(router, method, "/route/{$}", reply("success"));

        auto res = serve(router, method, "/route");

        EXPECT_EQ(307, res.code) << method;
        EXPECT_EQ("/route/"sv, res.headers().get("location")) << method;

        router.route("/nested/", [method](trellis::router& r) {
            register_route(r, method, "/route/", reply("nested success"));
            register_route(r, method, "/{$}", reply("nested root success"));
        });

        for (const auto path : {"/nested/route"sv, "/nested"sv}) {
            auto nested = serve(router, method, path);

            EXPECT_EQ(307, nested.code) << method << ' ' << path;
            EXPECT_EQ(
                fmt::format("{}/", path),
                nested.headers().get("location")
            ) << method << ' ' << path;
        }

        auto slashed = serve(router, method, "/nested/route/");

        EXPECT_EQ(200, slashed.code) << method;
        EXPECT_EQ("nested success"sv, slashed.body) << method;
    }
}
