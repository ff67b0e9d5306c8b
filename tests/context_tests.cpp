#include "test_support.hpp"

using quantum::core::ExecutionError;
using quantum::runtime::ExecutionContext;
using quantum::runtime::FrameKind;
using quantum::runtime::SharedScope;
using quantum::runtime::Value;
using quantum::testing::throws;

namespace {

void blocks_see_outer_frames() {
    ExecutionContext ctx(nullptr, nullptr, Value{{"path", "/home"}});
    ExecutionContext::FrameGuard component(ctx, FrameKind::Component);
    ctx.declare("title", "Shop");
    {
        ExecutionContext::FrameGuard block(ctx, FrameKind::Block);
        ctx.declare("item", 1);
        assert(ctx.resolve("item").value() == 1);
        assert(ctx.resolve("title").value() == "Shop");
        assert(ctx.resolve("path").value() == "/home");
        assert(ctx.frame_count() == 2);
    }
    // the block binding is gone with its frame
    assert(!ctx.resolve("item"));
    assert(ctx.frame_count() == 1);
}

void shadowing_and_assignment() {
    ExecutionContext ctx(nullptr, nullptr);
    ExecutionContext::FrameGuard component(ctx, FrameKind::Component);
    ctx.declare("total", 0);
    {
        ExecutionContext::FrameGuard block(ctx, FrameKind::Block);
        // assign updates the visible outer binding
        ctx.assign("total", 5);
        ctx.assign("fresh", true);
        ctx.declare("shadow", "inner");
    }
    assert(ctx.resolve("total").value() == 5);
    assert(!ctx.resolve("fresh"));

    ctx.declare("shadow", "outer");
    {
        ExecutionContext::FrameGuard block(ctx, FrameKind::Block);
        ctx.declare("shadow", "inner");
        assert(ctx.resolve("shadow").value() == "inner");
    }
    assert(ctx.resolve("shadow").value() == "outer");
}

void nested_paths() {
    ExecutionContext ctx(nullptr, nullptr);
    ExecutionContext::FrameGuard component(ctx, FrameKind::Component);
    ctx.assign("user.address.city", "Oslo");
    assert(ctx.resolve("user.address.city").value() == "Oslo");
    assert(ctx.resolve("user").value().is_object());
    assert(!ctx.resolve("user.address.zip"));

    ctx.declare("list", Value::array({1, 2, 3}));
    ctx.assign("list.1", 20);
    assert(ctx.resolve("list").value() == Value::array({1, 20, 3}));
    assert(ctx.resolve("list.length").value() == 3);
}

void function_frames_are_boundaries() {
    ExecutionContext ctx(nullptr, nullptr);
    ExecutionContext::FrameGuard component(ctx, FrameKind::Component);
    ctx.declare("config", "component-level");
    {
        ExecutionContext::FrameGuard loop(ctx, FrameKind::Block);
        ctx.declare("caller_local", 1);
        {
            ExecutionContext::FrameGuard call(ctx, FrameKind::Function);
            ctx.declare("arg", 2);
            assert(ctx.resolve("arg").value() == 2);
            // caller's locals are hidden, the component frame is not
            assert(!ctx.resolve("caller_local"));
            assert(ctx.resolve("config").value() == "component-level");
        }
    }

    // a nested component invocation sees nothing of its caller
    {
        ExecutionContext::FrameGuard child(ctx, FrameKind::Component);
        assert(!ctx.resolve("config"));
    }
}

void prefixed_scopes() {
    auto application = std::make_shared<SharedScope>();
    auto session = std::make_shared<SharedScope>(Value{{"user", {{"id", 7}}}});
    ExecutionContext ctx(application, session, Value{{"query", {{"page", "2"}}}});
    ExecutionContext::FrameGuard component(ctx, FrameKind::Component);

    ctx.assign("application.visits", 1);
    assert(application->get("visits").value() == 1);
    assert(ctx.resolve("session.user.id").value() == 7);
    assert(ctx.resolve("request.query.page").value() == "2");
    // unprefixed names never reach the shared scopes
    assert(!ctx.resolve("visits"));
    assert(!ctx.resolve("user"));
    // but do reach the request scope
    assert(ctx.resolve("query.page").value() == "2");

    ctx.assign("request.flag", true);
    assert(ctx.request()["flag"] == true);
    ctx.assign("session.cart.items", Value::array());
    assert(session->get("cart.items").value().is_array());
}

void removal() {
    auto session = std::make_shared<SharedScope>(Value{{"token", "abc"}, {"nested", {{"a", 1}}}});
    ExecutionContext ctx(nullptr, session);
    ExecutionContext::FrameGuard component(ctx, FrameKind::Component);
    ctx.declare("temp", 1);

    assert(ctx.remove("temp"));
    assert(!ctx.remove("temp"));
    assert(ctx.remove("session.token"));
    assert(!session->contains("token"));
    assert(ctx.remove("session.nested.a"));
    assert(session->get("nested").value().empty());
    assert(throws<ExecutionError>([&] { ctx.remove("local.deep.path"); }));
}

void functions_route_through_the_handler() {
    ExecutionContext ctx(nullptr, nullptr);
    assert(!ctx.call_function("anything", {}));
    ctx.set_function_handler([](const std::string& name, const std::vector<Value>& args) -> std::optional<Value> {
        if (name == "sum") return Value(args.at(0).get<int>() + args.at(1).get<int>());
        return std::nullopt;
    });
    assert(ctx.call_function("sum", {Value(2), Value(3)}).value() == 5);
    assert(!ctx.call_function("other", {}));
}

void shared_scope_operations() {
    SharedScope scope;
    scope.set("cart.total", 10);
    scope.set("cart.items", Value::array({"a"}));
    assert(scope.contains("cart.total"));
    assert(scope.get("cart").value().size() == 2);
    assert(!scope.get("cart.missing"));
    assert(!scope.erase("cart.missing"));
    assert(scope.erase("cart.total"));
    assert((scope.snapshot() == Value{{"cart", {{"items", Value::array({"a"})}}}}));

    // scalar segments are replaced by objects on write
    scope.set("flag", true);
    scope.set("flag.inner", 1);
    assert(scope.get("flag.inner").value() == 1);

    scope.clear();
    assert(scope.snapshot().empty());

    SharedScope from_scalar(Value(42));
    assert(from_scalar.snapshot().is_object());
}

} // namespace

int main()
{
    blocks_see_outer_frames();
    shadowing_and_assignment();
    nested_paths();
    function_frames_are_boundaries();
    prefixed_scopes();
    removal();
    functions_route_through_the_handler();
    shared_scope_operations();
    return 0;
}
