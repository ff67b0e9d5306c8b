#include "test_support.hpp"

using quantum::core::EvaluationError;
using quantum::core::ExecutionError;
using quantum::core::ParamError;
using quantum::core::ServiceContainer;
using quantum::runtime::ComponentRuntime;
using quantum::runtime::RenderedOutput;
using quantum::runtime::RuntimeOptions;
using quantum::runtime::Scopes;
using quantum::runtime::SharedScope;
using quantum::runtime::Value;
using quantum::testing::contains;
using quantum::testing::render;
using quantum::testing::throws;

namespace {

RenderedOutput run(ComponentRuntime& rt, const std::string& source, const Value& params = Value::object(),
                   Scopes scopes = {}) {
    return rt.execute_component(rt.parse_source(source, "test.q"), params, std::move(scopes));
}

void range_loop_accumulates() {
    ServiceContainer services;
    ComponentRuntime rt(services);

    auto html = render(rt, R"(<q:component name="Sum">
  <q:set name="total" value="0" type="integer"/>
  <q:loop var="i" from="1" to="5">
    <q:set name="total" value="{total + i}"/>
  </q:loop>
  <p>{total}</p>
</q:component>)");
    assert(html == "<p>15</p>");

    assert(render(rt, "<q:loop var=\"i\" from=\"5\" to=\"1\" step=\"-2\">{i};</q:loop>") == "5;3;1;");
    assert(render(rt, "<q:loop var=\"i\" from=\"3\" to=\"1\">{i}</q:loop>") == "");
    assert(throws<ExecutionError>([&] { render(rt, "<q:loop var=\"i\" from=\"1\" to=\"3\" step=\"0\">x</q:loop>"); }));
    assert(throws<ExecutionError>([&] { render(rt, "<q:loop var=\"i\" from=\"a\" to=\"3\">x</q:loop>"); }));
}

void integer_limits_in_loops_and_sets() {
    ServiceContainer services;
    ComponentRuntime rt(services);
    const double two_63 = 9223372036854775808.0;

    // loops ending at the edge of the int64 range stop instead of wrapping
    assert(render(rt, "<q:loop var=\"i\" from=\"9223372036854775806\" to=\"9223372036854775807\">{i};</q:loop>") ==
           "9223372036854775806;9223372036854775807;");
    assert(render(rt, "<q:loop var=\"i\" from=\"-9223372036854775807\" to=\"-9223372036854775808\" step=\"-1\">{i};</q:loop>") ==
           "-9223372036854775807;-9223372036854775808;");
    assert(throws<ExecutionError>([&] { render(rt, "<q:loop var=\"i\" from=\"1e300\" to=\"2\">x</q:loop>"); }));

    auto incremented = run(rt, R"(<q:set name="n" value="{9223372036854775807}"/>
<q:set name="n" operation="increment"/>
<q:return value="{n}"/>)");
    assert(incremented.return_value.is_number_float());
    assert(incremented.return_value == two_63);

    auto multiplied = run(rt, R"(<q:set name="n" value="{-9223372036854775807 - 1}"/>
<q:set name="n" operation="multiply" value="{-1}"/>
<q:return value="{n}"/>)");
    assert(multiplied.return_value == two_63);

    auto added = run(rt, "<q:set name=\"n\" value=\"{40}\"/><q:set name=\"n\" operation=\"add\" value=\"{2}\"/><q:return value=\"{n}\"/>");
    assert(added.return_value == 42);
    assert(added.return_value.is_number_integer());
}

void inline_text_keeps_document_order() {
    ServiceContainer services;
    ComponentRuntime rt(services);
    auto html = render(rt, "<q:loop var=\"i\" from=\"1\" to=\"2\">Row {i}<br/></q:loop>");
    assert(html == "Row 1<br />Row 2<br />");
}

void array_list_and_query_loops() {
    ServiceContainer services;
    ComponentRuntime rt(services);

    auto source = R"(<q:component name="Lists">
  <q:param name="items" type="array"/>
  <q:loop type="array" var="x" items="{items}" index="n">{n}:{x}/{x_count} </q:loop>
  <p>{isDefined(x)}</p>
</q:component>)";
    assert(render(rt, source, Value{{"items", Value::array({"a", "b"})}}) == "0:a/1 1:b/2 <p>false</p>");

    // an empty collection runs the body zero times and binds nothing
    assert(render(rt, source, Value{{"items", Value::array()}}) == "<p>false</p>");
    assert(render(rt, "<q:loop type=\"array\" var=\"x\" items=\"{[]}\">x</q:loop><p>done</p>") == "<p>done</p>");

    assert(render(rt, "<q:loop type=\"list\" var=\"t\" items=\"a; b;;c\" delimiter=\";\">[{t}]</q:loop>") == "[a][b][c]");

    auto rows = R"(<q:component name="Rows">
  <q:set name="people" value="{[{name: 'Ada'}, {name: 'Alan'}]}"/>
  <q:loop query="people">{currentRow}.{name} </q:loop>
</q:component>)";
    assert(render(rt, rows) == "1.Ada 2.Alan ");

    assert(throws<ExecutionError>([&] {
        render(rt, "<q:set name=\"n\" value=\"{5}\"/><q:loop type=\"array\" var=\"x\" items=\"{n}\">x</q:loop>");
    }));
}

void conditional_branches() {
    ServiceContainer services;
    ComponentRuntime rt(services);
    auto source = R"(<q:component name="Size">
  <q:param name="n" type="integer"/>
  <q:if condition="n gt 5">big<q:elseif condition="n gt 2"/>mid<q:else/>small</q:if>
</q:component>)";
    assert(render(rt, source, Value{{"n", 9}}) == "big");
    assert(render(rt, source, Value{{"n", 3}}) == "mid");
    assert(render(rt, source, Value{{"n", 1}}) == "small");

    // branches share the enclosing frame
    assert(render(rt, "<q:if condition=\"true\"><q:set name=\"flag\" value=\"yes\"/></q:if>{flag}") == "yes");

    assert(throws<EvaluationError>([&] { render(rt, "<q:if condition=\"1 +\">x</q:if>"); }));
}

void set_operations() {
    ServiceContainer services;
    ComponentRuntime rt(services);

    auto lists = R"(<q:component name="Lists">
  <q:set name="list" value="{[3, 1, 2]}"/>
  <q:set name="list" operation="append" value="{5}"/>
  <q:set name="list" operation="prepend" value="{0}"/>
  <q:set name="list" operation="sort"/>
  <a>{join(list, ',')}</a>
  <q:set name="list" operation="sort" value="desc"/>
  <b>{join(list, ',')}</b>
  <q:set name="list" operation="removeAt" index="0"/>
  <q:set name="list" operation="remove" value="{2}"/>
  <q:set name="list" operation="merge" value="{[1, 1]}"/>
  <q:set name="list" operation="unique"/>
  <q:set name="list" operation="reverse"/>
  <i>{join(list, ',')}</i>
  <q:set name="list" operation="clear"/>
  <u>{len(list)}</u>
</q:component>)";
    assert(render(rt, lists) == "<a>0,1,2,3,5</a><b>5,3,2,1,0</b><i>0,1,3</i><u>0</u>");

    auto numbers = R"(<q:component name="Numbers">
  <q:set name="n" operation="increment"/>
  <q:set name="n" operation="increment" step="4"/>
  <q:set name="n" operation="decrement"/>
  <q:set name="n" operation="multiply" value="3"/>
  <q:set name="n" operation="add" value="{0.5}"/>
  <q:set name="whole" value="42" type="integer"/>
  <p>{n} {whole + 1}</p>
</q:component>)";
    assert(render(rt, numbers) == "<p>12.5 43</p>");

    auto objects = R"(<q:component name="Objects">
  <q:set name="user" value="{{name: 'Ada'}}"/>
  <q:set name="user" operation="merge" value="{{age: 36}}"/>
  <q:set name="user" operation="setProperty" key="role" value="admin"/>
  <q:set name="copy" operation="clone" source="user"/>
  <q:set name="copy" operation="deleteProperty" key="age"/>
  <q:set name="shout" operation="uppercase" value="{user.name}"/>
  <q:set name="padded" value="  x  "/>
  <q:set name="padded" operation="trim"/>
  <p>{user.name}/{user.age}/{user.role}/{isDefined(copy.age)}/{shout}/[{padded}]</p>
</q:component>)";
    assert(render(rt, objects) == "<p>Ada/36/admin/false/ADA/[x]</p>");

    assert(throws<ExecutionError>([&] { render(rt, "<q:set name=\"n\" value=\"abc\" type=\"integer\"/>"); }));
    assert(throws<ExecutionError>([&] { render(rt, "<q:set name=\"s\" value=\"x\"/><q:set name=\"s\" operation=\"increment\"/>"); }));
    assert(throws<ExecutionError>([&] { render(rt, "<q:set name=\"l\" value=\"{[1]}\"/><q:set name=\"l\" operation=\"removeAt\" index=\"4\"/>"); }));
    assert(throws<ExecutionError>([&] { render(rt, "<q:set name=\"o\" operation=\"setProperty\" value=\"1\"/>"); }));
}

void set_validation() {
    ServiceContainer services;
    ComponentRuntime rt(services);

    assert(render(rt, "<q:set name=\"age\" value=\"{5}\" range=\"1..10\"/>{age}") == "5");
    assert(render(rt, "<q:set name=\"code\" value=\"AB12\" pattern=\"[A-Z]+[0-9]+\" maxlength=\"4\"/>{code}") == "AB12");

    try {
        render(rt, "<q:set name=\"email\" value=\"nope\" pattern=\"^[^@]+@[^@]+$\"/>");
        assert(false);
    } catch (const ExecutionError& e) {
        assert(contains(e.what(), "Variable 'email'"));
        assert(contains(e.what(), "does not match"));
        assert(e.location().file == "test.q");
    }

    assert(throws<ExecutionError>([&] { render(rt, "<q:set name=\"x\" value=\"\" required=\"true\"/>"); }));
    assert(throws<ExecutionError>([&] { render(rt, "<q:set name=\"x\" value=\"{null}\" nullable=\"false\"/>"); }));
    assert(throws<ExecutionError>([&] { render(rt, "<q:set name=\"x\" value=\"c\" enum=\"a,b\"/>"); }));
    assert(throws<ExecutionError>([&] { render(rt, "<q:set name=\"x\" value=\"{11}\" range=\"1..10\"/>"); }));
    assert(throws<ExecutionError>([&] { render(rt, "<q:set name=\"x\" value=\"{-1}\" min=\"0\"/>"); }));
    assert(throws<ExecutionError>([&] { render(rt, "<q:set name=\"x\" value=\"abcd\" maxlength=\"3\"/>"); }));
    assert(throws<ExecutionError>([&] { render(rt, "<q:set name=\"x\" value=\"a\" minlength=\"2\"/>"); }));
    assert(throws<ExecutionError>([&] { render(rt, "<q:set name=\"x\" value=\"a\" pattern=\"[\"/>"); }));
}

void set_targets_shared_scopes() {
    ServiceContainer services;
    ComponentRuntime rt(services);
    auto session = std::make_shared<SharedScope>();
    auto application = std::make_shared<SharedScope>();

    auto source = R"(<q:component name="Visits">
  <q:set name="visits" scope="session" operation="increment"/>
  <q:set name="application.hits" operation="increment"/>
  <q:set name="request.seen" value="{true}"/>
  <p>{session.visits}/{application.hits}/{request.seen}</p>
</q:component>)";
    assert(render(rt, source, Value::object(), Scopes{application, session}) == "<p>1/1/true</p>");
    assert(render(rt, source, Value::object(), Scopes{application, session}) == "<p>2/2/true</p>");
    assert(session->get("visits").value() == 2);
    assert(application->get("hits").value() == 2);
}

void markup_attributes_and_escaping() {
    ServiceContainer services;
    ComponentRuntime rt(services);
    auto source = R"(<q:component name="Field">
  <q:param name="locked" type="boolean" default="false"/>
  <q:param name="name" type="string"/>
  <q:param name="note" default="{null}"/>
  <input disabled="{locked}" value="{name}" class="field {name}" title="{note}" data-x="a&amp;b"/>
</q:component>)";
    assert(render(rt, source, Value{{"name", "Ada & Co"}}) ==
           "<input value=\"Ada &amp; Co\" class=\"field Ada &amp; Co\" data-x=\"a&amp;b\" />");
    assert(render(rt, source, Value{{"name", "x"}, {"locked", true}}) ==
           "<input disabled value=\"x\" class=\"field x\" data-x=\"a&amp;b\" />");

    assert(render(rt, "<q:set name=\"h\" value=\"&lt;b&gt;\"/><p>{h}</p>") == "<p>&lt;b&gt;</p>");
    assert(render(rt, "<p><![CDATA[<b>{raw}</b>]]></p>") == "<p><b>{raw}</b></p>");
    assert(render(rt, "<p>literal \\{x\\}</p>") == "<p>literal {x}</p>");
}

void functions_and_returns() {
    ServiceContainer services;
    ComponentRuntime rt(services);

    auto source = R"(<q:component name="Math">
  <q:set name="rate" value="{3}"/>
  <p>{triple(7)} {greet('Ada')}</p>
  <q:function name="triple" returnType="number">
    <q:param name="x" type="number" required="true"/>
    <q:return value="{x * rate}"/>
  </q:function>
  <q:function name="greet" returnType="string">
    <q:param name="who"/>
    <q:set name="message" value="Hello, {who}"/>
    <q:return value="{message}"/>
  </q:function>
</q:component>)";
    assert(render(rt, source) == "<p>21 Hello, Ada</p>");

    auto output = run(rt, "<q:set name=\"x\" value=\"{40}\"/><q:return value=\"{x + 2}\"/><p>unreached</p>");
    assert(output.return_value == 42);
    assert(output.html().empty());

    auto nested = run(rt, "<section><div><q:return value=\"{7}\"/><p>unreached</p></div></section><p>after</p>");
    assert(nested.return_value == 7);
    assert(nested.html() == "<section><div></div></section>");

    assert(throws<ParamError>([&] {
        render(rt, "<q:function name=\"f\"><q:param name=\"x\" required=\"true\"/><q:return value=\"{x}\"/></q:function>{f()}");
    }));
    assert(throws<ExecutionError>([&] {
        render(rt, "<q:function name=\"f\" returnType=\"integer\"><q:return value=\"abc\"/></q:function>{f()}");
    }));
    assert(throws<EvaluationError>([&] { render(rt, "{undefinedFunction(1)}"); }));
}

void recursion_is_bounded() {
    ServiceContainer services;
    ComponentRuntime rt(services);
    try {
        render(rt, R"(<q:component name="Deep">
  <q:function name="down">
    <q:param name="n"/>
    <q:return value="{down(n + 1)}"/>
  </q:function>
  <p>{down(1)}</p>
</q:component>)");
        assert(false);
    } catch (const ExecutionError& e) {
        assert(contains(e.what(), "Maximum call depth"));
    }
}

void execution_budgets() {
    ServiceContainer services;
    RuntimeOptions options;
    options.limits.max_steps = 50;
    ComponentRuntime rt(services, options);

    try {
        render(rt, "<q:loop var=\"i\" from=\"1\" to=\"1000\"><q:set name=\"x\" value=\"{i}\"/></q:loop>");
        assert(false);
    } catch (const ExecutionError& e) {
        assert(contains(e.what(), "Step budget"));
    }
    assert(render(rt, "<q:loop var=\"i\" from=\"1\" to=\"3\">{i}</q:loop>") == "123");

    ComponentRuntime unlimited(services);
    std::atomic<bool> cancel{true};
    auto unit = unlimited.parse_source("<p>never</p>", "test.q");
    assert(throws<ExecutionError>([&] { unlimited.execute_component(unit, Value::object(), {}, &cancel); }));
    cancel = false;
    assert(unlimited.execute_component(unit, Value::object(), {}, &cancel).html() == "<p>never</p>");
}

void redirect_and_flash() {
    ServiceContainer services;
    ComponentRuntime rt(services);

    auto output = run(rt, R"(<q:component name="Guard">
  <q:param name="path" default="/cart"/>
  <q:flash type="warning" message="Session for {path} expired"/>
  <div><q:redirect url="/login?next={path}" status="301" flash="Please log in"/><p>hidden</p></div>
  <p>after</p>
</q:component>)");
    assert(output.redirected());
    assert(output.redirect->url == "/login?next=/cart");
    assert(output.redirect->status == 301);
    assert(output.status == 301);
    assert(output.flashes.size() == 2);
    assert(output.flashes[0].type == "warning");
    assert(output.flashes[0].message == "Session for /cart expired");
    assert(output.flashes[1].message == "Please log in");
    assert(!contains(output.html(), "hidden"));
    assert(!contains(output.html(), "after"));
    // the element the redirect came from is still closed
    assert(output.html() == "<div></div>");

    auto body = run(rt, "<q:set name=\"n\" value=\"{2}\"/><q:flash>  Saved {n} items  </q:flash>");
    assert(body.flashes.size() == 1);
    assert(body.flashes[0].type == "info");
    assert(body.flashes[0].message == "Saved 2 items");
    assert(!body.redirected());

    assert(throws<ExecutionError>([&] { run(rt, "<q:redirect url=\"/x\" status=\"200\"/>"); }));
    assert(throws<ExecutionError>([&] { run(rt, "<q:redirect url=\"{empty}\"/>"); }));

    // content rendered as a value cannot redirect
    try {
        run(rt, "<q:flash>\n<q:redirect url=\"/away\"/>text</q:flash>");
        assert(false);
    } catch (const ExecutionError& e) {
        assert(contains(e.what(), "/away"));
        assert(e.location().known());
    }
}

void dump_and_log() {
    ServiceContainer services;
    auto log = std::make_shared<quantum::testing::MemoryLog>();
    services.singleton<quantum::runtime::LogService>(std::shared_ptr<quantum::runtime::LogService>(log));
    ComponentRuntime rt(services);

    auto html = render(rt, R"(<q:component name="Debug">
  <q:set name="user" value="{{a: 1}}"/>
  <q:set name="nested" value="{{a: {b: 1}}}"/>
  <q:dump var="user" label="User"/>
  <q:dump var="nested" depth="1" format="text"/>
  <q:dump var="user" when="false"/>
  <q:log level="warning" message="Low stock {user.a}" context="{{sku: 'A1'}}" correlationId="req-1"/>
  <q:log message="skipped" when="user.a gt 5"/>
</q:component>)");
    assert(contains(html, "<pre class=\"q-dump\"><strong>User</strong>\n{\n  &quot;a&quot;: 1\n}</pre>"));
    assert(contains(html, "<strong>nested</strong>\n{&quot;a&quot;:&quot;{...}&quot;}</pre>"));
    assert(html.find("q-dump") != html.rfind("q-dump"));
    assert(html.find("q-dump", html.find("q-dump") + 1) == html.rfind("q-dump"));

    assert(log->lines.size() == 1);
    assert(log->lines[0] == "warning:Low stock 1#req-1 {\"sku\":\"A1\"}");
}

void errors_carry_locations() {
    ServiceContainer services;
    ComponentRuntime rt(services);
    try {
        render(rt, "<q:component name=\"Broken\">\n  <p>ok</p>\n  <p>{1 / 0}</p>\n</q:component>");
        assert(false);
    } catch (const EvaluationError& e) {
        assert(e.location().file == "test.q");
        assert(e.location().line == 3);
    }
    assert(throws<ExecutionError>([&] { render(rt, "<Missing/>"); }));
    assert(throws<ExecutionError>([&] { rt.execute_component(nullptr, Value::object()); }));
}

} // namespace

int main()
{
    range_loop_accumulates();
    integer_limits_in_loops_and_sets();
    inline_text_keeps_document_order();
    array_list_and_query_loops();
    conditional_branches();
    set_operations();
    set_validation();
    set_targets_shared_scopes();
    markup_attributes_and_escaping();
    functions_and_returns();
    recursion_is_bounded();
    execution_budgets();
    redirect_and_flash();
    dump_and_log();
    errors_carry_locations();
    return 0;
}
