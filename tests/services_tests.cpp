#include "test_support.hpp"

#include <fstream>
#include <sstream>

using quantum::core::ExecutionError;
using quantum::core::ParamError;
using quantum::core::ServiceContainer;
using quantum::runtime::ComponentRuntime;
using quantum::runtime::LocalFileService;
using quantum::runtime::Message;
using quantum::runtime::MessageConsumer;
using quantum::runtime::Scopes;
using quantum::runtime::SharedScope;
using quantum::runtime::Value;
using quantum::testing::MemoryMail;
using quantum::testing::MemoryTransport;
using quantum::testing::RecordingDataSource;
using quantum::testing::ScriptedLlm;
using quantum::testing::TempDir;
using quantum::testing::contains;
using quantum::testing::render;
using quantum::testing::throws;

namespace rt_ns = quantum::runtime;

namespace {

std::string slurp(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

void queries_bind_parameters() {
    ServiceContainer services;
    auto source = std::make_shared<RecordingDataSource>();
    source->result.columns = {"name"};
    source->result.rows = Value::array({Value{{"name", "Ada"}}, Value{{"name", "Alan"}}});
    services.add_datasource("main", source);
    ComponentRuntime rt(services);

    auto html = render(rt, R"(<q:component name="Users">
  <q:param name="minAge" default="18"/>
  <q:query name="users" datasource="main">
    SELECT name FROM users WHERE age >= :minAge AND name = :name
    <q:param name="minAge" value="{minAge}" type="cf_sql_integer"/>
    <q:param name="name" value="{missing}" type="varchar" null="{true}"/>
  </q:query>
  <q:loop query="users">{name};</q:loop>
  <p>{users_meta.recordCount} {users_meta.columns[0]}</p>
</q:component>)");
    assert(html == "Ada;Alan;<p>2 name</p>");

    assert(source->calls.size() == 1);
    assert(source->calls[0].first == "SELECT name FROM users WHERE age >= :minAge AND name = :name");
    const auto& params = source->calls[0].second;
    assert(params["minAge"] == 18);
    assert(params["minAge"].is_number_integer());
    assert(params["name"].is_null());
}

void query_parameter_errors() {
    ServiceContainer services;
    auto source = std::make_shared<RecordingDataSource>();
    services.add_datasource("main", source);
    ComponentRuntime rt(services);

    auto query = [&](const std::string& param) {
        return render(rt, "<q:query name=\"q\" datasource=\"main\">SELECT :p" + param + "</q:query>");
    };

    try {
        query("<q:param name=\"p\" value=\"abc\" type=\"integer\"/>");
        assert(false);
    } catch (const ParamError& e) {
        assert(e.parameter() == "p");
        assert(e.location().known());
    }
    assert(throws<ParamError>([&] { query("<q:param name=\"p\" value=\"x\" type=\"blob\"/>"); }));
    assert(throws<ParamError>([&] { query("<q:param name=\"p\" value=\"abcd\" maxLength=\"3\"/>"); }));
    assert(source->calls.empty());

    query("<q:param name=\"p\" value=\"{3.14159}\" type=\"decimal\" scale=\"2\"/>");
    assert(source->calls.back().second["p"] == 3.14);

    assert(throws<ExecutionError>([&] {
        render(rt, "<q:query name=\"q\" datasource=\"other\">SELECT 1</q:query>");
    }));
}

void messages_publish_and_send() {
    ServiceContainer services;
    auto transport = std::make_shared<MemoryTransport>();
    services.singleton<rt_ns::MessageTransport>(std::shared_ptr<rt_ns::MessageTransport>(transport));
    ComponentRuntime rt(services);

    auto html = render(rt, R"(<q:component name="Orders">
  <q:set name="order" value="{{sku: 'A1', qty: 2}}"/>
  <q:message name="receipt" topic="orders.created">{json(order)}</q:message>
  <q:message type="send" queue="jobs">
    <q:header name="x-sku" value="{order.sku}"/>
    <q:body>resize {order.sku}</q:body>
  </q:message>
  <p>{receipt.id} {receipt.status} {receipt.topic}</p>
</q:component>)");
    assert(html == "<p>msg-1 published orders.created</p>");

    assert(transport->published.size() == 1);
    assert(transport->published[0].first == "orders.created");
    const auto& body = transport->published[0].second.body;
    assert(body.is_object());
    assert(body["qty"] == 2);

    assert(transport->sent.size() == 1);
    assert(transport->sent[0].first == "jobs");
    assert(transport->sent[0].second.body == "resize A1");
    assert(transport->sent[0].second.headers.at("x-sku") == "A1");

    ServiceContainer empty;
    ComponentRuntime bare(empty);
    assert(throws<ExecutionError>([&] { render(bare, "<q:message topic=\"t\">x</q:message>"); }));
}

void consumer_acks_and_nacks() {
    ServiceContainer services;
    ComponentRuntime rt(services);
    MemoryTransport transport;
    MessageConsumer consumer(rt, transport);

    auto application = std::make_shared<SharedScope>();
    auto unit = rt.parse_source(R"(<q:component name="OrderHandler">
  <q:param name="message" type="object"/>
  <q:set name="application.units" operation="add" value="{message.qty}"/>
  <q:set name="application.lastTag" value="{request.deliveryTag}"/>
  <q:set name="application.source" value="{headers.origin}"/>
</q:component>)", "order_handler.q");
    consumer.consume("orders", unit, Scopes{application, nullptr});
    assert(transport.handlers.count("orders") == 1);

    transport.deliver("orders", "tag-1", Message{Value{{"qty", 3}}, {{"origin", "web"}}});
    transport.deliver("orders", "tag-2", Message{Value{{"qty", 4}}, {{"origin", "api"}}});
    transport.deliver("orders", "tag-3", Message{Value("not an order"), {}});

    assert(application->get("units").value() == 7);
    assert(application->get("lastTag").value() == "tag-2");
    assert(application->get("source").value() == "api");
    assert(consumer.processed() == 2);
    assert(consumer.failed() == 1);
    assert(transport.acked == std::vector<std::string>({"tag-1", "tag-2"}));
    assert(transport.nacked.size() == 1);
    assert(transport.nacked[0].first == "tag-3");
    assert(!transport.nacked[0].second);

    assert(throws<ExecutionError>([&] { consumer.consume("other", nullptr); }));
}

void llm_generation() {
    ServiceContainer services;
    auto llm = std::make_shared<ScriptedLlm>();
    llm->reply = R"({"ok": true, "tags": ["a"]})";
    services.singleton<rt_ns::LlmService>(std::shared_ptr<rt_ns::LlmService>(llm));
    ComponentRuntime rt(services);

    auto html = render(rt, R"(<q:component name="Summary">
  <q:set name="topic" value="cats"/>
  <q:llm name="summary" model="gpt-x" temperature="0.2" maxTokens="{64}" responseFormat="json">Summarize {topic} &amp; more</q:llm>
  <p>{summary.ok} {summary.tags[0]}</p>
</q:component>)");
    assert(html == "<p>true a</p>");
    assert(llm->prompts.back() == "Summarize cats & more");
    const auto& config = llm->configs.back();
    assert(config.model == "gpt-x");
    assert(config.temperature.value() == 0.2);
    assert(config.max_tokens.value() == 64);
    assert(config.response_format == "json");

    llm->reply = "plain words";
    assert(render(rt, "<q:llm name=\"r\" prompt=\"Say something\"/><b>{r}</b>") == "<b>plain words</b>");
    assert(llm->prompts.back() == "Say something");

    assert(throws<ExecutionError>([&] { render(rt, "<q:llm name=\"r\" responseFormat=\"json\">go</q:llm>"); }));
    assert(throws<ExecutionError>([&] { render(rt, "<q:llm name=\"r\" temperature=\"warm\">go</q:llm>"); }));

    ServiceContainer empty;
    ComponentRuntime bare(empty);
    assert(throws<ExecutionError>([&] { render(bare, "<q:llm name=\"r\">go</q:llm>"); }));
}

void agent_tools_run_in_the_component() {
    ServiceContainer services;
    auto llm = std::make_shared<ScriptedLlm>();
    llm->tool_calls = {{"stock", Value{{"sku", "A1"}}}, {"echo", Value{{"text", "hi"}}}};
    services.singleton<rt_ns::LlmService>(std::shared_ptr<rt_ns::LlmService>(llm));
    ComponentRuntime rt(services);

    auto html = render(rt, R"(<q:component name="Helper">
  <q:set name="topic" value="stock"/>
  <q:agent name="helper" model="m" maxIterations="3">
    <q:instruction>You help with {topic}</q:instruction>
    <q:task>Look up A1</q:task>
    <q:tool name="stock" description="Stock level">
      <q:param name="sku" type="string" required="true"/>
      <q:return value="{sku + '-42'}"/>
    </q:tool>
    <q:tool name="echo">
      <q:param name="text"/>
      Echo {text}
    </q:tool>
  </q:agent>
  <p>{helper.result}|{helper.iterations}|{helper.actions[0].result}|{helper.actions[1].args.text}</p>
</q:component>)");
    assert(html == "<p>Echo hi|2|A1-42|hi</p>");
    assert(llm->prompts.back() == "You help with stock|Look up A1");
    assert(llm->offered.size() == 2);
    assert(llm->offered[0].description == "Stock level");
    assert(llm->offered[0].params.size() == 1);
    assert(llm->offered[0].params[0].required);

    llm->tool_calls = {{"missing_tool", Value::object()}};
    assert(throws<ExecutionError>([&] {
        render(rt, "<q:agent name=\"a\"><q:task>t</q:task><q:tool name=\"x\">y</q:tool></q:agent>");
    }));

    llm->tool_calls = {{"stock", Value::object()}};
    assert(throws<ParamError>([&] {
        render(rt, R"(<q:agent name="a"><q:task>t</q:task><q:tool name="stock"><q:param name="sku" required="true"/>y</q:tool></q:agent>)");
    }));
}

void mail_delivery() {
    ServiceContainer services;
    auto mail = std::make_shared<MemoryMail>();
    services.singleton<rt_ns::MailService>(std::shared_ptr<rt_ns::MailService>(mail));
    ComponentRuntime rt(services);

    auto html = render(rt, R"(<q:component name="Welcome">
  <q:param name="email" default="ada@example.com"/>
  <q:param name="name" default="Ada &amp; Co"/>
  <q:mail to="{email}" subject="Welcome {name}" from="noreply@example.com" result="sent">
    <h1>Hi {name}</h1>
  </q:mail>
  <q:mail to="{email}" subject="Plain" type="text">Hello {name}</q:mail>
  <p>{sent}</p>
</q:component>)");
    assert(html == "<p>true</p>");
    assert(mail->sent.size() == 2);
    assert(mail->sent[0].to == "ada@example.com");
    assert(mail->sent[0].subject == "Welcome Ada & Co");
    assert(mail->sent[0].from == "noreply@example.com");
    assert(mail->sent[0].body == "<h1>Hi Ada &amp; Co</h1>");
    assert(mail->sent[1].type == "text");
    assert(mail->sent[1].body == "Hello Ada & Co");

    assert(throws<ExecutionError>([&] { render(rt, "<q:mail to=\" \" subject=\"x\">y</q:mail>"); }));

    ServiceContainer empty;
    ComponentRuntime bare(empty);
    assert(throws<ExecutionError>([&] { render(bare, "<q:mail to=\"a@b.c\" subject=\"x\">y</q:mail>"); }));
}

void file_actions() {
    TempDir dir;
    ServiceContainer services;
    services.singleton<rt_ns::FileService>(std::shared_ptr<rt_ns::FileService>(std::make_shared<LocalFileService>(dir.path())));
    ComponentRuntime rt(services);

    auto html = render(rt, R"(<q:component name="Notes">
  <q:set name="name" value="ada"/>
  <q:file action="write" file="notes/{name}.txt">Hello {name}</q:file>
  <q:file action="append" file="notes/{name}.txt">!</q:file>
  <q:file action="read" file="notes/{name}.txt" variable="content"/>
  <q:file action="exists" file="notes/{name}.txt" variable="before"/>
  <q:file action="delete" file="notes/{name}.txt" variable="removed"/>
  <q:file action="exists" file="notes/{name}.txt" variable="after"/>
  <p>{content}|{before}|{removed}|{after}</p>
</q:component>)");
    assert(html == "<p>Hello ada!|true|true|false</p>");

    render(rt, "<q:file action=\"write\" file=\"kept.txt\">kept</q:file>");
    assert(slurp(dir.path() / "kept.txt") == "kept");

    assert(throws<ExecutionError>([&] { render(rt, "<q:file action=\"write\" file=\"../escape.txt\">x</q:file>"); }));
    assert(throws<ExecutionError>([&] { render(rt, "<q:file action=\"read\" file=\"absent.txt\" variable=\"v\"/>"); }));
}

void local_files_stay_below_the_root() {
    TempDir dir;
    LocalFileService files(dir.path() / "root");
    files.write("a/b.txt", "x");
    assert(files.exists("a/b.txt"));
    assert(files.exists("a/../a/b.txt"));
    assert(files.read("/a/b.txt") == "x");
    assert(throws<ExecutionError>([&] { files.read("../outside.txt"); }));
    assert(throws<ExecutionError>([&] { files.write("a/../../outside.txt", "x"); }));
    assert(!std::filesystem::exists(dir.path() / "outside.txt"));
    assert(files.remove("a/b.txt"));
    assert(!files.remove("a/b.txt"));
}

void default_log_service_writes_through_the_logger() {
    auto& logger = quantum::core::logger();
    std::ostringstream captured;
    logger.set_stream(&captured);
    auto previous = logger.level();
    logger.set_level(quantum::core::LogLevel::Debug);

    ServiceContainer services;
    ComponentRuntime rt(services);
    render(rt, "<q:log level=\"error\" message=\"disk full\" correlationId=\"r1\"/>", Value::object());

    logger.set_stream(nullptr);
    logger.set_level(previous);
    assert(contains(captured.str(), "[Error] [app] [r1] disk full"));
}

} // namespace

int main()
{
    queries_bind_parameters();
    query_parameter_errors();
    messages_publish_and_send();
    consumer_acks_and_nacks();
    llm_generation();
    agent_tools_run_in_the_component();
    mail_delivery();
    file_actions();
    local_files_stay_below_the_root();
    default_log_service_writes_through_the_logger();
    return 0;
}
