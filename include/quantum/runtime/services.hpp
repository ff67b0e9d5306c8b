#pragma once

#include <quantum/runtime/value.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Collaborators the runtime calls out to. Implementations live with the
// host; the runtime only sees these interfaces through the ServiceContainer.
namespace quantum::runtime {

struct RowSet {
    std::vector<std::string> columns;
    Value rows = Value::array(); // array of objects keyed by column
};

class DataSource {
public:
    virtual ~DataSource() = default;
    // `params` maps placeholder names (without the colon) to bound values.
    virtual RowSet execute(const std::string& sql, const Value& params) = 0;
};

struct Message {
    Value body;
    std::map<std::string, std::string> headers;
};

struct Delivery {
    std::string delivery_tag;
    std::string queue;
    Message message;
};

class MessageTransport {
public:
    using Handler = std::function<void(const Delivery&)>;

    virtual ~MessageTransport() = default;
    // Both return the transport's message id.
    virtual std::string publish(const std::string& topic, const Message& message) = 0;
    virtual std::string send(const std::string& queue, const Message& message) = 0;
    virtual void subscribe(const std::string& queue, Handler handler) = 0;
    virtual void ack(const std::string& delivery_tag) = 0;
    virtual void nack(const std::string& delivery_tag, bool requeue) = 0;
};

struct ModelConfig {
    std::string model;
    std::string endpoint;
    std::string system;
    std::optional<double> temperature;
    std::optional<int> max_tokens;
    std::string response_format = "text";
};

struct ToolParameter {
    std::string name;
    std::string type = "string";
    bool required = false;
    std::string description;
};

struct AgentTool {
    std::string name;
    std::string description;
    std::vector<ToolParameter> params;
};

struct AgentAction {
    std::string tool;
    Value args;
    Value result;
};

struct AgentResult {
    std::string result;
    std::vector<AgentAction> actions;
    int iterations = 0;
};

// Runs one tool of the agent against the component that declared it.
using ToolInvoker = std::function<Value(const std::string& tool, const Value& args)>;

class LlmService {
public:
    virtual ~LlmService() = default;
    virtual std::string generate(const std::string& prompt, const ModelConfig& config) = 0;
    virtual AgentResult run_agent(const std::string& instruction,
                                  const std::vector<AgentTool>& tools,
                                  const std::string& task,
                                  const ModelConfig& config,
                                  int max_iterations,
                                  const ToolInvoker& invoke) = 0;
};

struct MailMessage {
    std::string to;
    std::string from;
    std::string cc;
    std::string bcc;
    std::string reply_to;
    std::string subject;
    std::string body;
    std::string type = "html";
    std::string charset = "UTF-8";
};

class MailService {
public:
    virtual ~MailService() = default;
    virtual void send(const MailMessage& message) = 0;
};

class FileService {
public:
    virtual ~FileService() = default;
    virtual std::string read(const std::string& path) = 0;
    virtual void write(const std::string& path, const std::string& content) = 0;
    virtual void append(const std::string& path, const std::string& content) = 0;
    virtual bool remove(const std::string& path) = 0;
    virtual bool exists(const std::string& path) = 0;
};

// Files below a root directory. Paths escaping the root are rejected.
class LocalFileService : public FileService {
public:
    explicit LocalFileService(std::filesystem::path root);

    std::string read(const std::string& path) override;
    void write(const std::string& path, const std::string& content) override;
    void append(const std::string& path, const std::string& content) override;
    bool remove(const std::string& path) override;
    bool exists(const std::string& path) override;

private:
    std::filesystem::path resolve(const std::string& path) const;

    std::filesystem::path root_;
};

class LogService {
public:
    virtual ~LogService() = default;
    virtual void log(const std::string& level, const std::string& message, const Value& context,
                     const std::string& correlation_id) = 0;
};

// Writes q:log lines through core::Logger on the "app" channel.
class ConsoleLogService : public LogService {
public:
    void log(const std::string& level, const std::string& message, const Value& context,
             const std::string& correlation_id) override;
};

} // namespace quantum::runtime
