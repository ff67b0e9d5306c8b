#include <quantum/runtime/execution_context.hpp>
#include <quantum/core/errors.hpp>

#include <utility>

namespace quantum::runtime {

ExecutionContext::ExecutionContext(SharedScopePtr application, SharedScopePtr session, Value request)
    : application_(application ? std::move(application) : std::make_shared<SharedScope>()),
      session_(session ? std::move(session) : std::make_shared<SharedScope>()),
      request_(request.is_object() ? std::move(request) : Value::object())
{
}

ExecutionContext::Target ExecutionContext::target_of(const std::vector<std::string>& path)
{
    if (path.size() < 2) return Target::Local;
    if (path[0] == "application") return Target::Application;
    if (path[0] == "session") return Target::Session;
    if (path[0] == "request") return Target::Request;
    return Target::Local;
}

std::vector<const ExecutionContext::Frame*> ExecutionContext::visible_frames() const
{
    std::vector<const Frame*> out;
    std::size_t i = frames_.size();
    while (i > 0) {
        const Frame& frame = frames_[--i];
        out.push_back(&frame);
        if (frame.kind == FrameKind::Component) return out;
        if (frame.kind == FrameKind::Function) break;
    }
    // a function body still sees its component's frame
    while (i > 0) {
        const Frame& frame = frames_[--i];
        if (frame.kind == FrameKind::Component) {
            out.push_back(&frame);
            break;
        }
    }
    return out;
}

ExecutionContext::Frame* ExecutionContext::find_binding(const std::string& root)
{
    for (const Frame* frame : visible_frames()) {
        if (frame->vars.contains(root)) return const_cast<Frame*>(frame);
    }
    return nullptr;
}

std::optional<Value> ExecutionContext::resolve(const std::string& name) const
{
    auto path = split_path(name);
    switch (target_of(path)) {
        case Target::Application: return application_->get(name.substr(path[0].size() + 1));
        case Target::Session: return session_->get(name.substr(path[0].size() + 1));
        case Target::Request: return read_path(request_, path, 1);
        case Target::Local: break;
    }

    for (const Frame* frame : visible_frames()) {
        auto it = frame->vars.find(path[0]);
        if (it != frame->vars.end()) return read_path(*it, path, 1);
    }
    auto it = request_.find(path[0]);
    if (it != request_.end()) return read_path(*it, path, 1);
    return std::nullopt;
}

void ExecutionContext::assign(const std::string& name, Value value)
{
    auto path = split_path(name);
    switch (target_of(path)) {
        case Target::Application:
            application_->set(name.substr(path[0].size() + 1), std::move(value));
            return;
        case Target::Session:
            session_->set(name.substr(path[0].size() + 1), std::move(value));
            return;
        case Target::Request:
            write_path(request_, path, std::move(value), 1);
            return;
        case Target::Local: break;
    }

    if (Frame* frame = find_binding(path[0])) {
        write_path(frame->vars, path, std::move(value));
        return;
    }
    if (frames_.empty()) {
        write_path(request_, path, std::move(value));
        return;
    }
    write_path(frames_.back().vars, path, std::move(value));
}

void ExecutionContext::declare(const std::string& name, Value value)
{
    if (frames_.empty()) {
        request_[name] = std::move(value);
        return;
    }
    frames_.back().vars[name] = std::move(value);
}

bool ExecutionContext::remove(const std::string& name)
{
    auto path = split_path(name);
    switch (target_of(path)) {
        case Target::Application: return application_->erase(name.substr(path[0].size() + 1));
        case Target::Session: return session_->erase(name.substr(path[0].size() + 1));
        case Target::Request:
            if (path.size() == 2) return request_.erase(path[1]) > 0;
            break;
        case Target::Local:
            if (path.size() == 1) {
                if (Frame* frame = find_binding(path[0])) return frame->vars.erase(path[0]) > 0;
                return request_.erase(path[0]) > 0;
            }
            break;
    }
    throw core::ExecutionError("Cannot remove nested path '" + name + "'");
}

void ExecutionContext::push_frame(FrameKind kind)
{
    frames_.push_back(Frame{kind, Value::object()});
}

void ExecutionContext::pop_frame()
{
    if (!frames_.empty()) frames_.pop_back();
}

std::optional<Value> ExecutionContext::call_function(const std::string& name, const std::vector<Value>& args)
{
    if (!functions_) return std::nullopt;
    return functions_(name, args);
}

} // namespace quantum::runtime
