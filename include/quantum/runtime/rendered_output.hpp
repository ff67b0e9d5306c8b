#pragma once

#include <quantum/runtime/value.hpp>

#include <optional>
#include <string>
#include <vector>

namespace quantum::runtime {

struct FlashMessage {
    std::string type = "info";
    std::string message;
};

struct RedirectTarget {
    std::string url;
    int status = 302;
};

// What one component execution hands back to its host.
struct RenderedOutput {
    std::vector<std::string> fragments;
    std::vector<FlashMessage> flashes;
    std::optional<RedirectTarget> redirect;
    int status = 200;
    Value return_value;

    std::string html() const
    {
        std::string out;
        for (const auto& fragment : fragments) out += fragment;
        return out;
    }

    bool redirected() const { return redirect.has_value(); }
};

} // namespace quantum::runtime
