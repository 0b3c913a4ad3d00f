#include "../include/chat_client.hpp"
#include "../include/cancel_token.hpp"
#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::json;

namespace {
ChatError status_error(long status, const std::string& model) {
    ChatError e;
    e.kind = ChatErrorKind::Status;
    e.status = status;
    e.retryable = true;
    switch (status) {
    case 400:
        e.message = "bad request (400): malformed request or unsupported model '" + model + "'";
        break;
    case 401:
        e.message = "authentication failed (401): check your API key";
        break;
    case 403:
        e.message = "access forbidden (403): insufficient permissions or invalid API key";
        break;
    case 404:
        e.message = "model not found (404): check if model '" + model + "' exists and you have access to it";
        break;
    case 429:
        e.message = "rate limit exceeded (429): too many requests, please wait and try again";
        break;
    default:
        if (status >= 500 && status < 600) {
            e.message = "server error (" + std::to_string(status) + "): API service temporarily unavailable";
        } else {
            e.message = "API returned status " + std::to_string(status);
        }
    }
    return e;
}

ChatError error_of(ChatErrorKind kind, std::string message, long status) {
    ChatError e;
    e.kind = kind;
    e.message = std::move(message);
    e.status = status;
    return e;
}

std::string api_error_message(const json& err) {
    if (err.is_string()) return err.get<std::string>();
    if (err.is_object()) {
        auto it = err.find("message");
        if (it != err.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
            return it->get<std::string>();
        }
    }
    return err.dump();
}
}

const char* to_string(ChatErrorKind kind) {
    switch (kind) {
    case ChatErrorKind::Transport: return "transport";
    case ChatErrorKind::Status: return "status";
    case ChatErrorKind::Decode: return "decode";
    case ChatErrorKind::Application: return "application";
    case ChatErrorKind::EmptyResult: return "empty result";
    }
    return "unknown";
}

std::string default_review_prompt() {
    return "You are a very experienced senior developer. Analyze the following code and provide recommendations on:\n"
           "- Security vulnerabilities and best practices\n"
           "- Performance optimizations and efficiency improvements\n"
           "- Code correctness and potential bugs\n"
           "- Code readability and maintainability\n"
           "- Clean architecture principles\n"
           "- Language-specific best practices\n"
           "\n"
           "Provide only actionable, specific, and important recommendations. Be concise and focus on real issues.";
}

std::string build_chat_request(const ChatClientConfig& cfg, const std::string& user_content) {
    const std::string& sys = cfg.system_prompt.empty() ? default_review_prompt() : cfg.system_prompt;
    json body = {
        {"model", cfg.model},
        {"messages", json::array({
            json{{"role", "system"}, {"content", sys}},
            json{{"role", "user"}, {"content", user_content}}
        })},
        {"max_tokens", cfg.max_tokens},
        {"temperature", cfg.temperature},
        {"stream", false}
    };
    // Source files are not guaranteed to be valid UTF-8.
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

ChatResult classify_chat_response(long status, const std::string& body, const std::string& model) {
    if (status < 200 || status >= 300) return status_error(status, model);

    json data;
    try {
        data = json::parse(body);
    } catch (const json::parse_error& e) {
        return error_of(ChatErrorKind::Decode, std::string("failed to decode response: ") + e.what(), status);
    }
    if (!data.is_object()) {
        return error_of(ChatErrorKind::Decode, "failed to decode response: expected a JSON object", status);
    }

    auto err = data.find("error");
    if (err != data.end() && !err->is_null()) {
        return error_of(ChatErrorKind::Application, "API error: " + api_error_message(*err), status);
    }

    auto choices = data.find("choices");
    if (choices == data.end() || choices->is_null()) {
        return error_of(ChatErrorKind::EmptyResult, "no review choices returned", status);
    }
    if (!choices->is_array()) {
        return error_of(ChatErrorKind::Decode, "failed to decode response: \"choices\" is not an array", status);
    }
    if (choices->empty()) {
        return error_of(ChatErrorKind::EmptyResult, "no review choices returned", status);
    }

    const json& first = choices->front();
    if (!first.is_object() || !first.contains("message") || !first["message"].is_object()) {
        return error_of(ChatErrorKind::Decode, "failed to decode response: choice has no message", status);
    }
    const json& message = first["message"];
    auto content = message.find("content");
    if (content == message.end() || content->is_null()) return ChatReply{};
    if (!content->is_string()) {
        return error_of(ChatErrorKind::Decode, "failed to decode response: message content is not a string", status);
    }
    return ChatReply{content->get<std::string>()};
}

ChatClient::ChatClient(ChatClientConfig cfg, HttpPoster poster)
    : cfg_(std::move(cfg)), poster_(std::move(poster)) {
    if (!poster_) poster_ = http_post;
}

ChatResult ChatClient::complete(const std::string& endpoint, const std::string& user_content,
                                const CancelToken& cancel) const {
    HttpRequest req;
    req.url = endpoint;
    req.body = build_chat_request(cfg_, user_content);
    req.timeout_ms = cfg_.timeout_ms;
    req.headers.push_back("User-Agent: " + cfg_.user_agent);
    if (!cfg_.api_key.empty()) req.headers.push_back("Authorization: Bearer " + cfg_.api_key);

    HttpResponse resp;
    try {
        resp = poster_(req, cancel);
    } catch (const TransportError& e) {
        ChatError err = error_of(ChatErrorKind::Transport, e.what(), 0);
        err.retryable = true;
        err.cancelled = e.cancelled();
        return err;
    }
    return classify_chat_response(resp.status, resp.body, cfg_.model);
}
