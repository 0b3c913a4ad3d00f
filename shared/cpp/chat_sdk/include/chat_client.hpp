#pragma once
#include "http.hpp"
#include <functional>
#include <string>
#include <variant>

class CancelToken;

struct ChatClientConfig {
    std::string model{"devstral-small-2507-mlx"};
    std::string api_key; // optional; local servers usually need none
    std::string system_prompt;
    std::string user_agent{"aireview/1.0"};
    int max_tokens{2048};
    double temperature{0.1};
    long timeout_ms{30000};
};

enum class ChatErrorKind {
    Transport,   // no HTTP status obtained
    Status,      // non-2xx status
    Decode,      // 2xx body not in the expected shape
    Application, // 2xx body carrying an "error" field
    EmptyResult  // 2xx body with no choices
};

const char* to_string(ChatErrorKind kind);

struct ChatError {
    ChatErrorKind kind{ChatErrorKind::Transport};
    std::string message;
    long status{0};
    bool retryable{false};
    bool cancelled{false};
};

struct ChatReply {
    std::string content;
};

using ChatResult = std::variant<ChatReply, ChatError>;

using HttpPoster = std::function<HttpResponse(const HttpRequest&, const CancelToken&)>;

// Default instruction sent as the system turn of every review request.
std::string default_review_prompt();

std::string build_chat_request(const ChatClientConfig& cfg, const std::string& user_content);
ChatResult classify_chat_response(long status, const std::string& body, const std::string& model);

// One request/response cycle against one chat-completion endpoint. Never retries.
class ChatClient {
public:
    explicit ChatClient(ChatClientConfig cfg, HttpPoster poster = http_post);

    ChatResult complete(const std::string& endpoint, const std::string& user_content,
                        const CancelToken& cancel) const;

    const ChatClientConfig& config() const { return cfg_; }

private:
    ChatClientConfig cfg_;
    HttpPoster poster_;
};
