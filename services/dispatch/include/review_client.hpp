#pragma once
#include "review_unit.hpp"
#include "../../../shared/cpp/chat_sdk/include/chat_client.hpp"
#include <string>

class CancelToken;

// One attempt against one endpoint. Implementations must not retry.
class ReviewClient {
public:
    virtual ~ReviewClient() = default;
    virtual ChatResult attempt(const std::string& endpoint, const ReviewUnit& unit,
                               const CancelToken& cancel) = 0;
};

class ChatReviewClient : public ReviewClient {
public:
    explicit ChatReviewClient(ChatClient client);

    ChatResult attempt(const std::string& endpoint, const ReviewUnit& unit,
                       const CancelToken& cancel) override;

private:
    ChatClient client_;
};
