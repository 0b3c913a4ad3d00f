#include "../include/review_client.hpp"
#include <utility>

ChatReviewClient::ChatReviewClient(ChatClient client) : client_(std::move(client)) {}

ChatResult ChatReviewClient::attempt(const std::string& endpoint, const ReviewUnit& unit,
                                     const CancelToken& cancel) {
    return client_.complete(endpoint, unit.content, cancel);
}
