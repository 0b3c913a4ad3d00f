#pragma once
#include "endpoint_pool.hpp"
#include "outcome.hpp"
#include "review_client.hpp"

class CancelToken;

// Tries each endpoint at most once per unit, starting from the pool's rotation
// offset and stopping at the first success.
class FailoverDispatcher {
public:
    FailoverDispatcher(EndpointPool& pool, ReviewClient& client);

    ReviewOutcome review(const ReviewUnit& unit, const CancelToken& cancel);

private:
    EndpointPool& pool_;
    ReviewClient& client_;
};
