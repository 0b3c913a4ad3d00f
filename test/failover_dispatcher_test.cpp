#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "../services/dispatch/include/failover_dispatcher.hpp"
#include "../shared/cpp/chat_sdk/include/cancel_token.hpp"

using ::testing::_;
using ::testing::InSequence;
using ::testing::Return;

namespace {
class MockReviewClient : public ReviewClient {
public:
    MOCK_METHOD(ChatResult, attempt, (const std::string& endpoint, const ReviewUnit& unit, const CancelToken& cancel),
                (override));
};

ChatResult fail(const std::string& msg, ChatErrorKind kind = ChatErrorKind::Status) {
    ChatError e;
    e.kind = kind;
    e.message = msg;
    return e;
}

ChatResult ok(const std::string& text) { return ChatReply{text}; }
}

class FailoverDispatcherTest : public ::testing::Test {
protected:
    ReviewUnit unit_{"main.go", 12, "package main"};
    CancelToken cancel_;
    MockReviewClient client_;
};

TEST_F(FailoverDispatcherTest, NoEndpointsFailsWithoutAttempt) {
    EndpointPool pool({}, "");
    FailoverDispatcher d(pool, client_);
    EXPECT_CALL(client_, attempt(_, _, _)).Times(0);

    auto out = d.review(unit_, cancel_);
    ASSERT_TRUE(std::holds_alternative<ReviewFailure>(out));
    EXPECT_EQ(std::get<ReviewFailure>(out).kind, FailureKind::NoEndpoints);
    EXPECT_EQ(std::get<ReviewFailure>(out).reason, "no endpoints configured");
}

TEST_F(FailoverDispatcherTest, FirstSuccessShortCircuits) {
    EndpointPool pool({"a", "b", "c"}, "");
    FailoverDispatcher d(pool, client_);
    EXPECT_CALL(client_, attempt("a", _, _)).WillOnce(Return(ok("review")));

    auto out = d.review(unit_, cancel_);
    ASSERT_TRUE(std::holds_alternative<ReviewSuccess>(out));
    EXPECT_EQ(std::get<ReviewSuccess>(out).text, "review");
    EXPECT_EQ(std::get<ReviewSuccess>(out).endpoint, "a");
    EXPECT_EQ(std::get<ReviewSuccess>(out).attempts, 1u);
}

TEST_F(FailoverDispatcherTest, SucceedsOnLastEndpointAfterKAttempts) {
    EndpointPool pool({"a", "b", "c", "d"}, "");
    FailoverDispatcher d(pool, client_);
    {
        InSequence seq;
        EXPECT_CALL(client_, attempt("a", _, _)).WillOnce(Return(fail("e1")));
        EXPECT_CALL(client_, attempt("b", _, _)).WillOnce(Return(fail("e2", ChatErrorKind::Transport)));
        EXPECT_CALL(client_, attempt("c", _, _)).WillOnce(Return(fail("e3", ChatErrorKind::Decode)));
        EXPECT_CALL(client_, attempt("d", _, _)).WillOnce(Return(ok("finally")));
    }

    auto out = d.review(unit_, cancel_);
    ASSERT_TRUE(std::holds_alternative<ReviewSuccess>(out));
    EXPECT_EQ(std::get<ReviewSuccess>(out).text, "finally");
    EXPECT_EQ(std::get<ReviewSuccess>(out).attempts, 4u);
}

TEST_F(FailoverDispatcherTest, ExhaustionListsEveryEndpointInAttemptOrder) {
    EndpointPool pool({"a", "b", "c"}, "");
    pool.next_start_index(); // rotation now starts at "b"
    FailoverDispatcher d(pool, client_);
    {
        InSequence seq;
        EXPECT_CALL(client_, attempt("b", _, _)).WillOnce(Return(fail("rate limited")));
        EXPECT_CALL(client_, attempt("c", _, _)).WillOnce(Return(fail("server down")));
        EXPECT_CALL(client_, attempt("a", _, _)).WillOnce(Return(fail("forbidden")));
    }

    auto out = d.review(unit_, cancel_);
    ASSERT_TRUE(std::holds_alternative<ReviewFailure>(out));
    const auto& f = std::get<ReviewFailure>(out);
    EXPECT_EQ(f.kind, FailureKind::Exhausted);
    EXPECT_EQ(f.reason, "all 3 endpoints failed");
    ASSERT_EQ(f.attempts.size(), 3u);
    EXPECT_EQ(f.attempts[0].endpoint, "b");
    EXPECT_EQ(f.attempts[1].endpoint, "c");
    EXPECT_EQ(f.attempts[2].endpoint, "a");
    EXPECT_EQ(f.attempts[2].error.message, "forbidden");
    EXPECT_EQ(describe(f), "all 3 endpoints failed: b: rate limited; c: server down; a: forbidden");
}

TEST_F(FailoverDispatcherTest, RotationAdvancesOncePerReview) {
    EndpointPool pool({"a", "b"}, "");
    FailoverDispatcher d(pool, client_);
    {
        InSequence seq;
        // first review starts at "a" and fails over to "b"
        EXPECT_CALL(client_, attempt("a", _, _)).WillOnce(Return(fail("busy")));
        EXPECT_CALL(client_, attempt("b", _, _)).WillOnce(Return(ok("r1")));
        // second review starts at "b" even though two endpoints were used before
        EXPECT_CALL(client_, attempt("b", _, _)).WillOnce(Return(ok("r2")));
    }
    d.review(unit_, cancel_);
    d.review(unit_, cancel_);
    EXPECT_EQ(pool.ticks(), 2u);
}

TEST_F(FailoverDispatcherTest, DuplicateEndpointsAreTriedEachTime) {
    EndpointPool pool({"a", "a"}, "");
    FailoverDispatcher d(pool, client_);
    EXPECT_CALL(client_, attempt("a", _, _)).Times(2).WillRepeatedly(Return(fail("nope")));

    auto out = d.review(unit_, cancel_);
    ASSERT_TRUE(std::holds_alternative<ReviewFailure>(out));
    EXPECT_EQ(std::get<ReviewFailure>(out).attempts.size(), 2u);
}

TEST_F(FailoverDispatcherTest, CancelledBeforeStartMakesNoCall) {
    EndpointPool pool({"a", "b"}, "");
    FailoverDispatcher d(pool, client_);
    cancel_.cancel();
    EXPECT_CALL(client_, attempt(_, _, _)).Times(0);

    auto out = d.review(unit_, cancel_);
    ASSERT_TRUE(std::holds_alternative<ReviewFailure>(out));
    EXPECT_EQ(std::get<ReviewFailure>(out).kind, FailureKind::Cancelled);
}

TEST_F(FailoverDispatcherTest, CancelledAttemptStopsFailover) {
    EndpointPool pool({"a", "b"}, "");
    FailoverDispatcher d(pool, client_);
    ChatError aborted;
    aborted.kind = ChatErrorKind::Transport;
    aborted.message = "request cancelled";
    aborted.cancelled = true;
    EXPECT_CALL(client_, attempt("a", _, _)).WillOnce(Return(ChatResult{aborted}));
    EXPECT_CALL(client_, attempt("b", _, _)).Times(0);

    auto out = d.review(unit_, cancel_);
    ASSERT_TRUE(std::holds_alternative<ReviewFailure>(out));
    const auto& f = std::get<ReviewFailure>(out);
    EXPECT_EQ(f.kind, FailureKind::Cancelled);
    ASSERT_EQ(f.attempts.size(), 1u);
    EXPECT_EQ(f.attempts[0].endpoint, "a");
}
