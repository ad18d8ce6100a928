#include "rspd/async-context.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "rspd/errors.hpp"
#include "rspd/request-context.hpp"
#include "rspd/request-parser.hpp"

namespace rspd {

class AsyncContextTest : public ::testing::Test {
 protected:
  void TearDown() override { completionQueue->close(); }

  std::shared_ptr<RequestContext> makeBoundRequest(std::string_view raw) {
    auto res = ParseRequest(raw, 4096, 4096);
    if (res.status != RequestParseResult::Status::Complete) {
      throw std::invalid_argument("test request does not parse");
    }
    res.request->bindWorker(42, nullptr, completionQueue);
    return res.request;
  }

  std::shared_ptr<AsyncCompletionQueue> completionQueue = std::make_shared<AsyncCompletionQueue>();
};

TEST_F(AsyncContextTest, CompleteHandsContextBackOnce) {
  auto req = makeBoundRequest("GET /async HTTP/1.1\r\n\r\n");
  AsyncContext async = req->startAsync();
  RequestContext* raw = req.get();
  req.reset();

  std::jthread producer([async]() mutable {
    async.request().write("done");
    EXPECT_TRUE(async.complete());
  });
  producer.join();

  EXPECT_TRUE(async.isCompleted());
  EXPECT_FALSE(async.complete());

  std::vector<std::shared_ptr<RequestContext>> completed;
  completionQueue->drainTo(completed);
  ASSERT_EQ(completed.size(), 1U);
  EXPECT_EQ(completed.front().get(), raw);
  EXPECT_EQ(completed.front()->responseBody(), "done");
  EXPECT_EQ(completed.front()->connectionFd(), 42);
}

TEST_F(AsyncContextTest, RequestAccessAfterCompleteThrows) {
  auto req = makeBoundRequest("GET /async HTTP/1.1\r\n\r\n");
  AsyncContext async = req->startAsync();
  EXPECT_EQ(&async.request(), req.get());
  EXPECT_TRUE(async.complete());
  EXPECT_THROW(static_cast<void>(async.request()), ProtocolMisuse);
}

TEST_F(AsyncContextTest, CopiesShareTheOneShotState) {
  auto req = makeBoundRequest("GET /async HTTP/1.1\r\n\r\n");
  AsyncContext first = req->startAsync();
  AsyncContext second = first;
  EXPECT_TRUE(second.complete());
  EXPECT_TRUE(first.isCompleted());
  EXPECT_FALSE(first.complete());

  std::vector<std::shared_ptr<RequestContext>> completed;
  completionQueue->drainTo(completed);
  EXPECT_EQ(completed.size(), 1U);
}

TEST_F(AsyncContextTest, CompleteAfterOwnerStoppedReturnsFalse) {
  auto req = makeBoundRequest("GET /late HTTP/1.1\r\n\r\n");
  AsyncContext async = req->startAsync();
  completionQueue->close();
  EXPECT_TRUE(completionQueue->isClosed());
  EXPECT_FALSE(async.complete());
  EXPECT_TRUE(async.isCompleted());
}

TEST_F(AsyncContextTest, FlushWhileDetachedPostsOutputBeforeCompletion) {
  auto req = makeBoundRequest("GET /async HTTP/1.1\r\n\r\n");
  AsyncContext async = req->startAsync();
  async.request().write("early");
  async.request().flush();

  std::vector<std::shared_ptr<RequestContext>> posted;
  completionQueue->drainTo(posted);
  ASSERT_EQ(posted.size(), 1U);
  EXPECT_FALSE(posted.front()->isAsyncCompleted());
  std::string sent;
  posted.front()->takeFlushedOutput(sent);
  EXPECT_TRUE(sent.ends_with("\r\n\r\n5\r\nearly\r\n"));

  async.request().write("late");
  EXPECT_TRUE(async.complete());
  posted.clear();
  completionQueue->drainTo(posted);
  ASSERT_EQ(posted.size(), 1U);
  EXPECT_TRUE(posted.front()->isAsyncCompleted());
  EXPECT_EQ(posted.front()->responseBody(), "late");
  EXPECT_THROW(req->flush(), ProtocolMisuse);
}

}  // namespace rspd
