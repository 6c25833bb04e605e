#include <gtest/gtest.h>
#include "api/FetchError.hpp"
#include "api/Paginator.hpp"
#include "FakeHttpTransport.hpp"

using json = nlohmann::json;

class PaginatorTest : public ::testing::Test {
protected:
    FakeHttpTransport transport;
    Paginator paginator{transport};

    PageRequest request() {
        PageRequest req;
        req.resource = "Test listing";
        req.path     = "/v1/items";
        req.params   = {{"limit", "2"}};
        return req;
    }
};

TEST_F(PaginatorTest, ConcatenatesPagesInCursorOrder) {
    const int pages = 5;
    for (int i = 0; i < pages; i++) {
        bool last = i == pages - 1;
        transport.respondPage("/v1/items", json::array({i * 10, i * 10 + 1}),
                              !last, last ? "" : "cursor-" + std::to_string(i + 1));
    }

    auto items = paginator.fetchAll(request());
    ASSERT_EQ(items.size(), 10u);
    for (int i = 0; i < 10; i++)
        EXPECT_EQ(items[i].get<int>(), (i / 2) * 10 + i % 2);

    auto log = transport.requests();
    ASSERT_EQ(log.size(), static_cast<size_t>(pages));
    EXPECT_EQ(log[0].param("page"), "");
    for (int i = 1; i < pages; i++)
        EXPECT_EQ(log[i].param("page"), "cursor-" + std::to_string(i));
    EXPECT_EQ(log[3].param("limit"), "2");
}

TEST_F(PaginatorTest, StopsAtPageCap) {
    // Every response claims more pages
    transport.respondPage("/v1/items", json::array({1}), true, "again");

    auto items = paginator.fetchAll(request());
    EXPECT_EQ(items.size(), static_cast<size_t>(Paginator::kMaxPages));
    EXPECT_EQ(transport.requestCount("/v1/items"), static_cast<size_t>(Paginator::kMaxPages));
}

TEST_F(PaginatorTest, StopsWhenCursorIsMissing) {
    transport.respondPage("/v1/items", json::array({1, 2}), true);

    auto items = paginator.fetchAll(request());
    EXPECT_EQ(items.size(), 2u);
    EXPECT_EQ(transport.requestCount("/v1/items"), 1u);
}

TEST_F(PaginatorTest, CustomCursorParameter) {
    transport.respondPage("/v1/items", json::array({1}), true, "proj_9");
    transport.respondPage("/v1/items", json::array({2}));

    auto req = request();
    req.cursorParam = "after";
    req.cursorField = "last_id";
    paginator.fetchAll(req);

    auto log = transport.requests();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[1].param("after"), "proj_9");
}

TEST_F(PaginatorTest, FailedPageDiscardsEverything) {
    transport.respondPage("/v1/items", json::array({1}), true, "next");
    transport.respond("/v1/items", 500, std::string(500, 'x'));

    try {
        paginator.fetchAll(request());
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.status(), 500);
        std::string msg = e.what();
        EXPECT_EQ(msg, "Test listing API error 500: " + std::string(kErrorBodyExcerpt, 'x'));
    }
}

TEST_F(PaginatorTest, NoResponseIsTransportError) {
    transport.respond("/v1/items", 0, "request failed: Connection");
    try {
        paginator.fetchAll(request());
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.status(), 0);
        EXPECT_EQ(std::string(e.what()), "Test listing request failed: Connection");
    }
}

TEST_F(PaginatorTest, MalformedBodiesAreDecodeErrors) {
    transport.respond("/v1/items", 200, "not json");
    EXPECT_THROW(paginator.fetchAll(request()), DecodeError);

    FakeHttpTransport other;
    other.respondJson("/v1/items", json{{"has_more", false}});
    Paginator p(other);
    EXPECT_THROW(p.fetchAll(request()), DecodeError);

    FakeHttpTransport array;
    array.respondJson("/v1/items", json::array());
    Paginator q(array);
    EXPECT_THROW(q.fetchOne("Test", "/v1/items", {}, {}), DecodeError);
}
