#include "test_base.hpp"
#include "core/http_server_manager.hpp"
#include "web/route_handlers.hpp"
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace
{
    // Port the kernel hands out for an ephemeral bind, released again before returning
    int freePort()
    {
        int sock = socket(AF_INET, SOCK_STREAM, 0);
        if (sock < 0)
            return 0;
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        int port = 0;
        if (bind(sock, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0 &&
            getsockname(sock, reinterpret_cast<sockaddr *>(&addr), &len) == 0)
        {
            port = ntohs(addr.sin_port);
        }
        close(sock);
        return port;
    }
}

class RouteHandlersTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        store_ = std::make_unique<StateStore>(getTestDbPath());
        ASSERT_TRUE(store_->isOpen());

        share_.mount_path = getShareDir();
        share_.target_folder = "Movies";
        transfer_settings_.max_attempts = 1;
        coordinator_settings_.delete_source_on_reject = false;

        versions_ = std::make_unique<VersionResolver>(VersionDetectionSettings());
        engine_ = std::make_unique<TransferEngine>(transfer_settings_, share_.mount_path, true,
                                                   [](std::chrono::milliseconds) {});
        coordinator_ = std::make_unique<LifecycleCoordinator>(*store_, renamer_, *versions_, *engine_, share_,
                                                              coordinator_settings_, 1);

        RouteHandlers::setupRoutes(server_, *coordinator_);
        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        listener_ = std::thread([this]
                                { server_.listen_after_bind(); });
    }

    void TearDown() override
    {
        server_.stop();
        if (listener_.joinable())
            listener_.join();
        if (coordinator_)
            coordinator_->waitForIdle();
        coordinator_.reset();
        engine_.reset();
        store_.reset();
        TestBase::TearDown();
    }

    int64_t ingest(const std::string &name)
    {
        PendingEntry entry;
        entry.original_path = createFile(name, 2048);
        entry.original_filename = name;
        entry.file_size_bytes = 2048;
        entry.file_metadata = R"({"extension":".mkv"})";
        EXPECT_TRUE(store_->insertPending(entry).first.success);
        auto row = store_->getPendingByPath(entry.original_path);
        return row ? row->id : 0;
    }

    std::unique_ptr<httplib::Client> client() { return std::make_unique<httplib::Client>("127.0.0.1", port_); }

    static json body(const httplib::Result &res) { return json::parse(res->body); }

    std::unique_ptr<StateStore> store_;
    PassthroughRenameResolver renamer_;
    NetworkShareSettings share_;
    TransferSettings transfer_settings_;
    CoordinatorSettings coordinator_settings_;
    std::unique_ptr<VersionResolver> versions_;
    std::unique_ptr<TransferEngine> engine_;
    std::unique_ptr<LifecycleCoordinator> coordinator_;

    httplib::Server server_;
    std::thread listener_;
    int port_ = 0;
};

TEST_F(RouteHandlersTest, StatusCodeMapping)
{
    EXPECT_EQ(RouteHandlers::httpStatusFor(CoordinatorError::NONE), 200);
    EXPECT_EQ(RouteHandlers::httpStatusFor(CoordinatorError::NOT_FOUND), 404);
    EXPECT_EQ(RouteHandlers::httpStatusFor(CoordinatorError::ALREADY_IN_PROGRESS), 409);
    EXPECT_EQ(RouteHandlers::httpStatusFor(CoordinatorError::INVALID_STATE), 409);
    EXPECT_EQ(RouteHandlers::httpStatusFor(CoordinatorError::INTERNAL_ERROR), 500);
}

TEST_F(RouteHandlersTest, RejectedHistoryHasNullDestination)
{
    ProcessedEntry entry;
    entry.id = 3;
    entry.source_entry_id = 9;
    entry.action = ProcessedAction::REJECTED;
    entry.final_filename = "ignored.mkv";
    entry.notes = "bad rip";

    json j = RouteHandlers::processedToJson(entry);
    EXPECT_EQ(j["action"], "rejected");
    EXPECT_TRUE(j["final_filename"].is_null());
    EXPECT_TRUE(j["destination_path"].is_null());
    EXPECT_EQ(j["notes"], "bad rip");
}

TEST_F(RouteHandlersTest, PendingJsonToleratesBadMetadata)
{
    PendingEntry entry;
    entry.id = 1;
    entry.file_metadata = "not json";
    json j = RouteHandlers::pendingToJson(entry);
    EXPECT_TRUE(j["file_metadata"].is_null());
    EXPECT_TRUE(j["error_message"].is_null());
    EXPECT_EQ(j["status"], "pending");
}

TEST_F(RouteHandlersTest, HealthAndStats)
{
    ingest("Heat.1995.mkv");
    auto cli = client();

    auto health = cli->Get("/api/health");
    ASSERT_TRUE(health);
    EXPECT_EQ(health->status, 200);
    EXPECT_EQ(body(health)["status"], "healthy");
    EXPECT_EQ(body(health)["active_transfers"], 0);

    auto stats = cli->Get("/api/stats");
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats->status, 200);
    EXPECT_EQ(body(stats)["data"]["pending_count"], 1);
    EXPECT_EQ(body(stats)["data"]["completed_count"], 0);
}

TEST_F(RouteHandlersTest, PendingListing)
{
    int64_t id = ingest("Heat.1995.mkv");
    auto res = client()->Get("/api/movies/pending");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    json j = body(res);
    EXPECT_EQ(j["status"], "success");
    ASSERT_EQ(j["count"], 1);
    EXPECT_EQ(j["data"][0]["id"], id);
    EXPECT_EQ(j["data"][0]["original_filename"], "Heat.1995.mkv");
    EXPECT_EQ(j["data"][0]["file_metadata"]["extension"], ".mkv");
}

TEST_F(RouteHandlersTest, ApproveIsAcceptedThenCompletes)
{
    int64_t id = ingest("Heat (1995).mkv");
    auto res = client()->Post("/api/movies/" + std::to_string(id) + "/approve", "", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    EXPECT_EQ(body(res)["status"], "accepted");

    coordinator_->waitForIdle();
    EXPECT_TRUE(fs::exists(getShareDir() + "/Movies/Heat (1995).mkv"));

    auto history = client()->Get("/api/movies/history?limit=5");
    ASSERT_TRUE(history);
    json j = body(history);
    ASSERT_EQ(j["count"], 1);
    EXPECT_EQ(j["data"][0]["action"], "approved");
    EXPECT_EQ(j["data"][0]["source_entry_id"], id);
    EXPECT_EQ(j["data"][0]["final_filename"], "Heat (1995).mkv");
}

TEST_F(RouteHandlersTest, UnknownIdIsNotFound)
{
    auto cli = client();
    auto approve = cli->Post("/api/movies/4242/approve", "", "application/json");
    ASSERT_TRUE(approve);
    EXPECT_EQ(approve->status, 404);
    EXPECT_EQ(body(approve)["error"], "NotFound");

    auto reject = cli->Post("/api/movies/4242/reject", "", "application/json");
    ASSERT_TRUE(reject);
    EXPECT_EQ(reject->status, 404);
}

TEST_F(RouteHandlersTest, RejectStoresNotes)
{
    int64_t id = ingest("Sample.mkv");
    auto res = client()->Post("/api/movies/" + std::to_string(id) + "/reject", R"({"notes":"wrong cut"})",
                             "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(body(res)["status"], "success");

    auto history = store_->listProcessed().value;
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].notes, "wrong cut");
    EXPECT_TRUE(fs::exists(getDownloadsDir() + "/Sample.mkv"));

    auto again = client()->Post("/api/movies/" + std::to_string(id) + "/reject", "", "application/json");
    ASSERT_TRUE(again);
    EXPECT_EQ(again->status, 404);
}

TEST_F(RouteHandlersTest, MalformedRequestsAreBadRequests)
{
    int64_t id = ingest("Ronin.mkv");
    auto cli = client();

    auto bad_body = cli->Post("/api/movies/" + std::to_string(id) + "/reject", "[1,2]", "application/json");
    ASSERT_TRUE(bad_body);
    EXPECT_EQ(bad_body->status, 400);
    EXPECT_EQ(store_->listPending().value.size(), 1u);

    auto bad_limit = cli->Get("/api/movies/history?limit=abc");
    ASSERT_TRUE(bad_limit);
    EXPECT_EQ(bad_limit->status, 400);

    auto zero_limit = cli->Get("/api/movies/history?limit=0");
    ASSERT_TRUE(zero_limit);
    EXPECT_EQ(zero_limit->status, 400);

    auto huge_id = cli->Post("/api/movies/99999999999999999999999/approve", "", "application/json");
    ASSERT_TRUE(huge_id);
    EXPECT_EQ(huge_id->status, 400);
}

TEST_F(RouteHandlersTest, ApproveHonoursDeleteSourceOverride)
{
    int64_t id = ingest("Arrival (2016).mkv");
    auto res = client()->Post("/api/movies/" + std::to_string(id) + "/approve", R"({"delete_source":true})",
                             "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);

    coordinator_->waitForIdle();
    EXPECT_TRUE(fs::exists(getShareDir() + "/Movies/Arrival (2016).mkv"));
    EXPECT_FALSE(fs::exists(getDownloadsDir() + "/Arrival (2016).mkv"));
}

TEST_F(RouteHandlersTest, RejectHonoursDeleteSourceOverride)
{
    int64_t id = ingest("Trailer.mkv");
    auto res = client()->Post("/api/movies/" + std::to_string(id) + "/reject",
                             R"({"notes":"trailer","delete_source":true})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_FALSE(fs::exists(getDownloadsDir() + "/Trailer.mkv"));

    auto history = store_->listProcessed().value;
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].notes, "trailer");
}

TEST_F(RouteHandlersTest, DeleteSourceMustBeBoolean)
{
    int64_t id = ingest("Ronin.mkv");
    auto cli = client();

    auto approve = cli->Post("/api/movies/" + std::to_string(id) + "/approve", R"({"delete_source":"yes"})",
                             "application/json");
    ASSERT_TRUE(approve);
    EXPECT_EQ(approve->status, 400);

    auto reject = cli->Post("/api/movies/" + std::to_string(id) + "/reject", R"({"delete_source":1})",
                            "application/json");
    ASSERT_TRUE(reject);
    EXPECT_EQ(reject->status, 400);

    EXPECT_EQ(store_->getPending(id)->status, PendingStatus::PENDING);
    EXPECT_TRUE(fs::exists(getDownloadsDir() + "/Ronin.mkv"));
}

TEST_F(RouteHandlersTest, StoreFailuresAreInternalErrors)
{
    ingest("Heat.1995.mkv");
    ASSERT_TRUE(execSql("ALTER TABLE pending_entries RENAME TO pending_broken"));
    auto cli = client();

    auto pending = cli->Get("/api/movies/pending");
    ASSERT_TRUE(pending);
    EXPECT_EQ(pending->status, 500);
    EXPECT_EQ(body(pending)["error"], "InternalError");

    auto stats = cli->Get("/api/stats");
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats->status, 500);

    auto history = cli->Get("/api/movies/history");
    ASSERT_TRUE(history);
    EXPECT_EQ(history->status, 200);
}

TEST_F(RouteHandlersTest, ServerManagerServesUntilStopped)
{
    int port = freePort();
    ASSERT_GT(port, 0);

    HttpServerManager manager(*coordinator_);
    ASSERT_TRUE(manager.start("127.0.0.1", port));
    EXPECT_TRUE(manager.isRunning());
    EXPECT_EQ(manager.getCurrentPort(), port);

    auto cli = std::make_unique<httplib::Client>("127.0.0.1", port);
    auto res = cli->Get("/api/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    manager.stop();
    EXPECT_FALSE(manager.isRunning());
}
