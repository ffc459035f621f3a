// test_c_api.cpp — Тесты C API реестра: два экземпляра, соединённые через callbacks хоста

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iterator>
#include <fstream>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "innerocket/innerocket_c.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const char* SMALL_CHUNKS_CONFIG = R"({
    "minChunkSize": 4096,
    "defaultChunkSize": 4096,
    "maxChunkSize": 4096,
    "adaptiveChunkSize": false,
    "slowThresholdMBps": 0.000001,
    "fastThresholdMBps": 1000000000.0,
    "progressIntervalMs": 0,
    "logLevel": "warn"
})";

// One side of the host application: owns the "wire" to the other registry
struct Host {
    std::string selfId;
    IRRegistry self = nullptr;

    std::mutex wireMutex;
    IRRegistry peer = nullptr;

    std::mutex eventMutex;
    std::vector<std::pair<int32_t, json>> events;

    void detach() {
        std::lock_guard<std::mutex> lock(wireMutex);
        peer = nullptr;
    }

    std::vector<json> eventsOf(int32_t kind) {
        std::lock_guard<std::mutex> lock(eventMutex);
        std::vector<json> result;
        for (const auto& [k, data] : events) {
            if (k == kind) result.push_back(data);
        }
        return result;
    }
};

int32_t hostSend(const char* peerId, const uint8_t* data, size_t size, void* userData) {
    (void)peerId;
    auto* host = static_cast<Host*>(userData);
    std::lock_guard<std::mutex> lock(host->wireMutex);
    if (!host->peer) return 0;
    ir_deliver_frame(host->peer, host->selfId.c_str(), data, size);
    return 1;
}

int32_t hostConnect(const char* peerId, int32_t connect, void* userData) {
    auto* host = static_cast<Host*>(userData);
    IRRegistry peer;
    {
        std::lock_guard<std::mutex> lock(host->wireMutex);
        peer = host->peer;
    }
    if (!peer) return 0;

    if (connect) {
        ir_peer_connected(peer, host->selfId.c_str(), host->selfId.c_str());
        ir_peer_connected(host->self, peerId, peerId);
    } else {
        ir_peer_disconnected(peer, host->selfId.c_str());
    }
    return 1;
}

void hostEvent(int32_t event, const char* dataJson, void* userData) {
    auto* host = static_cast<Host*>(userData);
    json data = json::parse(dataJson, nullptr, false);
    ir_free_string(const_cast<char*>(dataJson));

    std::lock_guard<std::mutex> lock(host->eventMutex);
    host->events.emplace_back(event, std::move(data));
}

int32_t discardSend(const char*, const uint8_t*, size_t, void*) {
    return 1;
}

bool waitUntil(const std::function<bool()>& condition, int timeoutMs = 10000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

// Takes ownership of a string returned by the library
std::string take(char* str) {
    if (!str) return {};
    std::string result(str);
    ir_free_string(str);
    return result;
}

constexpr int32_t EVENT_PEER_CONNECTED = 0;
constexpr int32_t EVENT_PEER_DISCONNECTED = 1;
constexpr int32_t EVENT_TRANSFER_REQUEST = 2;
constexpr int32_t EVENT_PROGRESS = 3;
constexpr int32_t EVENT_COMPLETED = 4;
constexpr int32_t EVENT_ACCEPTED = 6;
constexpr int32_t EVENT_REJECTED = 7;
constexpr int32_t EVENT_WITHDRAWN = 8;

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════

TEST(CApiLifecycleTest, CreateRequiresSendCallback) {
    EXPECT_EQ(ir_registry_create(nullptr, nullptr, nullptr, nullptr), nullptr);
    EXPECT_EQ(ir_last_error(), IR_ERROR_INVALID_ARGUMENT);
    EXPECT_STRNE(ir_last_error_message(), "");
}

TEST(CApiLifecycleTest, CreateRejectsInvalidConfig) {
    EXPECT_EQ(ir_registry_create("{not json", discardSend, nullptr, nullptr), nullptr);
    EXPECT_EQ(ir_last_error(), IR_ERROR_INVALID_ARGUMENT);

    EXPECT_EQ(ir_registry_create(R"({"minChunkSize": 0})", discardSend, nullptr, nullptr), nullptr);
    EXPECT_EQ(ir_last_error(), IR_ERROR_INVALID_ARGUMENT);
}

TEST(CApiLifecycleTest, CreateAndDestroy) {
    IRRegistry reg = ir_registry_create(nullptr, discardSend, nullptr, nullptr);
    ASSERT_NE(reg, nullptr);
    EXPECT_EQ(ir_last_error(), IR_OK);

    EXPECT_EQ(take(ir_get_active_transfers(reg)), "[]");
    EXPECT_EQ(take(ir_get_connected_peers(reg)), "[]");
    EXPECT_EQ(ir_clear_finished_transfers(reg), 0);

    ir_registry_destroy(reg);
    ir_registry_destroy(nullptr);
}

// ═══════════════════════════════════════════════════════════
// Argument validation
// ═══════════════════════════════════════════════════════════

class CApiArgumentTest : public ::testing::Test {
protected:
    IRRegistry reg = nullptr;

    void SetUp() override {
        reg = ir_registry_create(SMALL_CHUNKS_CONFIG, discardSend, nullptr, nullptr);
        ASSERT_NE(reg, nullptr);
    }

    void TearDown() override {
        ir_registry_destroy(reg);
    }
};

TEST_F(CApiArgumentTest, NullHandlesAndStrings) {
    EXPECT_EQ(ir_connect(nullptr, "bob"), IR_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ir_connect(reg, nullptr), IR_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ir_connect(reg, ""), IR_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ir_peer_connected(reg, nullptr, "x"), IR_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ir_deliver_frame(reg, "bob", nullptr, 0), IR_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ir_cancel_transfer(reg, nullptr), IR_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ir_registry_set_event_callback(nullptr, hostEvent, nullptr), IR_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ir_registry_set_local_identity(reg, nullptr, "name"), IR_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ir_is_connected(reg, nullptr), 0);
    EXPECT_EQ(ir_is_connected(nullptr, "bob"), 0);
    EXPECT_EQ(ir_get_active_transfers(nullptr), nullptr);
    EXPECT_EQ(ir_clear_finished_transfers(nullptr), -1);
}

TEST_F(CApiArgumentTest, ConnectWithoutConnectCallbackFails) {
    EXPECT_EQ(ir_connect(reg, "bob"), IR_ERROR_NETWORK);
    EXPECT_EQ(ir_last_error(), IR_ERROR_NETWORK);
    EXPECT_EQ(ir_is_connected(reg, "bob"), 0);
}

TEST_F(CApiArgumentTest, UnknownTransfersReportNotFound) {
    EXPECT_EQ(take(ir_get_transfer(reg, "missing")), "");
    EXPECT_EQ(ir_last_error(), IR_ERROR_NOT_FOUND);

    EXPECT_EQ(ir_cancel_transfer(reg, "missing"), IR_ERROR_NOT_FOUND);
    EXPECT_EQ(ir_save_received_file(reg, "missing", "/tmp/ir_never_written"), IR_ERROR_NOT_FOUND);
    EXPECT_FALSE(fs::exists("/tmp/ir_never_written"));
}

TEST_F(CApiArgumentTest, MetadataMustBeValidJson) {
    EXPECT_EQ(ir_accept_transfer(reg, "bob", "{broken"), IR_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ir_accept_transfer(reg, "bob", R"({"name":"a.txt"})"), IR_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ir_reject_transfer(reg, "bob", nullptr), IR_ERROR_INVALID_ARGUMENT);
}

TEST_F(CApiArgumentTest, SendFileRequestChecksFileThenPeer) {
    char* missing = ir_send_file_request(reg, "bob", "/nonexistent/ir_file.bin", -1, 0.0);
    EXPECT_EQ(missing, nullptr);
    EXPECT_EQ(ir_last_error(), IR_ERROR_IO);

    auto path = fs::temp_directory_path() / "ir_c_api_unconnected.bin";
    {
        std::ofstream f(path, std::ios::binary);
        f << "some bytes";
    }
    char* unconnected = ir_send_file_request(reg, "bob", path.string().c_str(), 0, 0.0);
    EXPECT_EQ(unconnected, nullptr);
    EXPECT_EQ(ir_last_error(), IR_ERROR_NETWORK);
    fs::remove(path);
}

TEST_F(CApiArgumentTest, PeerEventsAreDelivered) {
    Host host;
    ASSERT_EQ(ir_registry_set_event_callback(reg, hostEvent, &host), IR_OK);

    EXPECT_EQ(ir_peer_connected(reg, "bob", "Bob's phone"), IR_OK);
    EXPECT_EQ(ir_is_connected(reg, "bob"), 1);

    auto peers = json::parse(take(ir_get_connected_peers(reg)));
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0]["id"], "bob");
    EXPECT_EQ(peers[0]["name"], "Bob's phone");

    // Garbage from a connected peer is dropped
    uint8_t garbage[] = {1, 2, 3, 4};
    EXPECT_EQ(ir_deliver_frame(reg, "bob", garbage, sizeof(garbage)), IR_ERROR_INVALID_ARGUMENT);

    EXPECT_EQ(ir_peer_disconnected(reg, "bob"), IR_OK);
    EXPECT_EQ(ir_is_connected(reg, "bob"), 0);

    auto connected = host.eventsOf(EVENT_PEER_CONNECTED);
    ASSERT_EQ(connected.size(), 1u);
    EXPECT_EQ(connected[0]["id"], "bob");
    EXPECT_EQ(host.eventsOf(EVENT_PEER_DISCONNECTED).size(), 1u);

    ir_registry_set_event_callback(reg, nullptr, nullptr);
}

// ═══════════════════════════════════════════════════════════
// Two registries over host callbacks
// ═══════════════════════════════════════════════════════════

class CApiTransferTest : public ::testing::Test {
protected:
    std::string tempDir;
    Host alice;
    Host bob;

    void SetUp() override {
        tempDir = fs::temp_directory_path().string() + "/ir_c_api_" +
                  std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        fs::create_directories(tempDir);

        alice.selfId = "alice";
        bob.selfId = "bob";
        alice.self = ir_registry_create(SMALL_CHUNKS_CONFIG, hostSend, hostConnect, &alice);
        bob.self = ir_registry_create(SMALL_CHUNKS_CONFIG, hostSend, hostConnect, &bob);
        ASSERT_NE(alice.self, nullptr);
        ASSERT_NE(bob.self, nullptr);
        alice.peer = bob.self;
        bob.peer = alice.self;

        ir_registry_set_event_callback(alice.self, hostEvent, &alice);
        ir_registry_set_event_callback(bob.self, hostEvent, &bob);
        ir_registry_set_local_identity(alice.self, "alice", "Alice");
        ir_registry_set_local_identity(bob.self, "bob", "Bob");
    }

    void TearDown() override {
        alice.detach();
        bob.detach();
        ir_registry_destroy(alice.self);
        ir_registry_destroy(bob.self);
        fs::remove_all(tempDir);
    }

    std::string writeFile(const std::string& name, size_t size) {
        std::string path = tempDir + "/" + name;
        std::ofstream f(path, std::ios::binary);
        for (size_t i = 0; i < size; ++i) f.put(static_cast<char>((i * 31) % 253));
        return path;
    }

    static std::vector<char> readFile(const std::string& path) {
        std::ifstream f(path, std::ios::binary);
        return std::vector<char>(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    }

    static std::string statusOf(IRRegistry reg, const std::string& id) {
        std::string text = take(ir_get_transfer(reg, id.c_str()));
        if (text.empty()) return {};
        return json::parse(text)["status"].get<std::string>();
    }

    json awaitRequest() {
        json request;
        waitUntil([&]() {
            auto requests = bob.eventsOf(EVENT_TRANSFER_REQUEST);
            if (requests.empty()) return false;
            request = requests[0];
            return true;
        });
        return request;
    }
};

TEST_F(CApiTransferTest, ConnectAndDisconnect) {
    ASSERT_EQ(ir_connect(alice.self, "bob"), IR_OK);
    EXPECT_EQ(ir_is_connected(alice.self, "bob"), 1);
    EXPECT_EQ(ir_is_connected(bob.self, "alice"), 1);

    ASSERT_EQ(ir_disconnect(alice.self, "bob"), IR_OK);
    EXPECT_EQ(ir_is_connected(alice.self, "bob"), 0);
    EXPECT_EQ(ir_is_connected(bob.self, "alice"), 0);
    EXPECT_EQ(bob.eventsOf(EVENT_PEER_DISCONNECTED).size(), 1u);
}

TEST_F(CApiTransferTest, FullTransferWithFec) {
    ASSERT_EQ(ir_connect(alice.self, "bob"), IR_OK);

    std::string path = writeFile("report.pdf", 50000);
    std::string metadataText = take(ir_send_file_request(alice.self, "bob", path.c_str(), 1, 0.25));
    ASSERT_FALSE(metadataText.empty()) << ir_last_error_message();

    json metadata = json::parse(metadataText);
    std::string id = metadata["id"];
    EXPECT_EQ(metadata["name"], "report.pdf");
    EXPECT_EQ(metadata["size"], 50000);
    EXPECT_EQ(metadata["mimeType"], "application/pdf");
    EXPECT_EQ(metadata["useFEC"], true);

    json request = awaitRequest();
    ASSERT_TRUE(request.is_object());
    EXPECT_EQ(request["metadata"]["id"], id);
    EXPECT_EQ(request["from"]["id"], "alice");

    ASSERT_EQ(ir_accept_transfer(bob.self, "alice", request["metadata"].dump().c_str()), IR_OK);
    ASSERT_EQ(ir_send_file(alice.self, "bob", path.c_str(), metadataText.c_str()), IR_OK);

    ASSERT_TRUE(waitUntil([&]() { return statusOf(bob.self, id) == "completed"; }));
    ASSERT_TRUE(waitUntil([&]() { return statusOf(alice.self, id) == "completed"; }));

    auto record = json::parse(take(ir_get_transfer(bob.self, id.c_str())));
    EXPECT_EQ(record["direction"], "receive");
    EXPECT_EQ(record["progress"], 100);
    EXPECT_EQ(record["useFEC"], true);
    EXPECT_TRUE(record["checksum"].is_string());
    EXPECT_FALSE(record.contains("errorKind"));

    std::string out = tempDir + "/received.pdf";
    ASSERT_EQ(ir_save_received_file(bob.self, id.c_str(), out.c_str()), IR_OK);
    EXPECT_EQ(readFile(out), readFile(path));

    EXPECT_EQ(alice.eventsOf(EVENT_ACCEPTED).size(), 1u);
    EXPECT_FALSE(bob.eventsOf(EVENT_PROGRESS).empty());
    ASSERT_TRUE(waitUntil([&]() { return bob.eventsOf(EVENT_COMPLETED).size() == 1; }));

    auto transfers = json::parse(take(ir_get_active_transfers(alice.self)));
    ASSERT_EQ(transfers.size(), 1u);
    EXPECT_EQ(transfers[0]["direction"], "send");
    EXPECT_EQ(ir_clear_finished_transfers(alice.self), 1);
}

TEST_F(CApiTransferTest, RejectedRequest) {
    ASSERT_EQ(ir_connect(alice.self, "bob"), IR_OK);

    std::string path = writeFile("notes.txt", 1000);
    std::string metadataText = take(ir_send_file_request(alice.self, "bob", path.c_str(), -1, 0.0));
    ASSERT_FALSE(metadataText.empty());
    std::string id = json::parse(metadataText)["id"];

    json request = awaitRequest();
    ASSERT_TRUE(request.is_object());
    ASSERT_EQ(ir_reject_transfer(bob.self, "alice", request["metadata"].dump().c_str()), IR_OK);

    ASSERT_TRUE(waitUntil([&]() { return alice.eventsOf(EVENT_REJECTED).size() == 1; }));
    EXPECT_EQ(alice.eventsOf(EVENT_REJECTED)[0]["metadata"]["id"], id);

    // The request is gone on both sides
    EXPECT_EQ(ir_send_file(alice.self, "bob", path.c_str(), metadataText.c_str()), IR_ERROR_NOT_FOUND);
    EXPECT_EQ(ir_accept_transfer(bob.self, "alice", request["metadata"].dump().c_str()), IR_ERROR_NOT_FOUND);
}

TEST_F(CApiTransferTest, SendFileDetectsChangedFile) {
    ASSERT_EQ(ir_connect(alice.self, "bob"), IR_OK);

    std::string path = writeFile("draft.txt", 2000);
    std::string metadataText = take(ir_send_file_request(alice.self, "bob", path.c_str(), 0, 0.0));
    ASSERT_FALSE(metadataText.empty());

    writeFile("draft.txt", 2500);
    EXPECT_EQ(ir_send_file(alice.self, "bob", path.c_str(), metadataText.c_str()), IR_ERROR_IO);

    std::string id = json::parse(metadataText)["id"];
    EXPECT_EQ(ir_cancel_transfer(alice.self, id.c_str()), IR_OK);
}

TEST_F(CApiTransferTest, WithdrawnRequestReachesReceiver) {
    ASSERT_EQ(ir_connect(alice.self, "bob"), IR_OK);

    std::string path = writeFile("movie.mkv", 3000);
    std::string metadataText = take(ir_send_file_request(alice.self, "bob", path.c_str(), 0, 0.0));
    ASSERT_FALSE(metadataText.empty());
    std::string id = json::parse(metadataText)["id"];

    json request = awaitRequest();
    ASSERT_TRUE(request.is_object());
    ASSERT_EQ(ir_cancel_transfer(alice.self, id.c_str()), IR_OK);

    ASSERT_TRUE(waitUntil([&]() { return bob.eventsOf(EVENT_WITHDRAWN).size() == 1; }));
    auto withdrawn = bob.eventsOf(EVENT_WITHDRAWN)[0];
    EXPECT_EQ(withdrawn["peerId"], "alice");
    EXPECT_EQ(withdrawn["metadata"]["id"], id);
    EXPECT_EQ(ir_accept_transfer(bob.self, "alice", request["metadata"].dump().c_str()), IR_ERROR_NOT_FOUND);
    EXPECT_TRUE(alice.eventsOf(EVENT_REJECTED).empty());
}

TEST_F(CApiTransferTest, TextTransferReportsCompressionSavings) {
    ASSERT_EQ(ir_connect(alice.self, "bob"), IR_OK);

    std::string path = writeFile("server.txt", 40000);
    std::string metadataText = take(ir_send_file_request(alice.self, "bob", path.c_str(), 0, 0.0));
    ASSERT_FALSE(metadataText.empty());
    std::string id = json::parse(metadataText)["id"];

    json request = awaitRequest();
    ASSERT_EQ(ir_accept_transfer(bob.self, "alice", request["metadata"].dump().c_str()), IR_OK);
    ASSERT_EQ(ir_send_file(alice.self, "bob", path.c_str(), metadataText.c_str()), IR_OK);
    ASSERT_TRUE(waitUntil([&]() { return statusOf(bob.self, id) == "completed"; }));

    auto record = json::parse(take(ir_get_transfer(bob.self, id.c_str())));
    ASSERT_TRUE(record.contains("compressionSavings"));
    EXPECT_GT(record["compressionSavings"]["savedBytes"].get<int64_t>(), 0);

    std::string out = tempDir + "/received.txt";
    ASSERT_EQ(ir_save_received_file(bob.self, id.c_str(), out.c_str()), IR_OK);
    EXPECT_EQ(readFile(out), readFile(path));
}
