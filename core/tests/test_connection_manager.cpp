#include "test_util.h"

#include "dropway/node/node.h"
#include "dropway/relay/relay_server.h"

#include <future>

using dropway::Endpoint;
using dropway::Node;
using dropway::Ticket;
using dropway::net::ConnectError;
using dropway::net::ResolveOutcome;
using dropway::net::TransportKind;
using boost::asio::ip::tcp;

static std::unique_ptr<Node> make_node(const std::filesystem::path& dir, const std::string& name,
                                       const std::string& relay = "") {
    auto cfg = test_config(dir / name);
    cfg.relay = relay;
    auto node = std::make_unique<Node>(cfg, std::make_unique<dropway::storage::MemoryResumeStore>());
    node->start();
    return node;
}

static ResolveOutcome resolve_sync(Node& node, const Ticket& t, std::chrono::milliseconds timeout) {
    std::promise<ResolveOutcome> p;
    auto f = p.get_future();
    node.connections().resolve(t, timeout, [&p](const ResolveOutcome& o) { p.set_value(o); });
    return f.get();
}

// A port nothing listens on.
static uint16_t closed_port() {
    boost::asio::io_context io;
    tcp::acceptor a(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    uint16_t port = a.local_endpoint().port();
    a.close();
    return port;
}

static bool test_concurrent_resolves_share_one_connection(const std::filesystem::path& dir) {
    auto a = make_node(dir, "share_a");
    auto b = make_node(dir, "share_b");
    const Ticket t = b->ticket();

    std::promise<ResolveOutcome> p1, p2;
    auto f1 = p1.get_future();
    auto f2 = p2.get_future();
    a->connections().resolve(t, std::chrono::milliseconds(4000), [&p1](const ResolveOutcome& o) { p1.set_value(o); });
    a->connections().resolve(t, std::chrono::milliseconds(4000), [&p2](const ResolveOutcome& o) { p2.set_value(o); });
    auto o1 = f1.get();
    auto o2 = f2.get();

    TEST_ASSERT(o1.kind == ResolveOutcome::Kind::Direct, "first resolve is direct: " << o1.detail);
    TEST_ASSERT(o2.kind == ResolveOutcome::Kind::Direct, "second resolve is direct: " << o2.detail);
    TEST_ASSERT(o1.connection == o2.connection, "both callers get the same connection");
    TEST_ASSERT(a->connections().size() == 1, "one pooled connection on the dialer");
    TEST_ASSERT(o1.connection->peer_id() == b->peer_id(), "connection is bound to the ticket's peer");

    auto o3 = resolve_sync(*a, t, std::chrono::milliseconds(4000));
    TEST_ASSERT(o3.connection == o1.connection && o3.detail == "pooled", "later resolve reuses the pool");

    TEST_ASSERT(wait_until([&]() { return b->connections().find(a->peer_id()) != nullptr; },
                           std::chrono::milliseconds(2000)),
                "listener pooled the inbound connection");
    return true;
}

static bool test_simultaneous_dials(const std::filesystem::path& dir) {
    for (int round = 0; round < 10; round++) {
        auto a = make_node(dir, "cross_a" + std::to_string(round));
        auto b = make_node(dir, "cross_b" + std::to_string(round));

        std::promise<ResolveOutcome> pa, pb;
        auto fa = pa.get_future();
        auto fb = pb.get_future();
        a->connections().resolve(b->ticket(), std::chrono::milliseconds(4000),
                                 [&pa](const ResolveOutcome& o) { pa.set_value(o); });
        b->connections().resolve(a->ticket(), std::chrono::milliseconds(4000),
                                 [&pb](const ResolveOutcome& o) { pb.set_value(o); });
        auto oa = fa.get();
        auto ob = fb.get();
        TEST_ASSERT(oa.ok() && ob.ok(), "both dials succeed (round " << round << ")");

        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        TEST_ASSERT(oa.connection->is_open(), "connection handed to A still open (round " << round << ")");
        TEST_ASSERT(ob.connection->is_open(), "connection handed to B still open (round " << round << ")");

        // both sides pool the connection dialed by the lower peer id
        const bool a_dials = a->peer_id() < b->peer_id();
        TEST_ASSERT(wait_until([&]() {
                        auto ca = a->connections().find(b->peer_id());
                        auto cb = b->connections().find(a->peer_id());
                        return ca && cb && ca->outbound() == a_dials && cb->outbound() == !a_dials;
                    }, std::chrono::milliseconds(2000)),
                    "pools agree on one connection (round " << round << ")");
        TEST_ASSERT(a->connections().size() == 1 && b->connections().size() == 1,
                    "one pooled connection per side (round " << round << ")");
    }
    return true;
}

static bool test_unreachable(const std::filesystem::path& dir) {
    auto a = make_node(dir, "unreach_a");
    Ticket t(dropway::crypto::generate_peer_id(), {{"127.0.0.1", closed_port()}}, std::nullopt);

    auto o = resolve_sync(*a, t, std::chrono::milliseconds(4000));
    TEST_ASSERT(!o.ok(), "no connection");
    TEST_ASSERT(o.error() && *o.error() == ConnectError::Unreachable, "refused port is unreachable: " << o.detail);

    auto self = resolve_sync(*a, a->ticket(), std::chrono::milliseconds(4000));
    TEST_ASSERT(self.kind == ResolveOutcome::Kind::Unreachable, "own ticket is refused");
    TEST_ASSERT(a->connections().size() == 0, "nothing pooled");
    return true;
}

static bool test_wrong_identity(const std::filesystem::path& dir) {
    auto a = make_node(dir, "ident_a");
    auto b = make_node(dir, "ident_b");
    // b's address, somebody else's id
    Ticket t(dropway::crypto::generate_peer_id(), b->ticket().addresses(), std::nullopt);

    auto o = resolve_sync(*a, t, std::chrono::milliseconds(4000));
    TEST_ASSERT(o.kind == ResolveOutcome::Kind::Unreachable, "handshake with the wrong peer fails: " << o.detail);
    TEST_ASSERT(a->connections().size() == 0, "nothing pooled");
    return true;
}

static bool test_overall_deadline(const std::filesystem::path& dir) {
    auto a = make_node(dir, "deadline_a");

    // accepts at the TCP level but never answers HELLO
    boost::asio::io_context io;
    tcp::acceptor silent(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    Ticket t(dropway::crypto::generate_peer_id(), {{"127.0.0.1", silent.local_endpoint().port()}}, std::nullopt);

    const auto started = std::chrono::steady_clock::now();
    auto o = resolve_sync(*a, t, std::chrono::milliseconds(500));
    const auto took = std::chrono::steady_clock::now() - started;

    TEST_ASSERT(o.kind == ResolveOutcome::Kind::Timeout, "deadline reported as timeout: " << o.detail);
    TEST_ASSERT(o.error() && *o.error() == ConnectError::Timeout, "timeout error");
    TEST_ASSERT(took < std::chrono::milliseconds(1500), "deadline honoured");
    return true;
}

static bool test_relay_fallback(const std::filesystem::path& dir) {
    boost::asio::io_context relay_io;
    dropway::relay::RelayServer relay(relay_io, 0);
    relay.start();
    std::thread relay_thread([&relay_io]() { relay_io.run(); });

    auto standby_count = [&](const std::string& peer) {
        std::promise<size_t> p;
        auto f = p.get_future();
        boost::asio::post(relay_io, [&]() { p.set_value(relay.standby_count(peer)); });
        return f.get();
    };

    bool ok = true;
    {
        const std::string relay_addr = "127.0.0.1:" + std::to_string(relay.port());
        auto a = make_node(dir, "relay_a");
        auto b = make_node(dir, "relay_b", relay_addr);

        ok = wait_until([&]() { return standby_count(b->peer_id()) > 0; }, std::chrono::milliseconds(3000));
        if (!ok) std::cerr << "FAIL: listener never registered at the relay" << std::endl;

        if (ok) {
            // direct address is dead, only the relay path works
            Ticket t(b->peer_id(), {{"127.0.0.1", closed_port()}}, Endpoint{"127.0.0.1", relay.port()});
            auto o = resolve_sync(*a, t, std::chrono::milliseconds(4000));
            ok = o.kind == ResolveOutcome::Kind::Relayed && o.connection &&
                 o.connection->kind() == TransportKind::Relayed;
            if (!ok) std::cerr << "FAIL: expected a relayed connection, got " << to_string(o.kind) << ": " << o.detail
                               << std::endl;
        }
        if (ok) {
            ok = wait_until([&]() {
                auto c = b->connections().find(a->peer_id());
                return c && c->kind() == TransportKind::Relayed;
            }, std::chrono::milliseconds(3000));
            if (!ok) std::cerr << "FAIL: relayed connection not pooled on the listener" << std::endl;
        }
        if (ok) {
            // the listener parks a fresh standby after pairing
            ok = wait_until([&]() { return standby_count(b->peer_id()) > 0; }, std::chrono::milliseconds(3000));
            if (!ok) std::cerr << "FAIL: no fresh standby after pairing" << std::endl;
        }
        a->stop();
        b->stop();
    }

    std::promise<void> stopped;
    boost::asio::post(relay_io, [&]() {
        relay.stop();
        stopped.set_value();
    });
    stopped.get_future().wait();
    relay_io.stop();
    relay_thread.join();
    if (!ok) tests_failed++;
    return ok;
}

int main() {
    const auto dir = make_workdir("connection_tests");
    init_test_logging(dir);
    std::cout << "--- Connection manager tests (" << dir << ") ---" << std::endl;
    RUN_TEST(test_concurrent_resolves_share_one_connection(dir), "concurrent resolves coalesce");
    RUN_TEST(test_simultaneous_dials(dir), "peers dialing each other at once");
    RUN_TEST(test_unreachable(dir), "unreachable peer");
    RUN_TEST(test_wrong_identity(dir), "identity mismatch");
    RUN_TEST(test_overall_deadline(dir), "overall resolve deadline");
    RUN_TEST(test_relay_fallback(dir), "relay fallback");
    return finish_tests();
}
