#include "test_util.h"

#include "dropway/crypto/digest.h"
#include "dropway/ticket/ticket.h"

using dropway::Endpoint;
using dropway::Ticket;
using dropway::TicketDecodeError;

template <typename Fn>
static bool throws_decode_error(Fn fn) {
    try {
        fn();
    } catch (const TicketDecodeError&) {
        return true;
    }
    return false;
}

static bool test_round_trip() {
    const std::string id = dropway::crypto::generate_peer_id();
    TEST_ASSERT(id.size() == 32, "peer id is 32 hex chars");

    std::vector<Endpoint> addrs{{"192.168.1.20", 4000}, {"10.0.0.7", 4001}, {"::1", 4002}};
    Endpoint relay{"relay.example.net", 7000};
    Ticket t(id, addrs, relay);

    const std::string text = t.encode();
    TEST_ASSERT(text.rfind("dropway1", 0) == 0, "prefix and version");
    TEST_ASSERT(text == dropway::encode_ticket(id, addrs, relay), "encoding is deterministic");

    Ticket back = Ticket::decode(text);
    TEST_ASSERT(back == t, "decode(encode(t)) == t");
    TEST_ASSERT(back.addresses().size() == 3, "address count");
    TEST_ASSERT(back.addresses()[2].host == "::1", "v6 host kept");
    TEST_ASSERT(back.relay() && back.relay()->port == 7000, "relay kept");

    Ticket no_relay(id, {{"127.0.0.1", 9}}, std::nullopt);
    TEST_ASSERT(Ticket::decode(no_relay.encode()) == no_relay, "ticket without relay");
    return true;
}

static bool test_rejects_malformed() {
    Ticket t(dropway::crypto::generate_peer_id(), {{"127.0.0.1", 5000}}, std::nullopt);
    const std::string good = t.encode();

    TEST_ASSERT(throws_decode_error([] { Ticket::decode(""); }), "empty string");
    TEST_ASSERT(throws_decode_error([&] { Ticket::decode("xyz" + good.substr(3)); }), "wrong prefix");
    TEST_ASSERT(throws_decode_error([&] {
        std::string v = good;
        v[7] = '2';
        Ticket::decode(v);
    }), "unknown version");
    TEST_ASSERT(throws_decode_error([&] { Ticket::decode(good + "!"); }), "character outside the alphabet");
    TEST_ASSERT(throws_decode_error([&] { Ticket::decode(good.substr(0, good.size() - 6)); }), "truncated");
    TEST_ASSERT(throws_decode_error([&] {
        std::string v = good;
        char& c = v[12];
        c = (c == 'a') ? 'b' : 'a';
        Ticket::decode(v);
    }), "flipped character fails the checksum");
    return true;
}

static bool test_endpoint_parse() {
    auto a = Endpoint::parse("example.org:443");
    TEST_ASSERT(a && a->host == "example.org" && a->port == 443, "host:port");
    auto b = Endpoint::parse("[fe80::1]:8080");
    TEST_ASSERT(b && b->host == "fe80::1" && b->port == 8080, "[v6]:port");
    TEST_ASSERT(!Endpoint::parse("example.org"), "missing port");
    TEST_ASSERT(!Endpoint::parse("example.org:http"), "non-numeric port");
    TEST_ASSERT(!Endpoint::parse("example.org:70000"), "port out of range");
    TEST_ASSERT(!Endpoint::parse(":80"), "missing host");
    return true;
}

int main() {
    std::cout << "--- Ticket tests ---" << std::endl;
    RUN_TEST(test_round_trip(), "round trip");
    RUN_TEST(test_rejects_malformed(), "malformed tickets");
    RUN_TEST(test_endpoint_parse(), "endpoint parsing");
    return finish_tests();
}
