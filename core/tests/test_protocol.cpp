#include "test_util.h"

#include "dropway/protocol/peer_messages.h"
#include "dropway/protocol/transfer_messages.h"

#include <cstring>

using namespace dropway::protocol;

template <typename Fn>
static bool throws_protocol_error(Fn fn) {
    try {
        fn();
    } catch (const ProtocolError&) {
        return true;
    }
    return false;
}

static MessageHeaderWire header_of(const std::vector<uint8_t>& frame) {
    MessageHeaderWire h{};
    std::memcpy(&h, frame.data(), sizeof(h));
    return h;
}

static bool test_frame_header() {
    std::vector<uint8_t> payload{1, 2, 3, 4, 5};
    auto frame = make_frame(MsgType::PING, payload);
    TEST_ASSERT(frame.size() == HEADER_SIZE + payload.size(), "frame size");
    TEST_ASSERT(frame[0] == 'D' && frame[1] == 'R' && frame[2] == 'W' && frame[3] == '1', "magic on the wire");

    auto h = header_of(frame);
    validate_header(h);
    TEST_ASSERT(payload_len(h) == 5, "payload length");
    TEST_ASSERT(static_cast<MsgType>(h.type) == MsgType::PING, "type");

    auto bad_magic = h;
    bad_magic.magic_be ^= 0x01;
    TEST_ASSERT(throws_protocol_error([&] { validate_header(bad_magic); }), "bad magic");

    auto bad_version = h;
    bad_version.version = VERSION + 1;
    TEST_ASSERT(throws_protocol_error([&] { validate_header(bad_version); }), "bad version");

    auto huge = make_header(MsgType::CHUNK, MAX_PAYLOAD + 1);
    TEST_ASSERT(throws_protocol_error([&] { validate_header(huge); }), "oversized payload");
    TEST_ASSERT(std::string(msg_type_name(MsgType::RESUME_RESP)) == "RESUME_RESP", "type names");
    return true;
}

static Offer sample_offer() {
    Offer o;
    o.transfer_id = 0x1122334455667788ull;
    o.file_name = "photo.jpg";
    o.file_size = 1000;
    o.chunk_size = 256;
    o.chunk_count = 4;
    o.file_hash = dropway::crypto::sha256(reinterpret_cast<const uint8_t*>("f"), 1);
    for (uint8_t i = 0; i < 4; i++) o.chunk_hashes.push_back(dropway::crypto::sha256(&i, 1));
    return o;
}

static bool test_offer() {
    Offer o = sample_offer();
    auto payload = o.serialize();
    TEST_ASSERT(peek_transfer_id(payload) == o.transfer_id, "transfer id leads the payload");

    Offer back = Offer::deserialize(payload);
    TEST_ASSERT(back.file_name == o.file_name && back.file_size == 1000, "fields");
    TEST_ASSERT(back.chunk_hashes == o.chunk_hashes && back.file_hash == o.file_hash, "hashes");
    TEST_ASSERT(back.request_id == 0, "pushed offer has no request id");

    Offer wrong_count = o;
    wrong_count.chunk_count = 5;
    wrong_count.chunk_hashes.push_back(o.file_hash);
    TEST_ASSERT(throws_protocol_error([&] { Offer::deserialize(wrong_count.serialize()); }),
                "chunk count inconsistent with size");

    Offer missing_hash = o;
    missing_hash.chunk_hashes.pop_back();
    TEST_ASSERT(throws_protocol_error([&] { Offer::deserialize(missing_hash.serialize()); }),
                "hash list shorter than chunk count");

    Offer zero = o;
    zero.chunk_size = 0;
    TEST_ASSERT(throws_protocol_error([&] { Offer::deserialize(zero.serialize()); }), "zero chunk size");

    auto truncated = payload;
    truncated.resize(20);
    TEST_ASSERT(throws_protocol_error([&] { Offer::deserialize(truncated); }), "truncated offer");
    return true;
}

static bool test_index_sets() {
    OfferResp resp;
    resp.transfer_id = 9;
    resp.ok = true;
    resp.have = {0, 1, 2, 3, 7, 9, 10};

    ByteWriter w;
    write_index_set(w, resp.have);
    TEST_ASSERT(w.data().size() == 4 + 3 * 8, "three runs encoded");

    auto back = OfferResp::deserialize(resp.serialize(), 11);
    TEST_ASSERT(back.ok && back.have == resp.have, "runs decode to the same indices");

    TEST_ASSERT(throws_protocol_error([&] { OfferResp::deserialize(resp.serialize(), 10); }),
                "index past chunk count");

    ByteWriter overlap;
    overlap.u64(9);
    overlap.u8(0);
    overlap.str16("");
    overlap.u32(2);
    overlap.u32(4);
    overlap.u32(3);
    overlap.u32(5);
    overlap.u32(1);
    TEST_ASSERT(throws_protocol_error([&] { OfferResp::deserialize(overlap.data(), 100); }),
                "overlapping runs");

    ByteWriter lying;
    lying.u64(9);
    lying.u8(0);
    lying.str16("");
    lying.u32(1000000);
    TEST_ASSERT(throws_protocol_error([&] { OfferResp::deserialize(lying.data(), 100); }),
                "run count larger than payload");
    return true;
}

static bool test_small_messages() {
    ChunkAck ack{5, 17, 12};
    auto a = ChunkAck::deserialize(ack.serialize());
    TEST_ASSERT(a.transfer_id == 5 && a.chunk_index == 17 && a.cursor == 12, "chunk ack");

    auto trailing = ack.serialize();
    trailing.push_back(0);
    TEST_ASSERT(throws_protocol_error([&] { ChunkAck::deserialize(trailing); }), "trailing bytes");

    Result res;
    res.transfer_id = 5;
    res.ok = false;
    res.reason_code = 3;
    res.message = "integrity";
    auto r = Result::deserialize(res.serialize());
    TEST_ASSERT(!r.ok && r.reason_code == 3 && r.message == "integrity", "result");

    Fetch any;
    any.request_id = 77;
    auto f = Fetch::deserialize(any.serialize());
    TEST_ASSERT(f.request_id == 77 && !f.has_hash, "fetch without hash");

    Fetch named = any;
    named.has_hash = true;
    named.file_hash = sample_offer().file_hash;
    auto g = Fetch::deserialize(named.serialize());
    TEST_ASSERT(g.has_hash && g.file_hash == named.file_hash, "fetch with hash");

    auto bad_flag = any.serialize();
    bad_flag[8] = 2;
    TEST_ASSERT(throws_protocol_error([&] { Fetch::deserialize(bad_flag); }), "fetch flag must be 0 or 1");

    Hello hello{"peer-a", "peer-b"};
    auto h = Hello::deserialize(hello.serialize());
    TEST_ASSERT(h.peer_id == "peer-a" && h.expected_peer_id == "peer-b", "hello");
    TEST_ASSERT(throws_protocol_error([] { Hello::deserialize(Hello{"", ""}.serialize()); }), "empty peer id");

    TEST_ASSERT(throws_protocol_error([] { peek_transfer_id({1, 2, 3}); }), "short transfer frame");
    return true;
}

static bool test_chunk_message() {
    ChunkMsg c;
    c.transfer_id = 1;
    c.chunk_index = 3;
    c.data = {9, 8, 7};
    c.hash = dropway::crypto::sha256(c.data.data(), c.data.size());
    auto back = ChunkMsg::deserialize(c.serialize());
    TEST_ASSERT(back.data == c.data && back.hash == c.hash && back.chunk_index == 3, "chunk payload");

    ChunkMsg empty;
    auto e = ChunkMsg::deserialize(empty.serialize());
    TEST_ASSERT(e.data.empty(), "chunk with no data");
    return true;
}

int main() {
    std::cout << "--- Protocol tests ---" << std::endl;
    RUN_TEST(test_frame_header(), "frame header");
    RUN_TEST(test_offer(), "offer");
    RUN_TEST(test_index_sets(), "index sets");
    RUN_TEST(test_small_messages(), "control messages");
    RUN_TEST(test_chunk_message(), "chunk message");
    return finish_tests();
}
