// tests/test_deflate.cpp
// permessage-deflate parameters and compressed traffic between two endpoints

#include "ws/connection.hpp"
#include "ws/deflate.hpp"
#include "ws/frame_encoder.hpp"
#include <cassert>
#include <cstdio>
#include <memory>
#include <string>

static ByteVec bytes(const std::string& s) {
    return ByteVec(s.begin(), s.end());
}

static ExtensionList deflate_with(const std::string& params) {
    std::unique_ptr<Extension> ext(new PerMessageDeflate());
    ext->finalize(params);
    ExtensionList list;
    list.push_back(std::move(ext));
    return list;
}

static std::vector<WsEvent> feed(WsConnection& c, const ByteVec& wire) {
    c.receive_data(wire.data(), wire.size());
    return c.events();
}

void test_parameters() {
    printf("Testing parameter parsing...\n");

    PerMessageDeflate a;
    a.finalize("permessage-deflate; client_max_window_bits=10; server_no_context_takeover");
    assert(a.client_max_window_bits() == 10);
    assert(a.server_max_window_bits() == PerMessageDeflate::kDefaultWindowBits);
    assert(a.server_no_context_takeover());
    assert(!a.client_no_context_takeover());

    PerMessageDeflate b;
    b.finalize("permessage-deflate; server_max_window_bits=\"12\"; client_max_window_bits=20");
    assert(b.server_max_window_bits() == 12);
    assert(b.client_max_window_bits() == 15);

    PerMessageDeflate c;
    c.finalize("permessage-deflate");
    assert(c.client_max_window_bits() == 15);
    assert(!c.server_no_context_takeover());
    assert(std::string(c.name()) == "permessage-deflate");

    printf("  PASS parameters\n");
}

static void exchange(const std::string& params) {
    WsConnection client(Role::Client, deflate_with(params));
    WsConnection server(Role::Server, deflate_with(params));

    std::string text = "the quick brown fox jumps over the lazy dog, again and again";
    for (int round = 0; round < 3; ++round) {
        ByteVec wire = client.send(WsMessage{true, bytes(text), true});
        assert(wire[0] & 0x40);          // RSV1 marks a compressed message
        auto evs = feed(server, wire);
        assert(evs.size() == 1);
        const WsMessage& m = std::get<WsMessage>(evs[0]);
        assert(m.text);
        assert(m.data == bytes(text));

        ByteVec back = server.send(WsMessage{false, ByteVec(5000, 'z'), true});
        assert(back[0] & 0x40);
        assert(back.size() < 200);
        evs = feed(client, back);
        assert(std::get<WsMessage>(evs[0]).data == ByteVec(5000, 'z'));
    }
}

void test_round_trip() {
    printf("Testing compressed messages with context takeover...\n");
    exchange("permessage-deflate");
    printf("  PASS context takeover\n");

    printf("Testing compressed messages without context takeover...\n");
    exchange("permessage-deflate; client_no_context_takeover; server_no_context_takeover");
    printf("  PASS no context takeover\n");

    printf("Testing compressed messages with small windows...\n");
    exchange("permessage-deflate; client_max_window_bits=8; server_max_window_bits=9");
    printf("  PASS small windows\n");
}

void test_fragmented_compressed_message() {
    printf("Testing a compressed message split over two frames...\n");

    WsConnection client(Role::Client, deflate_with("permessage-deflate"));
    WsConnection server(Role::Server, deflate_with("permessage-deflate"));

    ByteVec wire = client.send(WsMessage{true, bytes("first half, "), false});
    ByteVec tail = client.send(WsMessage{true, bytes("second half"), true});
    assert(wire[0] & 0x40);
    assert(!(tail[0] & 0x40));           // RSV1 only on the first frame
    wire.insert(wire.end(), tail.begin(), tail.end());

    auto evs = feed(server, wire);
    assert(evs.size() == 2);
    assert(std::get<WsMessage>(evs[0]).data == bytes("first half, "));
    assert(!std::get<WsMessage>(evs[0]).message_finished);
    assert(std::get<WsMessage>(evs[1]).data == bytes("second half"));
    assert(std::get<WsMessage>(evs[1]).message_finished);

    printf("  PASS fragmented compressed message\n");
}

void test_uncompressed_message_passes() {
    printf("Testing an uncompressed message on a deflate connection...\n");

    const byte mask[4] = {1, 2, 3, 4};
    WsConnection server(Role::Server, deflate_with("permessage-deflate"));
    auto evs = feed(server, encode_frame(Opcode::Text, true, false, bytes("raw"), mask));
    assert(std::get<WsMessage>(evs[0]).data == bytes("raw"));

    printf("  PASS uncompressed message\n");
}

void test_invalid_input() {
    printf("Testing invalid compressed input...\n");

    const byte mask[4] = {1, 2, 3, 4};
    {
        // 0xFF starts a block with the reserved type 3
        WsConnection server(Role::Server, deflate_with("permessage-deflate"));
        auto evs = feed(server, encode_frame(Opcode::Binary, true, true, ByteVec({0xFF, 0xFF}), mask));
        assert(std::get<WsClose>(evs[0]).code == 1007);
    }
    {
        WsConnection server(Role::Server, deflate_with("permessage-deflate"));
        auto evs = feed(server, encode_frame(Opcode::Ping, true, true, ByteVec(), mask));
        assert(std::get<WsClose>(evs[0]).code == 1002);
    }

    printf("  PASS invalid input\n");
}

int main() {
    printf("\n=== permessage-deflate Tests ===\n\n");

    test_parameters();
    test_round_trip();
    test_fragmented_compressed_message();
    test_uncompressed_message_passes();
    test_invalid_input();

    printf("\nAll permessage-deflate tests passed!\n");
    return 0;
}
