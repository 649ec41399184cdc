// tests/test_close_reason.cpp

#include "ws/close_reason.hpp"
#include <cassert>
#include <cstdio>
#include <cstring>

void test_names() {
    printf("Testing close_reason_name()...\n");

    assert(std::strcmp(close_reason_name(1000), "NORMAL_CLOSURE") == 0);
    assert(std::strcmp(close_reason_name(1001), "GOING_AWAY") == 0);
    assert(std::strcmp(close_reason_name(1006), "ABNORMAL_CLOSURE") == 0);
    assert(std::strcmp(close_reason_name(1015), "TLS_HANDSHAKE_FAILED") == 0);
    assert(close_reason_name(1004) == nullptr);
    assert(close_reason_name(4000) == nullptr);

    printf("  PASS names\n");
}

void test_format() {
    printf("Testing format_close()...\n");

    assert(format_close(1000, "") == "NORMAL_CLOSURE");
    assert(format_close(1002, "bad frame") == "PROTOCOL_ERROR (reason: bad frame)");
    assert(format_close(4000, "x") == "UNKNOWN_ERROR=4000 (reason: x)");
    assert(format_close(3999, "") == "UNKNOWN_ERROR=3999");

    printf("  PASS format\n");
}

void test_remote_codes() {
    printf("Testing is_valid_remote_close_code()...\n");

    assert(is_valid_remote_close_code(1000));
    assert(is_valid_remote_close_code(1011));
    assert(is_valid_remote_close_code(3000));
    assert(is_valid_remote_close_code(4999));

    assert(!is_valid_remote_close_code(999));
    assert(!is_valid_remote_close_code(1004));
    assert(!is_valid_remote_close_code(1005));
    assert(!is_valid_remote_close_code(1006));
    assert(!is_valid_remote_close_code(1015));
    assert(!is_valid_remote_close_code(2999));
    assert(!is_valid_remote_close_code(5000));

    printf("  PASS remote codes\n");
}

int main() {
    printf("\n=== Close Reason Tests ===\n\n");

    test_names();
    test_format();
    test_remote_codes();

    printf("\nAll close reason tests passed!\n");
    return 0;
}
