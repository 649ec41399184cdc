#pragma once
#include <string>

// Symbolic name of a registered close code, nullptr if unregistered.
const char* close_reason_name(int code);

// May this code appear in a close frame received from a peer?
bool is_valid_remote_close_code(int code);

// "NAME" or "UNKNOWN_ERROR=<code>", plus " (reason: <reason>)" when set.
std::string format_close(int code, const std::string& reason);
