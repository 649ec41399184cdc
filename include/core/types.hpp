#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

using byte = uint8_t;
using ByteVec = std::vector<byte>;

// Connection identity as seen by the relay. The proxy uses the socket fd.
using ConnId = int;
