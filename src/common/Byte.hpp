#pragma once

#include <cstdint>
#include <vector>

using byte = uint8_t;
using Bytes = std::vector<byte>;
