/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#pragma once

#include "ServerItemList.hpp"
#include "common/Byte.hpp"
#include "common/Logger.hpp"

#include <gsl/span>

#include <stdexcept>
#include <vector>

namespace otitems {

// A structural problem with an OTB buffer. Nothing is loaded when this is thrown.
class OtbError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One node of the OTB binary tree, with escapes already removed from its payload.
struct OtbNode {
    byte type{};
    Bytes props;
    std::vector<OtbNode> children;
};

// Decodes the node tree following the 4-byte header. The root node must have type 0 and end the buffer.
[[nodiscard]] OtbNode parse_otb_nodes(gsl::span<const byte> buffer);

// Reads a complete items.otb buffer. Unknown item attributes are skipped.
[[nodiscard]] ServerItemList read_otb(gsl::span<const byte> buffer, Logger &logger);

}
