/*************************************************************************/
/*  otitems OpenTibia server item tools                                  */
/*  (C) 2026 otitems Development Team                                    */
/*************************************************************************/
#pragma once

#include "ServerItemList.hpp"
#include "common/Byte.hpp"

namespace otitems {

// Serialises the list as an items.otb buffer. Items are written in ascending id order, so the same list always
// produces the same bytes.
[[nodiscard]] Bytes write_otb(const ServerItemList &items);

}
