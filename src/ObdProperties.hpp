#pragma once

#include "ThingType.hpp"
#include "common/Byte.hpp"

#include <gsl/span>

#include <cstdint>
#include <stdexcept>

class ByteReader;
class ByteWriter;

namespace otitems {

class ObdError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The client-version independent property vocabulary of OBD object files.
enum class ObdPropertyFlag : uint8_t {
    Ground = 0x00,
    GroundBorder = 0x01,
    OnBottom = 0x02,
    OnTop = 0x03,
    Container = 0x04,
    Stackable = 0x05,
    ForceUse = 0x06,
    MultiUse = 0x07,
    Writable = 0x08,
    WritableOnce = 0x09,
    FluidContainer = 0x0a,
    Fluid = 0x0b,
    Unpassable = 0x0c,
    Unmoveable = 0x0d,
    BlockMissile = 0x0e,
    BlockPathfind = 0x0f,
    NoMoveAnimation = 0x10,
    Pickupable = 0x11,
    Hangable = 0x12,
    HookSouth = 0x13,
    HookEast = 0x14,
    Rotatable = 0x15,
    HasLight = 0x16,
    DontHide = 0x17,
    Translucent = 0x18,
    HasOffset = 0x19,
    HasElevation = 0x1a,
    LyingObject = 0x1b,
    AnimateAlways = 0x1c,
    MiniMap = 0x1d,
    LensHelp = 0x1e,
    FullGround = 0x1f,
    IgnoreLook = 0x20,
    Cloth = 0x21,
    MarketItem = 0x22,
    DefaultAction = 0x23,
    Wrappable = 0x24,
    Unwrappable = 0x25,
    TopEffect = 0x26,
    HasCharges = 0xfc,
    FloorChange = 0xfd,
    Usable = 0xfe,
    LastFlag = 0xff
};

// Reads properties into thing until LastFlag. Throws ObdError on an unknown flag or if the data runs out.
void read_obd_properties(ByteReader &reader, ThingType &thing);
void read_obd_properties(gsl::span<const byte> data, ThingType &thing);

// Writes the properties thing has set, terminated by LastFlag.
void write_obd_properties(ByteWriter &writer, const ThingType &thing);
[[nodiscard]] Bytes write_obd_properties(const ThingType &thing);

}
