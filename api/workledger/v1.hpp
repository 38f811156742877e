#pragma once

#include "workledger/v1/types.pb.h"

namespace workledger::v1 {
// Enum helpers generated by protoc live next to the enums themselves:
//   RequestStatus_Name(), RequestStatus_IsValid(), ...
}
