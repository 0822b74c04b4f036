#pragma once

#include "coord/v1/types.pb.h"
#include "coord/v1/coordination.pb.h"

namespace coord::v1 {
// Generated message types live directly in coord::v1; this header is the
// single include for the wire types used by the service and tool layers.
}
