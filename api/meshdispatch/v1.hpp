#pragma once

#include "meshdispatch/v1/envelope.pb.h"
#include "meshdispatch/v1/types.pb.h"

#include "meshdispatch/services/v1/dispatch_service.pb.h"

#include "meshdispatch/services/v1/dispatch_service.grpc.pb.h"

namespace meshdispatch::v1 {
using namespace ::meshdispatch::services::v1;
}
