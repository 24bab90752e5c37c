#pragma once

#include "tsbatch/v1/remote.pb.h"
#include "tsbatch/v1/ingest.pb.h"

#include "tsbatch/v1/remote_write_service.pb.h"
#include "tsbatch/v1/admin_service.pb.h"

#include "tsbatch/v1/remote_write_service.grpc.pb.h"
#include "tsbatch/v1/admin_service.grpc.pb.h"
