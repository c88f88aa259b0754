#pragma once

#include "epg/guide/v1/types.pb.h"

#include "epg/guide/v1/admin_service.pb.h"
#include "epg/guide/v1/guide_service.pb.h"

#include "epg/guide/v1/admin_service.grpc.pb.h"
#include "epg/guide/v1/guide_service.grpc.pb.h"
