#pragma once

#include "mprisrelay/v1/player.pb.h"
#include "mprisrelay/v1/pairing.pb.h"
#include "mprisrelay/v1/relay.pb.h"

#include "mprisrelay/v1/pairing.grpc.pb.h"
#include "mprisrelay/v1/relay.grpc.pb.h"
