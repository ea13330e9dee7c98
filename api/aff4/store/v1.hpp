#pragma once

#include "aff4/store/v1/client.pb.h"
#include "aff4/store/v1/paths.pb.h"
#include "aff4/store/v1/value.pb.h"
