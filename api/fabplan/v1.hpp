#pragma once

#include "fabplan/v1/types.pb.h"
#include "fabplan/v1/change.pb.h"
#include "fabplan/v1/catalog.pb.h"
#include "fabplan/v1/flow.pb.h"
