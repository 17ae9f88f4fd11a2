#pragma once

#include "ragctx/v1/document.pb.h"
#include "ragctx/v1/context.pb.h"
#include "ragctx/v1/maintenance.pb.h"
