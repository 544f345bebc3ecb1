// @include/flowstore/flowstore.h
#pragma once

// Public surface of the flowstore library.
#include "types.h"
#include "config.h"
#include "storage_engine.h"
#include "storage_error/exceptions.h"
#include "storage_error/error_utils.h"
