// json_ivm.h - Convenience header pulling in the whole public API

#pragma once

#include <json_ivm/json_ivm_config.h>
#include <json_ivm/api.h>
#include <json_ivm/errors.h>
#include <json_ivm/options.h>
#include <json_ivm/value.h>
#include <json_ivm/path.h>
#include <json_ivm/depth.h>
#include <json_ivm/merge.h>
#include <json_ivm/array_locator.h>
#include <json_ivm/array_ops.h>
#include <json_ivm/batch.h>
#include <json_ivm/identifier.h>
