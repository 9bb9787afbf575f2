/**
 * @file qbm/apidoc/apidoc.h
 * @brief Main include file for the qbm-apidoc module.
 *
 * qbm-apidoc builds OpenAPI operation documentation alongside HTTP route registration:
 * every typed handler registered on an `ApiMethodRouter` contributes its request shape
 * and its possible responses, transforms refine the result, and the per-path records are
 * drained into `openapi::PathItem`s and assembled by `openapi::DocumentGenerator`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup ApiDoc
 */
#pragma once

#include "./types.h"
#include "./error.h"
#include "./logger.h"
#include "./gen/context.h"
#include "./http/message.h"
#include "./http/method_router.h"
#include "./openapi/response.h"
#include "./openapi/responses.h"
#include "./openapi/operation.h"
#include "./openapi/path_item.h"
#include "./openapi/document.h"
#include "./operation/operation_io.h"
#include "./operation/handler.h"
#include "./operation/adapters.h"
#include "./operation/transform.h"
#include "./routing/path_pattern.h"
#include "./routing/api_method_router.h"
#include "./routing/api_router.h"
