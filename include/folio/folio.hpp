#pragma once

/**
 * folio
 *
 * An embedded, single-file, page-organized document store.
 */

#include <folio/core_types.hpp>
#include <folio/document.hpp>
#include <folio/result.hpp>
#include <folio/collection.hpp>
#include <folio/util/logger.hpp>
