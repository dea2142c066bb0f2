/*
 * The core imports for sigraph. Include this first so the formatting support and export macros are always
 * available in the same order.
 */

#ifndef SIGRAPH_BASE_H
#define SIGRAPH_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <sigraph/sigraph_export.h>
#include <sigraph/sigraph_forward_declarations.h>

#endif // SIGRAPH_BASE_H
