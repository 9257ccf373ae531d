// odx/parse/correlation_resolver.hpp - Correlation usage on Receive shapes
//
#pragma once

#include <cstddef>

namespace odx
{

struct OrchestrationModel;

/**
 * Second pass over a finished tree.
 *
 * For every CorrelationDeclaration in the model (at any depth) and every
 * statement reference with a non-empty OID that names a Receive, the
 * declaration's name is appended to the Receive's initializes or follows
 * list. Names already present are skipped; references to other kinds or to
 * unknown identifiers are ignored.
 *
 * @return Number of names appended
 */
size_t resolve_correlations(OrchestrationModel & model);

}  // namespace odx
