#pragma once

// Umbrella header for embedding the decision-tree engine.

#include "arbiter/branch_matcher.h"
#include "arbiter/catalog.h"
#include "arbiter/diagnostics.h"
#include "arbiter/errors.h"
#include "arbiter/evaluator.h"
#include "arbiter/input_resolver.h"
#include "arbiter/operator_registry.h"
#include "arbiter/render.h"
#include "arbiter/tree.h"
#include "arbiter/tree_loader.h"
#include "arbiter/value.h"
#include "arbiter/version.h"
