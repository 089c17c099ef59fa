/***
 * Name: labelkit (umbrella)
 * Purpose: Single include for collaborators of the labeling library.
 */
#pragma once

#include "labelkit/config/label_options.h"
#include "labelkit/context/context_stack.h"
#include "labelkit/counter/counter_registry.h"
#include "labelkit/label/auto_label.h"
#include "labelkit/label/label.h"
#include "labelkit/label/validate.h"
#include "labelkit/scope/label_environment.h"
#include "labelkit/scope/label_scope.h"
