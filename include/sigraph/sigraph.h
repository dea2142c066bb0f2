/*
 * Public surface of the sigraph reactive engine.
 */

#ifndef SIGRAPH_H
#define SIGRAPH_H

#include <sigraph/sigraph_base.h>
#include <sigraph/runtime/batch_scheduler.h>
#include <sigraph/runtime/dependency_graph.h>
#include <sigraph/runtime/disposal_tracker.h>
#include <sigraph/runtime/observers/reactive_observer.h>
#include <sigraph/runtime/observers/reactive_trace.h>
#include <sigraph/runtime/reactive_context.h>
#include <sigraph/runtime/turn_queue.h>
#include <sigraph/types/computed.h>
#include <sigraph/types/equality.h>
#include <sigraph/types/json_path.h>
#include <sigraph/types/named_collection.h>
#include <sigraph/types/reaction.h>
#include <sigraph/types/signal.h>
#include <sigraph/types/subscription.h>
#include <sigraph/types/watch.h>
#include <sigraph/util/errors.h>

#endif // SIGRAPH_H
