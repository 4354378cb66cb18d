#pragma once
#include "worktree/core/Action.hpp"
#include "worktree/core/ContractViolation.hpp"
#include "worktree/core/Error.hpp"
#include "worktree/core/Lifetime.hpp"
#include "worktree/core/Sink.hpp"
#include "worktree/core/Workflow.hpp"
#include "worktree/runtime/AnyWorkflow.hpp"
#include "worktree/runtime/Debugging.hpp"
#include "worktree/runtime/HostOptions.hpp"
#include "worktree/runtime/Node.hpp"
#include "worktree/runtime/Observer.hpp"
#include "worktree/runtime/RenderContext.hpp"
#include "worktree/runtime/RuntimeConfiguration.hpp"
#include "worktree/runtime/StateMutationSink.hpp"
#include "worktree/runtime/WorkflowHost.hpp"
#include "worktree/task/TaskPool.hpp"
#include "worktree/worker/AsyncOperationWorker.hpp"
#include "worktree/worker/CallbackWorker.hpp"
#include "worktree/worker/StreamWorker.hpp"
#include "worktree/worker/TimerWorker.hpp"
#include "worktree/worker/Worker.hpp"
#include "worktree/workflows/RenderLatestOutputWorkflow.hpp"
