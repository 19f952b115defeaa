#pragma once

// Primary public header for the railway outcome library.
// Most users should include this header only.

// Outcome value & error model
#include <railway/error.hpp>
#include <railway/exception.hpp>
#include <railway/outcome.hpp>

// Combinators (each accepts an outcome or a pending outcome via `operator|`)
#include <railway/bind.hpp>
#include <railway/bind_if.hpp>
#include <railway/ensure.hpp>
#include <railway/map.hpp>
#include <railway/match.hpp>
#include <railway/tap.hpp>

// Exception capture & scoped resources
#include <railway/disposable.hpp>
#include <railway/try_invoke.hpp>
#include <railway/with_resource.hpp>

// Coroutine host runtime
#include <railway/awaitable.hpp>
#include <railway/co_spawn.hpp>
#include <railway/run_loop.hpp>
#include <railway/sync_wait.hpp>
#include <railway/this_coro.hpp>
