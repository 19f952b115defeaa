#pragma once

// Out-of-line definitions. Included by exactly one translation unit (src/railway.cpp).

#include <railway/impl/assert.ipp>
#include <railway/impl/error.ipp>
#include <railway/impl/exception.ipp>
#include <railway/impl/run_loop.ipp>
