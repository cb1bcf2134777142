#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. codechunk_core/types/chunk.hpp),
// users can simply do `#include "codechunk_core/types.hpp"`.
//
#include "codechunk_core/types/file_record.hpp"
#include "codechunk_core/types/chunk.hpp"
