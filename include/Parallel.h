/**
 * @file Parallel.h
 * @brief Block-partitioned fork/join helper used by the image passes.
 */
#pragma once

#include <cstddef>
#include <functional>

// Number of workers parallelFor splits across (hardware threads minus one for the UI, at least 1).
int workerCount();

// Override the worker count; values < 1 restore the hardware default. Tests pin this to 1.
void setWorkerCount(int n);

// Run fn(begin, end, workerIndex) over [0, n) in contiguous blocks, joining before return.
// Exceptions thrown by a block are rethrown on the calling thread after all blocks finish.
void parallelFor(std::size_t n, const std::function<void(std::size_t, std::size_t, int)>& fn);
