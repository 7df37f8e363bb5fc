#pragma once

/**
 * minirel
 *
 * A teaching relational storage engine: paged files, a buffer pool with
 * LRU or clock eviction, slotted table heaps and rebuildable B+ tree indexes.
 */

#include <minirel/types.hpp>
#include <minirel/value.hpp>
#include <minirel/storage_engine.hpp>
