#pragma once

/// Convenience umbrella header for the splot library.

#include <splot/cache/cache_file.hpp>
#include <splot/cache/resolver.hpp>
#include <splot/cache/store.hpp>
#include <splot/core/error.hpp>
#include <splot/core/table.hpp>
#include <splot/multi/orchestrator.hpp>
#include <splot/parser/opseq.hpp>
#include <splot/plot/gnuplot.hpp>
#include <splot/runtime/csv.hpp>
#include <splot/runtime/driver.hpp>
#include <splot/runtime/dump.hpp>
#include <splot/runtime/pipeline.hpp>
#include <splot/runtime/transforms.hpp>
