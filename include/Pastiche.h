#ifndef PASTICHE_LIBRARY_H
#define PASTICHE_LIBRARY_H

#include "../src/common/types.hpp"
#include "../src/config/config.hpp"
#include "../src/checkpoint/checkpoint.hpp"
#include "../src/data/data.hpp"
#include "../src/loss/loss.hpp"
#include "../src/metric/metric.hpp"
#include "../src/network/network.hpp"
#include "../src/optimizer/optimizer.hpp"
#include "../src/report/report.hpp"
#include "../src/training/training.hpp"
#include "../src/utils/terminal.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Header-only: every module lives under src/<module>/ with its factory
//    header re-exporting the types and functions of its details/ folder.
//  - Applications include this file and link LibTorch, OpenCV and Boost.

#endif // PASTICHE_LIBRARY_H
