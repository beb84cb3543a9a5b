/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYWATCH_FUSION_HPP
#define __SKYWATCH_FUSION_HPP

#include <skywatch/catalog.hpp>
#include <skywatch/elements.hpp>
#include <skywatch/geodesy.hpp>

#include <optional>
#include <string>
#include <vector>

namespace skywatch {

/**
 * Live position of a tracked object joined with its catalog metadata.
 */
struct LiveStateRecord {
    int noradID;
    std::string name;
    GeodeticPosition position;
    std::optional<CatalogRecord> catalog;
};

struct FusionOptions {
    // Worker threads for propagation; 0 or 1 propagates on the calling thread
    unsigned int threads = 1;
};

/**
 * Propagate every element set to `asOf` and join the positions with the
 * catalog by NORAD ID.
 *
 * Only identifiers present in both stores produce a record. Element sets
 * that fail to propagate are logged and left out. Records are ordered by
 * NORAD ID, and the result doesn't depend on the number of threads.
 */
std::vector<LiveStateRecord> fuse(const ElementSetStore& elementSets,
                                  const CatalogStore& catalog,
                                  time_point asOf,
                                  const FusionOptions& options = {});

} // namespace skywatch

#endif // __SKYWATCH_FUSION_HPP
