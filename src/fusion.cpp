/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skywatch/fusion.hpp>
#include <skywatch/propagator.hpp>

#include <algorithm>
#include <exception>
#include <mutex>

#include <asio.hpp>
#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::warn;

namespace skywatch {

namespace {

struct FusionCandidate {
    const ElementSet* elementSet;
    const CatalogRecord* catalogRecord;
};

std::optional<LiveStateRecord> fuseOne(const FusionCandidate& candidate, time_point asOf) {
    const ElementSet& set = *candidate.elementSet;
    try {
        GeodeticPosition position = propagate(set, asOf);
        const std::string& name = set.getName().empty()
            ? candidate.catalogRecord->name : set.getName();
        return LiveStateRecord{set.getNoradID(), name, position, *candidate.catalogRecord};
    } catch (const DegenerateElementSet& e) {
        warn("Skipping degenerate element set for {}: {}", set.getNoradID(), e.what());
    } catch (const PropagationError& e) {
        warn("Skipping {}: {}", set.getNoradID(), e.what());
    }
    return std::nullopt;
}

} // namespace

std::vector<LiveStateRecord> fuse(const ElementSetStore& elementSets,
                                  const CatalogStore& catalog,
                                  time_point asOf,
                                  const FusionOptions& options) {
    // Inner join first, so unmatched objects are never propagated
    std::vector<FusionCandidate> candidates;
    candidates.reserve(std::min(elementSets.size(), catalog.size()));
    for (const auto& [id, set] : elementSets) {
        auto match = catalog.find(id);
        if (match != catalog.end()) {
            candidates.push_back({&set, &match->second});
        }
    }
    debug("Fusing {} of {} element sets with the catalog", candidates.size(), elementSets.size());

    // One slot per candidate keeps the output in NORAD ID order however the
    // work is scheduled
    std::vector<std::optional<LiveStateRecord>> results(candidates.size());

    if (options.threads <= 1 || candidates.size() < 2) {
        for (std::size_t i = 0; i < candidates.size(); ++i) {
            results[i] = fuseOne(candidates[i], asOf);
        }
    } else {
        asio::thread_pool pool(options.threads);
        std::mutex failureMutex;
        std::exception_ptr failure;

        for (std::size_t i = 0; i < candidates.size(); ++i) {
            asio::post(pool, [&, i] {
                try {
                    results[i] = fuseOne(candidates[i], asOf);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(failureMutex);
                    if (!failure) failure = std::current_exception();
                }
            });
        }
        pool.join();

        if (failure) {
            std::rethrow_exception(failure);
        }
    }

    std::vector<LiveStateRecord> records;
    records.reserve(results.size());
    for (auto& result : results) {
        if (result) {
            records.push_back(std::move(*result));
        }
    }
    return records;
}

} // namespace skywatch
