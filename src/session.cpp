/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skywatch/session.hpp>
#include <skywatch/propagator.hpp>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace skywatch {

TrackingSession::TrackingSession()
    : elementSets(std::make_shared<const ElementSetStore>()),
      catalog(std::make_shared<const CatalogStore>()) {}

void TrackingSession::setCatalog(CatalogStore newCatalog) {
    auto next = std::make_shared<const CatalogStore>(std::move(newCatalog));
    std::scoped_lock lock(mutex);
    catalog = std::move(next);
    version++;
    debug("Catalog replaced ({} records), version {}", catalog->size(), version);
}

void TrackingSession::setElementSets(ElementSetStore newElementSets) {
    auto next = std::make_shared<const ElementSetStore>(std::move(newElementSets));
    std::scoped_lock lock(mutex);
    elementSets = std::move(next);
    version++;
    debug("Element sets replaced ({} sets), version {}", elementSets->size(), version);
}

StoreSnapshot TrackingSession::snapshot() const {
    std::scoped_lock lock(mutex);
    return StoreSnapshot{elementSets, catalog, version};
}

std::vector<LiveStateRecord> TrackingSession::cycle(time_point asOf, const FusionOptions& options) const {
    StoreSnapshot current = snapshot();
    return fuse(*current.elementSets, *current.catalog, asOf, options);
}

std::optional<TargetReport> TrackingSession::report(int noradID, time_point asOf,
                                                    const TrackOptions& trackOptions,
                                                    std::stop_token stop) const {
    // A bad window is the caller's error, whether or not the object exists
    sampleCount(trackOptions.horizonMinutes, trackOptions.stepMinutes);

    StoreSnapshot current = snapshot();
    auto set = current.elementSets->find(noradID);
    auto record = current.catalog->find(noradID);
    if (set == current.elementSets->end() || record == current.catalog->end()) {
        return std::nullopt;
    }

    // Fuse just this object so the record matches what a full cycle produces
    ElementSetStore selectedSet{{noradID, set->second}};
    CatalogStore selectedRecord{{noradID, record->second}};
    std::vector<LiveStateRecord> fused = fuse(selectedSet, selectedRecord, asOf);
    if (fused.empty()) {
        return std::nullopt;
    }

    TargetReport report;
    report.record = std::move(fused.front());
    report.missionClass = classify(record->second);
    GroundTrack track = sampleTrack(set->second, asOf,
                                    trackOptions.horizonMinutes, trackOptions.stepMinutes);
    report.track = track.collect(stop);
    return report;
}

} // namespace skywatch
