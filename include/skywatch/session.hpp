/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYWATCH_SESSION_HPP
#define __SKYWATCH_SESSION_HPP

#include <skywatch/catalog.hpp>
#include <skywatch/elements.hpp>
#include <skywatch/fusion.hpp>
#include <skywatch/mission.hpp>
#include <skywatch/trajectory.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <vector>

namespace skywatch {

/**
 * A consistent view of both stores.
 */
struct StoreSnapshot {
    std::shared_ptr<const ElementSetStore> elementSets;
    std::shared_ptr<const CatalogStore> catalog;
    std::uint64_t version = 0;
};

/**
 * Everything known about one selected object.
 */
struct TargetReport {
    LiveStateRecord record;
    std::vector<TrackPoint> track;
    MissionClass missionClass = MissionClass::Unknown;
};

/**
 * Holds the current catalog and element set store, and runs tracking
 * cycles against them.
 *
 * Stores are replaced whole. A cycle takes one snapshot up front and works
 * from it, so a refresh that lands mid-cycle is only seen by the next one.
 * The lock is held just long enough to copy the two pointers.
 */
class TrackingSession {
public:
    TrackingSession();

    void setCatalog(CatalogStore catalog);
    void setElementSets(ElementSetStore elementSets);

    /**
     * Current stores. The version increases every time either store is set.
     */
    StoreSnapshot snapshot() const;

    /**
     * Fused live state of every tracked object at `asOf`.
     */
    std::vector<LiveStateRecord> cycle(time_point asOf, const FusionOptions& options = {}) const;

    /**
     * Live state, ground track and mission class of one object.
     *
     * @return Nothing if the object isn't in both stores or can't be
     *         propagated to `asOf`
     * @throws InvalidSamplingWindow if the track window is not usable
     */
    std::optional<TargetReport> report(int noradID, time_point asOf,
                                       const TrackOptions& trackOptions = {},
                                       std::stop_token stop = {}) const;

private:
    mutable std::mutex mutex;
    std::shared_ptr<const ElementSetStore> elementSets;
    std::shared_ptr<const CatalogStore> catalog;
    std::uint64_t version = 0;
};

} // namespace skywatch

#endif // __SKYWATCH_SESSION_HPP
