// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace arcseek {

/**
 * @brief Persisted seek arc state
 *
 * Only the animator target angle is stored (fixed point, degrees × 100). On restore the
 * angle is clamped into the arc's current sweep and progress is recomputed from it, so a
 * snapshot survives range and sweep changes and keeps the exact drift position.
 *
 * Wire format: {"progress_angle": <int>}
 */
struct SeekArcSnapshot {
    static constexpr int32_t ANGLE_MULTIPLIER = 100;

    int32_t progress_angle_fp = 0;

    [[nodiscard]] float progress_angle() const {
        return static_cast<float>(progress_angle_fp) / ANGLE_MULTIPLIER;
    }

    [[nodiscard]] nlohmann::json to_json() const;

    /// nullopt if the object lacks an integer "progress_angle"
    static std::optional<SeekArcSnapshot> from_json(const nlohmann::json& j);

    /// Compact JSON text
    [[nodiscard]] std::string encode() const;

    /// nullopt (with a warning) on malformed text
    static std::optional<SeekArcSnapshot> decode(std::string_view text);

    bool operator==(const SeekArcSnapshot& o) const {
        return progress_angle_fp == o.progress_angle_fp;
    }
};

} // namespace arcseek
