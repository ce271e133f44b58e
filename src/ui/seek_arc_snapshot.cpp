// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "seek_arc_snapshot.h"

#include <spdlog/spdlog.h>

#include <cstdint>

namespace arcseek {

namespace {
constexpr const char* KEY_PROGRESS_ANGLE = "progress_angle";
}

nlohmann::json SeekArcSnapshot::to_json() const {
    return nlohmann::json{{KEY_PROGRESS_ANGLE, progress_angle_fp}};
}

std::optional<SeekArcSnapshot> SeekArcSnapshot::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains(KEY_PROGRESS_ANGLE)) {
        spdlog::warn("[SeekArcSnapshot] Missing '{}' in state object", KEY_PROGRESS_ANGLE);
        return std::nullopt;
    }

    const auto& value = j[KEY_PROGRESS_ANGLE];
    if (!value.is_number_integer()) {
        spdlog::warn("[SeekArcSnapshot] '{}' is not an integer: {}", KEY_PROGRESS_ANGLE,
                     value.dump());
        return std::nullopt;
    }

    bool in_range = value.is_number_unsigned()
                        ? value.get<uint64_t>() <= static_cast<uint64_t>(INT32_MAX)
                        : value.get<int64_t>() >= INT32_MIN && value.get<int64_t>() <= INT32_MAX;
    if (!in_range) {
        spdlog::warn("[SeekArcSnapshot] '{}' out of range: {}", KEY_PROGRESS_ANGLE, value.dump());
        return std::nullopt;
    }

    SeekArcSnapshot snapshot;
    snapshot.progress_angle_fp = value.get<int32_t>();
    return snapshot;
}

std::string SeekArcSnapshot::encode() const {
    return to_json().dump();
}

std::optional<SeekArcSnapshot> SeekArcSnapshot::decode(std::string_view text) {
    try {
        return from_json(nlohmann::json::parse(text.begin(), text.end()));
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("[SeekArcSnapshot] Failed to parse state: {}", e.what());
        return std::nullopt;
    }
}

} // namespace arcseek
