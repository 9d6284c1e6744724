// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "high_score_store.h"

#include <spdlog/spdlog.h>

namespace gridsnake {

HighScoreStore::HighScoreStore(Config& config) : config_(config) {}

void HighScoreStore::load() {
    int stored = config_.get<int>(HIGH_SCORE_KEY, 0);
    high_score_ = stored > 0 ? static_cast<uint32_t>(stored) : 0;
    spdlog::debug("[HighScoreStore] Loaded high score: {}", high_score_);
}

bool HighScoreStore::observe(const RenderableState& state) {
    bool just_ended = state.is_over && !was_over_;
    was_over_ = state.is_over;

    if (!just_ended) {
        return false;
    }

    bool new_high = state.score > high_score_;
    spdlog::info("[HighScoreStore] Game over! Score: {} | Best: {}{}", state.score,
                 new_high ? state.score : high_score_, new_high ? " (NEW!)" : "");
    if (!new_high) {
        return false;
    }

    high_score_ = state.score;
    config_.set<int>(HIGH_SCORE_KEY, static_cast<int>(high_score_));
    if (!config_.save()) {
        spdlog::warn("[HighScoreStore] New high score {} kept in memory only", high_score_);
    }
    return true;
}

} // namespace gridsnake
