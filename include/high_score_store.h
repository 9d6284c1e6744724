// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file high_score_store.h
 * @brief Best-score capture outside the engine
 *
 * Watches engine snapshots and persists a new best through Config when a
 * game ends. The engine never writes anything itself.
 */

#pragma once

#include "config.h"
#include "snake_engine.h"

#include <cstdint>

namespace gridsnake {

/// JSON pointer of the persisted best score
constexpr const char* HIGH_SCORE_KEY = "/scores/high_score";

class HighScoreStore {
  public:
    /// @param config Backing configuration; must outlive the store
    explicit HighScoreStore(Config& config);

    /// Read the persisted best score
    void load();

    /**
     * @brief Observe one snapshot
     *
     * Acts only on the transition into game over. A final score above the
     * stored best replaces it and is saved.
     *
     * @return true if this snapshot set a new best
     */
    bool observe(const RenderableState& state);

    uint32_t high_score() const {
        return high_score_;
    }

  private:
    Config& config_;
    uint32_t high_score_ = 0;
    bool was_over_ = false;
};

} // namespace gridsnake
