// Copyright (c) 2024-2025 palmprep contributors

// This file is part of palmprep

// palmprep is free software: you can redistribute it and/or modify it under
// the terms of the GNU General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option) any
// later version. palmprep is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General
// Public License for more details. You should have received a copy of the GNU
// General Public License along with palmprep. If not, see
// <https://www.gnu.org/licenses/>.

#pragma once
#include <algorithm>
#include <chrono>
#include <memory>
#include <string>

namespace palmprep::io {

  struct TileFetchConfig {
    int timeout_seconds = 120;
    // Retries after the first attempt.
    int max_retries = 3;
    // Delay before the first retry, doubled for every further retry.
    int backoff_ms = 1000;
    int max_backoff_ms = 60000;
    std::string user_agent = "palmprep";
  };

  // The first attempt plus `max_retries` retries.
  inline int attempt_count(const TileFetchConfig& config) {
    return std::max(0, config.max_retries) + 1;
  }

  // Delay before retry number `retry` (counted from 1), capped at
  // `max_backoff_ms`.
  inline std::chrono::milliseconds retry_delay(const TileFetchConfig& config,
                                               int retry) {
    const std::chrono::milliseconds cap{std::max(0, config.max_backoff_ms)};
    std::chrono::milliseconds delay{std::max(0, config.backoff_ms)};
    for (int i = 1; i < retry && delay < cap; ++i) delay *= 2;
    return std::min(delay, cap);
  }

  struct TileFetcherInterface {
    TileFetchConfig config_;

    TileFetcherInterface(TileFetchConfig config) : config_(config){};
    virtual ~TileFetcherInterface() = default;

    // Downloads `url` to `destination`. Only HTTP status 200 is accepted,
    // anything else throws AcquisitionFailure and leaves no file behind.
    virtual void fetch(const std::string& url,
                       const std::string& destination) = 0;
  };

  std::unique_ptr<TileFetcherInterface> createTileFetcherCurl(
      TileFetchConfig config);
}  // namespace palmprep::io
