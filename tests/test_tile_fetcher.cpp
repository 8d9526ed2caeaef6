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


#include <palmprep/io/TileFetcher.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace palmprep::io;
using std::chrono::milliseconds;

TEST_CASE("Retries come on top of the first attempt") {
  TileFetchConfig config;
  config.max_retries = 0;
  CHECK(attempt_count(config) == 1);
  config.max_retries = 1;
  CHECK(attempt_count(config) == 2);
  config.max_retries = 3;
  CHECK(attempt_count(config) == 4);
  config.max_retries = -2;
  CHECK(attempt_count(config) == 1);
}

TEST_CASE("Backoff doubles per retry") {
  TileFetchConfig config;
  config.backoff_ms = 1000;
  CHECK(retry_delay(config, 1) == milliseconds(1000));
  CHECK(retry_delay(config, 2) == milliseconds(2000));
  CHECK(retry_delay(config, 3) == milliseconds(4000));
}

TEST_CASE("Backoff is capped for long retry chains") {
  TileFetchConfig config;
  config.backoff_ms = 1000;
  config.max_backoff_ms = 60000;
  CHECK(retry_delay(config, 7) == milliseconds(60000));
  // a shift by this many bits would overflow an int
  CHECK(retry_delay(config, 40) == milliseconds(60000));
  CHECK(retry_delay(config, 1000) == milliseconds(60000));

  config.backoff_ms = 0;
  CHECK(retry_delay(config, 40) == milliseconds(0));
}
