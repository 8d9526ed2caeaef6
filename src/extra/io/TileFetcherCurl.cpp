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

#include <cstdio>
#include <curl/curl.h>
#include <filesystem>
#include <fmt/format.h>
#include <palmprep/common/datastructures.hpp>
#include <palmprep/io/TileFetcher.hpp>
#include <palmprep/logger/logger.h>
#include <thread>

namespace palmprep::io {

  namespace fs = std::filesystem;

  namespace {
    size_t write_file_callback(void* contents, size_t size, size_t nmemb,
                               void* userp) {
      return std::fwrite(contents, size, nmemb, static_cast<FILE*>(userp));
    }
  }  // namespace

  struct TileFetcherCurl : public TileFetcherInterface {
    explicit TileFetcherCurl(TileFetchConfig config)
        : TileFetcherInterface(std::move(config)) {
      static bool curl_initialized = false;
      if (!curl_initialized) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        curl_initialized = true;
      }
    }

    void fetch(const std::string& url,
               const std::string& destination) override {
      auto& logger = logger::Logger::get_logger();
      const int attempts = attempt_count(config_);
      for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (attempt > 1) {
          auto delay = retry_delay(config_, attempt - 1);
          logger.debug("Retry {}/{} for {} in {} ms", attempt - 1,
                       attempts - 1, url, delay.count());
          std::this_thread::sleep_for(delay);
        }
        try {
          fetch_once(url, destination);
          return;
        } catch (const AcquisitionFailure& e) {
          // Only transport errors and 5xx responses are worth another try.
          bool retryable = e.status() == 0 || e.status() >= 500;
          if (!retryable || attempt == attempts) throw;
          logger.debug("{}", e.what());
        }
      }
    }

   private:
    void fetch_once(const std::string& url, const std::string& destination) {
      auto parent = fs::path(destination).parent_path();
      if (!parent.empty()) fs::create_directories(parent);

      CURL* curl = curl_easy_init();
      if (!curl) {
        throw AcquisitionFailure("Failed to initialize curl");
      }
      FILE* fp = std::fopen(destination.c_str(), "wb");
      if (!fp) {
        curl_easy_cleanup(curl);
        throw AcquisitionFailure(
            fmt::format("Cannot open {} for writing", destination));
      }

      curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
      curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_file_callback);
      curl_easy_setopt(curl, CURLOPT_WRITEDATA, fp);
      curl_easy_setopt(curl, CURLOPT_TIMEOUT,
                       static_cast<long>(config_.timeout_seconds));
      curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
      curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());

      CURLcode res = curl_easy_perform(curl);
      long response_code = 0;
      curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);
      std::fclose(fp);
      curl_easy_cleanup(curl);

      if (res != CURLE_OK) {
        fs::remove(destination);
        throw AcquisitionFailure(fmt::format("Download of {} failed: {}", url,
                                             curl_easy_strerror(res)));
      }
      if (response_code != 200) {
        fs::remove(destination);
        throw AcquisitionFailure(
            fmt::format("Download of {} failed with HTTP status {}", url,
                        response_code),
            response_code);
      }
    }
  };

  std::unique_ptr<TileFetcherInterface> createTileFetcherCurl(
      TileFetchConfig config) {
    return std::make_unique<TileFetcherCurl>(std::move(config));
  };
}  // namespace palmprep::io
