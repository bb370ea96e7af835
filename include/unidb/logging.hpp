// Copyright (c) 2026 The unidb Authors. MIT License.
//
// unidb::Log -- the library's diagnostics sink.
//
// A single spdlog logger named "unidb" writing to stderr. Applications can
// register their own "unidb" logger before first use to redirect output.

#pragma once

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace unidb {

inline std::shared_ptr<spdlog::logger> Log() {
  static std::shared_ptr<spdlog::logger> logger = [] {
    std::shared_ptr<spdlog::logger> l = spdlog::get("unidb");
    if (l == nullptr) {
      l = spdlog::stderr_color_mt("unidb");
      l->set_level(spdlog::level::debug);
    }
    return l;
  }();
  return logger;
}

}  // namespace unidb
