/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of patmux.
 *
 * Copyright (C) 2012-2026 by the patmux developer community.
 * For a full list of authors see the git log.
 */

#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <unistd.h>

#include "patmux/logger.hpp"

namespace logger {

namespace {

std::unique_ptr<std::ostream> file_stream;
std::ostream *stream = nullptr;
pid_t pid;

// the router may be serving on several threads at once
std::mutex stream_mutex;

}

void initialise(const std::string &filename) {
  std::lock_guard<std::mutex> lock(stream_mutex);

  if (filename == "-") {
    file_stream.reset();
    stream = &std::cerr;
  } else {
    file_stream = std::make_unique<std::ofstream>(filename, std::ios_base::out | std::ios_base::app);
    stream = file_stream.get();
  }
  pid = getpid();
}

void message(std::string_view m) {
  std::lock_guard<std::mutex> lock(stream_mutex);

  if (stream) {
    time_t now = time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    *stream << "[" << std::put_time(&utc, "%FT%T") << " #" << pid << "] " << m
            << std::endl;
  }
}

}
