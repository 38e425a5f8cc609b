#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace hazmap {

// RAII helper that duplicates std::cout/std::cerr into a log file.
//
// The command-line tools report progress on stdout and degraded zones on stderr;
// `--log <path>` keeps a timestamped copy of both. Console output is unchanged.
//
// Rotation: <log> -> <log>.1 -> <log>.2 ... up to keepFiles backups.

struct LogTeeOptions {
  std::filesystem::path path;

  // keepFiles=0 disables rotation (an existing file is truncated).
  int keepFiles = 3;

  bool teeStdout = true;
  bool teeStderr = true;

  // Prefix each log-file line with a UTC timestamp and a stream tag:
  //   2026-03-02T09:15:04.120Z [ERR] zone 4: raster unavailable
  bool prefixLines = true;

  // Optional first line written to the file (e.g. tool name + version).
  std::string header;
};

class LogTee {
public:
  LogTee();
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Start logging (stops a previous session first).
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restore the original stream buffers and close the file.
  void stop();

  bool active() const { return m_impl != nullptr; }
  const std::filesystem::path& path() const;

  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace hazmap
