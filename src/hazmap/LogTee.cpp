#include "hazmap/LogTee.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <streambuf>
#include <system_error>

namespace hazmap {

namespace {

std::filesystem::path RotatedPath(const std::filesystem::path& base, int idx)
{
  if (idx <= 0) return base;
  std::filesystem::path p = base;
  p += "." + std::to_string(idx);
  return p;
}

std::string UtcTimestamp()
{
  using clock = std::chrono::system_clock;
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now().time_since_epoch());
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(ms);

  const std::time_t tt = static_cast<std::time_t>(secs.count());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03lldZ", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>((ms - secs).count()));
  return std::string(buf);
}

// State shared by the stdout and stderr tees (one file, one line-start flag).
struct SharedFile {
  std::streambuf* buf = nullptr;
  std::mutex mutex;
  bool atLineStart = true;
  bool prefixLines = true;
};

class TeeBuf final : public std::streambuf {
public:
  TeeBuf(std::streambuf* console, SharedFile* file, const char* tag) : m_console(console), m_file(file), m_tag(tag) {}

protected:
  int overflow(int ch) override
  {
    if (ch == traits_type::eof()) return traits_type::not_eof(ch);
    const char c = static_cast<char>(ch);
    return (xsputn(&c, 1) == 1) ? ch : traits_type::eof();
  }

  std::streamsize xsputn(const char* s, std::streamsize n) override
  {
    if (!m_console || !m_file || n <= 0) return 0;
    std::scoped_lock<std::mutex> lock(m_file->mutex);

    const std::streamsize written = m_console->sputn(s, n);
    writeFileLocked(s, n);
    // The console is authoritative for stream state; a failing log file never
    // breaks program output.
    return written;
  }

  int sync() override
  {
    if (!m_console || !m_file) return 0;
    std::scoped_lock<std::mutex> lock(m_file->mutex);
    const int rc = m_console->pubsync();
    m_file->buf->pubsync();
    return rc;
  }

private:
  void writeFileLocked(const char* s, std::streamsize n)
  {
    std::streambuf* out = m_file->buf;
    if (!m_file->prefixLines) {
      out->sputn(s, n);
      return;
    }

    const char* p = s;
    const char* end = s + n;
    while (p < end) {
      if (m_file->atLineStart) {
        const std::string prefix = UtcTimestamp() + " [" + m_tag + "] ";
        out->sputn(prefix.data(), static_cast<std::streamsize>(prefix.size()));
        m_file->atLineStart = false;
      }

      const char* nl = static_cast<const char*>(std::memchr(p, '\n', static_cast<std::size_t>(end - p)));
      const std::streamsize chunk =
          nl ? static_cast<std::streamsize>(nl - p + 1) : static_cast<std::streamsize>(end - p);
      if (out->sputn(p, chunk) != chunk) return;
      p += chunk;

      if (nl) {
        m_file->atLineStart = true;
        out->pubsync();
      }
    }
  }

  std::streambuf* m_console = nullptr;
  SharedFile* m_file = nullptr;
  std::string m_tag;
};

} // namespace

struct LogTee::Impl {
  std::ofstream file;
  std::filesystem::path path;
  SharedFile shared;

  std::streambuf* origCout = nullptr;
  std::streambuf* origCerr = nullptr;
  std::unique_ptr<TeeBuf> coutBuf;
  std::unique_ptr<TeeBuf> cerrBuf;
};

LogTee::LogTee() = default;

LogTee::~LogTee()
{
  stop();
}

const std::filesystem::path& LogTee::path() const
{
  static const std::filesystem::path kEmpty;
  return m_impl ? m_impl->path : kEmpty;
}

bool LogTee::Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError)
{
  outError.clear();
  if (keepFiles <= 0) return true;

  std::error_code ec;
  for (int i = keepFiles; i >= 1; --i) {
    const std::filesystem::path dst = RotatedPath(basePath, i);
    const std::filesystem::path src = RotatedPath(basePath, i - 1);
    if (!std::filesystem::exists(src, ec)) continue;

    std::filesystem::remove(dst, ec);
    std::filesystem::rename(src, dst, ec);
    if (ec) {
      outError = "failed to rotate log '" + src.string() + "' -> '" + dst.string() + "': " + ec.message();
      return false;
    }
  }
  return true;
}

bool LogTee::start(const LogTeeOptions& opt, std::string& outError)
{
  outError.clear();
  stop();

  if (opt.path.empty()) {
    outError = "log path is empty";
    return false;
  }

  std::error_code ec;
  const std::filesystem::path parent = opt.path.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      outError = "failed to create log directory '" + parent.string() + "': " + ec.message();
      return false;
    }
  }

  if (!Rotate(opt.path, opt.keepFiles, outError)) return false;

  auto impl = std::make_unique<Impl>();
  impl->path = opt.path;
  impl->file.open(opt.path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!impl->file) {
    outError = "unable to open log file for writing: " + opt.path.string();
    return false;
  }
  if (!opt.header.empty()) impl->file << opt.header << '\n';

  impl->shared.buf = impl->file.rdbuf();
  impl->shared.prefixLines = opt.prefixLines;

  if (opt.teeStdout) {
    impl->origCout = std::cout.rdbuf();
    impl->coutBuf = std::make_unique<TeeBuf>(impl->origCout, &impl->shared, "OUT");
    std::cout.rdbuf(impl->coutBuf.get());
  }
  if (opt.teeStderr) {
    impl->origCerr = std::cerr.rdbuf();
    impl->cerrBuf = std::make_unique<TeeBuf>(impl->origCerr, &impl->shared, "ERR");
    std::cerr.rdbuf(impl->cerrBuf.get());
  }

  m_impl = std::move(impl);
  return true;
}

void LogTee::stop()
{
  if (!m_impl) return;

  // Restore the console buffers before the file goes away.
  if (m_impl->origCout && std::cout.rdbuf() == m_impl->coutBuf.get()) std::cout.rdbuf(m_impl->origCout);
  if (m_impl->origCerr && std::cerr.rdbuf() == m_impl->cerrBuf.get()) std::cerr.rdbuf(m_impl->origCerr);

  m_impl->file.flush();
  m_impl.reset();
}

} // namespace hazmap
