#pragma once
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <mpi.h>
#include <string>
#include <string_view>
#include <utility>

/**
 * @file Log.hpp
 * @brief printf-style levelled logging to stderr.
 *
 * @details
 * Verbosity comes from :cpp:struct:`objreg::logx::Config` or, when the caller leaves it at
 * ``Info``, from the ``OBJREG_LOG`` environment variable
 * (``quiet|error|warn|info|debug``). When MPI is initialised, messages from non-zero ranks carry
 * an ``[rN]`` tag and INFO/DEBUG can be gated to rank 0 so parallel runs stay readable.
 * A :cpp:class:`objreg::logx::Scope` sets the registry path (or any label) printed in front of
 * every message emitted while it is alive.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   objreg::logx::init({objreg::logx::Level::Info, true});
 *   LOGI("[case] %zu regions\n", n);
 *   LOGD("[registry] insert '%s'\n", key.c_str());
 * @endrst
 */

namespace objreg::logx
{

enum class Level : int
{
    Quiet = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Debug = 4
};

struct Config
{
    Level level = Level::Info; // Info defers to OBJREG_LOG
    bool rank0_only = false;   // gate INFO/DEBUG to rank 0
};

inline int g_rank = 0;
inline std::atomic<Level> g_level{Level::Info};
inline std::atomic<bool> g_rank0_only{false};

// Label of the innermost live Scope on this thread, empty outside any Scope.
inline thread_local std::string g_context;

inline const std::string& context() noexcept
{
    return g_context;
}

// Sets the context label for its lifetime and restores the enclosing one afterwards.
class Scope
{
  public:
    explicit Scope(std::string label) : prev_(std::exchange(g_context, std::move(label))) {}
    ~Scope() { g_context = std::move(prev_); }

    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

  private:
    std::string prev_;
};

// Unknown strings map to Info.
inline Level parse_level(std::string_view v)
{
    std::string s(v);
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "quiet")
        return Level::Quiet;
    if (s == "error")
        return Level::Error;
    if (s == "warn" || s == "warning")
        return Level::Warn;
    if (s == "debug" || s == "full")
        return Level::Debug;
    return Level::Info;
}

inline Level level_from_env()
{
    const char* v = std::getenv("OBJREG_LOG");
    return v ? parse_level(v) : Level::Info;
}

inline void init(const Config& cfg = {})
{
    int inited = 0;
    MPI_Initialized(&inited);
    if (inited)
        MPI_Comm_rank(MPI_COMM_WORLD, &g_rank);

    g_level.store(cfg.level == Level::Info ? level_from_env() : cfg.level);
    g_rank0_only.store(cfg.rank0_only);
}

inline void set_level(Level L)
{
    g_level.store(L);
}
inline Level level()
{
    return g_level.load();
}

inline const char* level_name(Level L)
{
    switch (L)
    {
    case Level::Quiet:
        return "quiet";
    case Level::Error:
        return "error";
    case Level::Warn:
        return "warn";
    case Level::Info:
        return "info";
    case Level::Debug:
        return "debug";
    }
    return "info";
}

inline const char* level_tag(Level L)
{
    switch (L)
    {
    case Level::Error:
        return "[error] ";
    case Level::Warn:
        return "[warn ] ";
    case Level::Info:
        return "[info ] ";
    case Level::Debug:
        return "[debug] ";
    default:
        return "";
    }
}

// true = suppress
inline bool gate(Level L)
{
    if (L > g_level.load())
        return true;
    if (g_rank0_only.load() && g_rank != 0 && L >= Level::Info)
        return true;
    return false;
}

inline void vprint(Level L, const char* fmt, va_list ap)
{
    if (gate(L))
        return;
    std::fputs(level_tag(L), stderr);
    if (g_rank != 0)
        std::fprintf(stderr, "[r%d] ", g_rank);
    if (!g_context.empty())
        std::fprintf(stderr, "[%s] ", g_context.c_str());
    std::vfprintf(stderr, fmt, ap);
    std::fflush(stderr);
}

inline void print(Level L, const char* fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    vprint(L, fmt, ap);
    va_end(ap);
}

#define LOGD(...) ::objreg::logx::print(::objreg::logx::Level::Debug, __VA_ARGS__)
#define LOGI(...) ::objreg::logx::print(::objreg::logx::Level::Info, __VA_ARGS__)
#define LOGW(...) ::objreg::logx::print(::objreg::logx::Level::Warn, __VA_ARGS__)
#define LOGE(...) ::objreg::logx::print(::objreg::logx::Level::Error, __VA_ARGS__)

} // namespace objreg::logx
