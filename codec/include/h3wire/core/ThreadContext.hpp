#pragma once

#include <array>
#include <cstdio>
#include <string_view>

#if defined(__linux__)
#include <sys/syscall.h> // SYS_gettid
#include <unistd.h>      // syscall, getpid
#endif

namespace h3wire::core
{

/// 로그 prefix용 스레드 메타데이터(thread_local 캐시).
/// - 태그: 메인 스레드(tid == pid)는 "main", 나머지는 "t<tid>"
class ThreadContext
{
  public:
    // syscall 매번 호출하지 않도록 스레드당 1회만 계산
    [[nodiscard]] static long currentTid() noexcept
    {
        thread_local long tid = computeTid_();
        return tid;
    }

    [[nodiscard]] static std::string_view currentThreadTag() noexcept
    {
        thread_local std::array<char, 24> buf{};
        if (buf[0] == '\0')
        {
            const long t = currentTid();
            if (t == 0 || t == mainTid_())
                std::snprintf(buf.data(), buf.size(), "main");
            else
                std::snprintf(buf.data(), buf.size(), "t%ld", t);
        }
        return std::string_view{buf.data()};
    }

  private:
    static long computeTid_() noexcept
    {
#if defined(__linux__)
        return static_cast<long>(::syscall(SYS_gettid));
#else
        return 0;
#endif
    }

    static long mainTid_() noexcept
    {
#if defined(__linux__)
        return static_cast<long>(::getpid());
#else
        return 0;
#endif
    }
};

[[nodiscard]] inline long tid() noexcept
{
    return ThreadContext::currentTid();
}
[[nodiscard]] inline std::string_view ttag() noexcept
{
    return ThreadContext::currentThreadTag();
}

} // namespace h3wire::core
