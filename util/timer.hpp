#pragma once
#include <chrono>
#include <cstdio>
#include <string>

namespace numsort
{
    //
    // === PhaseTimer ============================================================
    // Measures one pipeline phase. On destruction the humanized duration is stored
    // in the Report field handed to the constructor.
    //
    class PhaseTimer
    {
    public:
        using clock = std::chrono::steady_clock;

        explicit PhaseTimer(std::string &target) : target_(target), t0_(clock::now()) {}
        ~PhaseTimer() { target_ = humanize(elapsed()); }

        PhaseTimer(const PhaseTimer &) = delete;
        PhaseTimer &operator=(const PhaseTimer &) = delete;

        std::chrono::nanoseconds elapsed() const
        {
            return std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - t0_);
        }

        // "812 ns", "3.204 ms", "1.500 s"
        static std::string humanize(std::chrono::nanoseconds duration)
        {
            const long long ns = duration.count();
            char buf[32];
            if (ns < 1'000)
                std::snprintf(buf, sizeof(buf), "%lld ns", ns);
            else if (ns < 1'000'000)
                std::snprintf(buf, sizeof(buf), "%.3f µs", ns / 1e3);
            else if (ns < 1'000'000'000)
                std::snprintf(buf, sizeof(buf), "%.3f ms", ns / 1e6);
            else
                std::snprintf(buf, sizeof(buf), "%.3f s", ns / 1e9);
            return std::string(buf);
        }

    private:
        std::string &target_;
        clock::time_point t0_;
    };
}
