#ifndef TOPK_RECOMMEND_TIMEMEMORY_HPP
#define TOPK_RECOMMEND_TIMEMEMORY_HPP

#include <sys/resource.h>
#include <unistd.h>
#include <chrono>
#include <cstdio>
#include <cstddef>

namespace TopkRecommend {
    class TimeRecord {
        std::chrono::steady_clock::time_point time_begin;
    public:
        TimeRecord() {
            time_begin = std::chrono::steady_clock::now();
        }

        double get_elapsed_time_second() const {
            std::chrono::steady_clock::time_point time_end = std::chrono::steady_clock::now();
            std::chrono::duration<double> diff = time_end - time_begin;
            return diff.count();
        }

        void reset() {
            time_begin = std::chrono::steady_clock::now();
        }

    };

    // peak resident set size, in byte
    inline size_t get_peak_RSS() {
        struct rusage rusage{};
        getrusage(RUSAGE_SELF, &rusage);
        return (size_t) rusage.ru_maxrss * 1024L;
    }

    // current resident set size, in byte, 0 if /proc is unavailable
    inline size_t get_current_RSS() {
        long rss = 0L;
        FILE *fp = fopen("/proc/self/statm", "r");
        if (fp == nullptr) {
            return (size_t) 0L;
        }
        if (fscanf(fp, "%*s%ld", &rss) != 1) {
            fclose(fp);
            return (size_t) 0L;
        }
        fclose(fp);
        return (size_t) rss * (size_t) sysconf(_SC_PAGESIZE);
    }
}
#endif //TOPK_RECOMMEND_TIMEMEMORY_HPP
