#pragma once

#include "struct/RecommendError.hpp"
#include "struct/ScorePair.hpp"
#include "util/TimeMemory.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

namespace TopkRecommend {

    class RetrievalResult {
        std::vector<std::string> config_l;
    public:

        void AddMemoryInfo() {
            char str[256];
            sprintf(str, "Peak memory %.3fGB, Current memory %.3fGB",
                    get_peak_RSS() * 1.0 / 1024 / 1024 / 1024,
                    get_current_RSS() * 1.0 / 1024 / 1024 / 1024);
            this->config_l.emplace_back(str);
        }

        void AddInfo(const std::string &info) {
            this->config_l.emplace_back(info);
        }

        void AddRecommendTime(const double &recommend_time) {
            char buff[128];
            sprintf(buff, "recommend time %.3fs", recommend_time);
            std::string str(buff);
            this->config_l.emplace_back(str);
        }

        void WritePerformance(const std::string &path) {
            std::ofstream file(path);
            if (!file) {
                ThrowError<IOError>(fmt::format("error in write performance {}", path));
            }
            int config_size = (int) config_l.size();
            for (int i = config_size - 1; i >= 0; i--) {
                file << config_l[i] << std::endl;
            }
            file.close();
            if (!file) {
                ThrowError<IOError>(fmt::format("error in write performance {}", path));
            }
        }
    };

    // one line per source: srcID,dstID:score,dstID:score,...
    inline void WriteRecommendResult(const RecommendResult &result, const std::string &path) {
        std::ofstream file(path);
        if (!file) {
            ThrowError<IOError>(fmt::format("error in write result {}", path));
        }

        for (const std::pair<int, RecommendList> &src_result: result) {
            file << src_result.first;
            for (const ScorePair &pair: src_result.second) {
                file << "," << pair.ID_ << ":" << fmt::format("{:.6f}", pair.score_);
            }
            file << "\n";
        }
        file.close();
        if (!file) {
            ThrowError<IOError>(fmt::format("error in write result {}", path));
        }
    }

}
