#ifndef TOPK_RECOMMEND_VECTORIO_HPP
#define TOPK_RECOMMEND_VECTORIO_HPP

#include "struct/FeatureVector.hpp"
#include "struct/PartitionedFeatures.hpp"
#include "struct/RecommendError.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace TopkRecommend {

    // fvecs: per vector an int32 dimension followed by dimension float components
    template<typename T>
    std::unique_ptr<T[]> loadVector(const std::string &filename, int &n_data, int &dim) {
        std::ifstream in(filename, std::ios::binary);
        if (!in.is_open()) {
            ThrowError<IOError>(fmt::format("cannot open vector file {}", filename));
        }

        in.read((char *) &dim, 4);
        if (!in || dim <= 0) {
            ThrowError<IOError>(fmt::format("vector file {} has no valid dimension header", filename));
        }

        in.seekg(0, std::ios::end);
        std::ios::pos_type ss = in.tellg();
        auto fsize = (size_t) ss;
        const size_t record_size = sizeof(int) + sizeof(T) * (size_t) dim;
        if (fsize % record_size != 0) {
            ThrowError<IOError>(fmt::format("vector file {} of {} bytes is not a multiple of the record size {}",
                                            filename, fsize, record_size));
        }
        n_data = (int) (fsize / record_size);

        std::unique_ptr<T[]> data = std::make_unique<T[]>((size_t) n_data * (size_t) dim);
        in.seekg(0, std::ios::beg);
        for (int i = 0; i < n_data; i++) {
            in.seekg(4, std::ios::cur);
            in.read((char *) (data.get() + (size_t) i * dim), dim * sizeof(T));
        }
        if (!in) {
            ThrowError<IOError>(fmt::format("error in read vector file {}", filename));
        }
        in.close();

        return data;
    }

    // the i-th vector of the file gets ID i
    inline PartitionedFeatures readFeatures(const std::string &filename, const int &n_partition) {
        int n_vector = 0, vec_dim = 0;
        std::unique_ptr<float[]> raw_ptr = loadVector<float>(filename, n_vector, vec_dim);

        std::vector<FeatureVector> vector_l;
        vector_l.reserve(n_vector);
        for (int vecsID = 0; vecsID < n_vector; vecsID++) {
            const float *vecs = raw_ptr.get() + (size_t) vecsID * vec_dim;
            vector_l.emplace_back(vecsID, std::vector<double>(vecs, vecs + vec_dim));
        }
        return PartitionedFeatures::Partition(vec_dim, std::move(vector_l), n_partition);
    }

    // <basic_dir>/<dataset_name>/<dataset_name>_user.fvecs and <dataset_name>_data_item.fvecs
    inline void readData(const std::string &basic_dir, const std::string &dataset_name, const int &n_partition,
                         PartitionedFeatures &user, PartitionedFeatures &data_item) {
        const std::string prefix = fmt::format("{}/{}/{}", basic_dir, dataset_name, dataset_name);
        user = readFeatures(prefix + "_user.fvecs", n_partition);
        data_item = readFeatures(prefix + "_data_item.fvecs", n_partition);
        if (user.rank_ != data_item.rank_) {
            ThrowError<DimensionMismatch>(fmt::format("user dimension {} does not match data item dimension {}",
                                                      user.rank_, data_item.rank_));
        }
        spdlog::info("n_user {}, n_data_item {}, vec_dim {}, n_partition {}",
                     user.NumVector(), data_item.NumVector(), user.rank_, user.NumPartition());
    }

}
#endif //TOPK_RECOMMEND_VECTORIO_HPP
