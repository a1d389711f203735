#ifndef TOPK_RECOMMEND_MODELIO_HPP
#define TOPK_RECOMMEND_MODELIO_HPP

#include "impl/FactorModel.hpp"
#include "struct/FeatureVector.hpp"
#include "struct/PartitionedFeatures.hpp"
#include "struct/RecommendError.hpp"
#include "struct/RecommendObserver.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace TopkRecommend {

    class ModelSaver {
    public:
        virtual void Save(const FactorModel &model, const std::string &path) = 0;

        virtual ~ModelSaver() = default;
    };

    class ModelLoader {
    public:
        virtual FactorModel Load(const std::string &path) = 0;

        virtual ~ModelLoader() = default;
    };

    /*
     * Directory layout:
     *   path/metadata                      "key value" lines: class, version, rank
     *   path/data/{user,product}/id.ivecs  int32 count, then count int32 IDs
     *   path/data/{user,product}/features.dvecs
     *                                      per vector an int32 dimension, then dimension doubles
     *   path/data/{user,product}/partition.txt
     *                                      one partition size per line
     */
    class DirectoryModelIO : public ModelSaver, public ModelLoader {
        RecommendObserver *observer_;

        static void WriteFeatures(const PartitionedFeatures &features, const std::filesystem::path &dir) {
            std::filesystem::create_directories(dir);

            std::ofstream id_file(dir / "id.ivecs", std::ios::binary);
            std::ofstream feature_file(dir / "features.dvecs", std::ios::binary);
            std::ofstream partition_file(dir / "partition.txt");
            if (!id_file || !feature_file || !partition_file) {
                ThrowError<IOError>(fmt::format("cannot create feature files under {}", dir.string()));
            }

            const auto n_vector = (int32_t) features.NumVector();
            id_file.write((const char *) &n_vector, sizeof(int32_t));
            for (int partID = 0; partID < features.NumPartition(); partID++) {
                const std::vector<FeatureVector> &partition = features.GetPartition(partID);
                partition_file << partition.size() << "\n";
                for (const FeatureVector &vecs: partition) {
                    const auto ID = (int32_t) vecs.ID_;
                    const auto dim = (int32_t) vecs.dim();
                    id_file.write((const char *) &ID, sizeof(int32_t));
                    feature_file.write((const char *) &dim, sizeof(int32_t));
                    feature_file.write((const char *) vecs.data(), (std::streamsize) (sizeof(double) * dim));
                }
            }
            id_file.close();
            feature_file.close();
            partition_file.close();
            if (!id_file || !feature_file || !partition_file) {
                ThrowError<IOError>(fmt::format("error in write feature files under {}", dir.string()));
            }
        }

        static PartitionedFeatures ReadFeatures(const int &rank, const std::filesystem::path &dir) {
            std::ifstream id_file(dir / "id.ivecs", std::ios::binary);
            std::ifstream feature_file(dir / "features.dvecs", std::ios::binary);
            std::ifstream partition_file(dir / "partition.txt");
            if (!id_file || !feature_file || !partition_file) {
                ThrowError<IOError>(fmt::format("cannot open feature files under {}", dir.string()));
            }

            int32_t n_vector = 0;
            id_file.read((char *) &n_vector, sizeof(int32_t));
            if (!id_file || n_vector < 0) {
                ThrowError<IOError>(fmt::format("invalid ID column under {}", dir.string()));
            }

            PartitionedFeatures features(rank);
            int64_t n_read = 0;
            int64_t partition_size = 0;
            while (partition_file >> partition_size) {
                if (partition_size < 0 || n_read + partition_size > n_vector) {
                    ThrowError<IOError>(fmt::format("partition sizes under {} exceed {} vectors",
                                                    dir.string(), n_vector));
                }
                std::vector<FeatureVector> partition;
                partition.reserve(partition_size);
                for (int64_t i = 0; i < partition_size; i++) {
                    int32_t ID = 0, dim = 0;
                    id_file.read((char *) &ID, sizeof(int32_t));
                    feature_file.read((char *) &dim, sizeof(int32_t));
                    if (!id_file || !feature_file || dim != rank) {
                        ThrowError<IOError>(fmt::format("invalid feature record {} under {}", n_read + i,
                                                        dir.string()));
                    }
                    std::vector<double> vecs(dim);
                    feature_file.read((char *) vecs.data(), (std::streamsize) (sizeof(double) * dim));
                    if (!feature_file) {
                        ThrowError<IOError>(fmt::format("truncated feature record {} under {}", n_read + i,
                                                        dir.string()));
                    }
                    partition.emplace_back(ID, std::move(vecs));
                }
                n_read += partition_size;
                features.AddPartition(std::move(partition));
            }
            if (n_read != n_vector) {
                ThrowError<IOError>(fmt::format("read {} vectors under {}, expect {}", n_read, dir.string(),
                                                n_vector));
            }
            return features;
        }

    public:
        static constexpr const char *kClassName = "TopkRecommend.FactorModel";
        static constexpr const char *kFormatVersion = "1.0";

        explicit DirectoryModelIO(RecommendObserver *observer = nullptr) {
            this->observer_ = observer;
        }

        void Save(const FactorModel &model, const std::string &path) override {
            const std::filesystem::path root(path);
            if (std::filesystem::exists(root) && !std::filesystem::is_empty(root)) {
                ThrowError<IOError>(fmt::format("model path {} already exists", path));
            }
            std::filesystem::create_directories(root);

            std::ofstream metadata_file(root / "metadata");
            if (!metadata_file) {
                ThrowError<IOError>(fmt::format("cannot create metadata under {}", path));
            }
            metadata_file << "class " << kClassName << "\n";
            metadata_file << "version " << kFormatVersion << "\n";
            metadata_file << "rank " << model.rank() << "\n";
            metadata_file.close();
            if (!metadata_file) {
                ThrowError<IOError>(fmt::format("error in write metadata under {}", path));
            }

            WriteFeatures(model.user_features(), root / "data" / "user");
            WriteFeatures(model.product_features(), root / "data" / "product");
            spdlog::info("save model of rank {} to {}", model.rank(), path);
        }

        FactorModel Load(const std::string &path) override {
            const std::filesystem::path root(path);
            std::ifstream metadata_file(root / "metadata");
            if (!metadata_file) {
                ThrowError<IOError>(fmt::format("cannot open metadata under {}", path));
            }
            std::map<std::string, std::string> metadata;
            std::string line;
            while (std::getline(metadata_file, line)) {
                std::istringstream iss(line);
                std::string key, value;
                if (iss >> key >> value) {
                    metadata[key] = value;
                }
            }

            if (metadata["class"] != kClassName || metadata["version"] != kFormatVersion) {
                ThrowError<IOError>(fmt::format(
                        "load did not recognize model with (class: {}, version: {}), supported: ({}, {})",
                        metadata["class"], metadata["version"], kClassName, kFormatVersion));
            }
            int rank = 0;
            try {
                rank = std::stoi(metadata["rank"]);
            } catch (const std::exception &) {
                ThrowError<IOError>(fmt::format("invalid rank '{}' in metadata under {}", metadata["rank"], path));
            }

            PartitionedFeatures user_features = ReadFeatures(rank, root / "data" / "user");
            PartitionedFeatures product_features = ReadFeatures(rank, root / "data" / "product");
            spdlog::info("load model of rank {} from {}, n_user {}, n_product {}", rank, path,
                         user_features.NumVector(), product_features.NumVector());
            return {rank, std::move(user_features), std::move(product_features), observer_};
        }
    };

}
#endif //TOPK_RECOMMEND_MODELIO_HPP
