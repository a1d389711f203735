#include "impl/FactorModel.hpp"
#include "impl/RecommendForAll.hpp"
#include "struct/PartitionedFeatures.hpp"
#include "struct/RecommendError.hpp"
#include "struct/RecommendObserver.hpp"
#include "util/FileIO.hpp"
#include "util/ModelIO.hpp"
#include "util/TimeMemory.hpp"
#include "util/VectorIO.hpp"

#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <iostream>
#include <string>
#include <vector>

class Parameter {
public:
    std::string dataset_dir, dataset_name, model_dir, direction, output_path, performance_path;
    int topk, block_size, n_partition, n_thread;
};

void LoadOptions(int argc, char **argv, Parameter &para) {
    namespace po = boost::program_options;

    po::options_description opts("Allowed options");
    opts.add_options()
            ("help,h", "help info")
            ("dataset_dir,d",
             po::value<std::string>(&para.dataset_dir)->default_value("./dataset"),
             "the basic directory of the fvecs dataset")
            ("dataset_name,n", po::value<std::string>(&para.dataset_name)->default_value("fake-normal"),
             "dataset_name, reads <dataset_name>_user.fvecs and <dataset_name>_data_item.fvecs")
            ("model_dir,m", po::value<std::string>(&para.model_dir)->default_value(""),
             "directory of a saved model, overrides the fvecs dataset when set")
            ("direction", po::value<std::string>(&para.direction)->default_value("user"),
             "user: recommend items for every user, item: recommend users for every item")
            ("topk,k", po::value<int>(&para.topk)->default_value(10),
             "number of recommendation per source")
            ("block_size,b", po::value<int>(&para.block_size)->default_value(TopkRecommend::kDefaultBlockSize),
             "number of feature vectors per block")
            ("n_partition,p", po::value<int>(&para.n_partition)->default_value(8),
             "number of partitions of the fvecs dataset")
            ("n_thread,t", po::value<int>(&para.n_thread)->default_value(0),
             "number of worker threads, 0 uses the OpenMP default")
            ("output_path,o", po::value<std::string>(&para.output_path)->default_value("recommend.csv"),
             "path of the recommendation result")
            ("performance_path", po::value<std::string>(&para.performance_path)->default_value(""),
             "path of the performance report, skipped when empty");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, opts), vm);
    po::notify(vm);

    if (vm.count("help")) {
        std::cout << opts << std::endl;
        exit(0);
    }
}

using namespace std;
using namespace TopkRecommend;

int main(int argc, char **argv) {
    Parameter para;
    LoadOptions(argc, argv, para);
    spdlog::info("topk {}, block_size {}, n_thread {}, direction {}",
                 para.topk, para.block_size, para.n_thread, para.direction);

    try {
        if (para.direction != "user" && para.direction != "item") {
            ThrowError<InvalidArgument>("direction should be either user or item, got " + para.direction);
        }

        SpdlogObserver observer;
        TimeRecord record;
        record.reset();

        PartitionedFeatures user, data_item;
        int rank;
        if (!para.model_dir.empty()) {
            spdlog::info("model_dir {}", para.model_dir);
            DirectoryModelIO model_io(&observer);
            FactorModel model = model_io.Load(para.model_dir);
            rank = model.rank();
            user = model.user_features();
            data_item = model.product_features();
        } else {
            spdlog::info("dataset_name {}, dataset_dir {}", para.dataset_name, para.dataset_dir);
            readData(para.dataset_dir, para.dataset_name, para.n_partition, user, data_item);
            rank = user.rank_;
        }
        const double read_time = record.get_elapsed_time_second();

        record.reset();
        const RecommendOption option(para.block_size, para.n_thread, &observer);
        const bool for_user = para.direction == "user";
        const RecommendResult result = for_user ?
                                       RecommendForAll(rank, user, data_item, para.topk, option) :
                                       RecommendForAll(rank, data_item, user, para.topk, option);
        const double recommend_time = record.get_elapsed_time_second();
        spdlog::info("finish recommendation of {} sources, read time {}s, recommend time {}s",
                     result.size(), read_time, recommend_time);

        WriteRecommendResult(result, para.output_path);
        spdlog::info("write result to {}", para.output_path);

        if (!para.performance_path.empty()) {
            RetrievalResult config;
            config.AddInfo(fmt::format("topk {}, block size {}, direction {}, n_source {}",
                                       para.topk, para.block_size, para.direction, result.size()));
            config.AddRecommendTime(recommend_time);
            config.AddMemoryInfo();
            config.WritePerformance(para.performance_path);
        }
    } catch (const RecommendError &e) {
        spdlog::error("recommendation failed: {}", e.what());
        return -1;
    } catch (const std::exception &e) {
        spdlog::error("unexpected error: {}", e.what());
        return -1;
    }
    return 0;
}
