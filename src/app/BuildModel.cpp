#include "impl/FactorModel.hpp"
#include "struct/PartitionedFeatures.hpp"
#include "struct/RecommendError.hpp"
#include "struct/RecommendObserver.hpp"
#include "util/ModelIO.hpp"
#include "util/VectorIO.hpp"

#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <iostream>
#include <string>

class Parameter {
public:
    std::string dataset_dir, dataset_name, model_dir;
    int n_partition;
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
             "dataset_name")
            ("model_dir,m", po::value<std::string>(&para.model_dir)->default_value("./model"),
             "directory the model is saved to, must not exist or be empty")
            ("n_partition,p", po::value<int>(&para.n_partition)->default_value(8),
             "number of partitions per side");

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
    spdlog::info("dataset_name {}, dataset_dir {}, model_dir {}", para.dataset_name, para.dataset_dir,
                 para.model_dir);

    try {
        SpdlogObserver observer;
        PartitionedFeatures user, data_item;
        readData(para.dataset_dir, para.dataset_name, para.n_partition, user, data_item);

        const int rank = user.rank_;
        const FactorModel model(rank, std::move(user), std::move(data_item), &observer);
        DirectoryModelIO model_io(&observer);
        model_io.Save(model, para.model_dir);
    } catch (const RecommendError &e) {
        spdlog::error("build model failed: {}", e.what());
        return -1;
    } catch (const std::exception &e) {
        spdlog::error("unexpected error: {}", e.what());
        return -1;
    }
    return 0;
}
