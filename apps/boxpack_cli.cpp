#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "boxpack/box_catalog.hpp"
#include "boxpack/items_csv.hpp"
#include "boxpack/packing.hpp"
#include "boxpack/result_json.hpp"
#include "utils/cli_parse.hpp"

namespace {

struct Args {
    std::string items_path = "-";
    boxpack::FitPolicy policy = boxpack::FitPolicy::kPerItem;
    int log_every = 0;
    bool summary = false;
    bool catalog = false;
};

void print_usage() {
    std::cout << "Usage: boxpack_cli [--items path|-] [--policy per-item|shelf] [--log-every k] [--summary]\n"
              << "                   [--catalog]\n"
              << "Items CSV columns: sku,length,width,height (header optional).\n";
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--items") {
            args.items_path = require_arg(i, argc, argv, a);
        } else if (a == "--policy") {
            args.policy = parse_fit_policy(require_arg(i, argc, argv, a));
        } else if (a == "--log-every") {
            args.log_every = parse_non_negative_int(require_arg(i, argc, argv, a), a);
        } else if (a == "--summary") {
            args.summary = true;
        } else if (a == "--catalog") {
            args.catalog = true;
        } else if (a == "-h" || a == "--help") {
            print_usage();
            std::exit(0);
        } else {
            throw std::runtime_error("unknown arg: " + a);
        }
    }
    return args;
}

std::vector<boxpack::Item> load_items(const std::string& path) {
    if (path == "-") {
        return boxpack::read_items_csv(std::cin);
    }
    std::ifstream f(path);
    if (!f) {
        throw std::runtime_error("failed to open " + path);
    }
    return boxpack::read_items_csv(f);
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        const boxpack::BoxCatalog& catalog = boxpack::default_catalog();

        if (args.catalog) {
            boxpack::write_catalog_json(std::cout, catalog);
            return 0;
        }

        const auto items = load_items(args.items_path);

        boxpack::PackOptions opt;
        opt.fit_policy = args.policy;
        opt.log_every = args.log_every;

        const boxpack::PackResult res = boxpack::pack(items, catalog, opt);
        boxpack::write_pack_result_json(std::cout, res);

        if (args.summary && res.ok()) {
            const auto s = boxpack::summarize(res);
            std::cerr << std::fixed << std::setprecision(4) << "boxes=" << s.total_boxes
                      << " box_volume=" << s.total_box_volume << " item_volume=" << s.total_item_volume
                      << " fill=" << s.fill_ratio << "\n";
        }

        return res.ok() ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
