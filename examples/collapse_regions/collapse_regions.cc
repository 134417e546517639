/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <rcs/member_constraint_json.hh>
#include <rcs/member_constraint_set.hh>
#include <rcs/region_vid.hh>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <fmt/core.h>
#include <fmt/ostream.h>

using namespace rcs;

using std::cerr;
using std::cout;
using std::endl;
using std::ofstream;
using std::string;
using std::uniform_int_distribution;
using std::vector;
using std::chrono::duration_cast;
using std::chrono::microseconds;
using std::chrono::steady_clock;

using fmt::print;

namespace po = boost::program_options;

auto main(int argc, char * argv[]) -> int
{
    po::options_description display_options{"Program options"};
    display_options.add_options()                                                                   //
        ("help", "Display help information")                                                        //
        ("json", po::value<string>(), "Write the remapped constraints as JSON to this file")        //
        ("show", po::value<unsigned>()->default_value(5), "Number of components to print in full");

    po::options_description all_options{"All options"};
    all_options.add_options()                                                                                              //
        ("regions", po::value<unsigned long long>()->default_value(1000), "Number of region variables")                   //
        ("constraints", po::value<unsigned long long>()->default_value(5000), "Number of member constraints")             //
        ("choices", po::value<unsigned>()->default_value(4), "Maximum number of choice regions per constraint")           //
        ("classes", po::value<unsigned long long>()->default_value(100), "Number of equivalence classes to collapse onto") //
        ("seed", po::value<unsigned>()->default_value(0), "Random seed");

    all_options.add(display_options);

    po::variables_map options_vars;

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all_options)
                      .run(),
            options_vars);
        po::notify(options_vars);
    }
    catch (const po::error & e) {
        cerr << "Error: " << e.what() << endl;
        cerr << "Try " << argv[0] << " --help" << endl;
        return EXIT_FAILURE;
    }

    if (options_vars.contains("help")) {
        cout << "Usage: " << argv[0] << " [options]" << endl;
        cout << endl;
        cout << all_options << endl;
        return EXIT_SUCCESS;
    }

    auto n_regions = options_vars["regions"].as<unsigned long long>();
    auto n_constraints = options_vars["constraints"].as<unsigned long long>();
    auto max_choices = options_vars["choices"].as<unsigned>();
    auto n_classes = options_vars["classes"].as<unsigned long long>();

    if (0 == n_regions || 0 == n_classes) {
        cerr << "Error: --regions and --classes must be positive" << endl;
        return EXIT_FAILURE;
    }

    std::mt19937 rand(options_vars["seed"].as<unsigned>());
    uniform_int_distribution<unsigned long long> region_dist(0, n_regions - 1);
    uniform_int_distribution<unsigned> choices_dist(0, max_choices);
    uniform_int_distribution<unsigned long long> class_dist(0, n_classes - 1);

    // Stands in for the strongly connected components of the region graph.
    vector<ConstraintSccIndex> representative;
    representative.reserve(n_regions);
    for (unsigned long long r = 0; r < n_regions; ++r)
        representative.emplace_back(class_dist(rand));

    auto build_start_time = steady_clock::now();

    MemberConstraintSet<RegionVid> set;
    vector<RegionVid> choices;
    for (unsigned long long c = 0; c < n_constraints; ++c) {
        choices.clear();
        for (unsigned n = choices_dist(rand); n > 0; --n)
            choices.emplace_back(region_dist(rand));

        set.add_member_constraint(OpaqueTypeKey{c % 17, "Opaque" + std::to_string(c % 17)}, HiddenType{"T" + std::to_string(c)},
            Span{0, c * 10, c * 10 + 5}, RegionVid{region_dist(rand)}, choices);
    }

    auto remap_start_time = steady_clock::now();

    auto mapped = std::move(set).into_mapped([&](RegionVid r) { return representative.at(r.index); });

    auto done_time = steady_clock::now();

    print("{}", mapped.stats());
    print("build time: {}s\n", duration_cast<microseconds>(remap_start_time - build_start_time).count() / 1'000'000.0);
    print("remap time: {}s\n", duration_cast<microseconds>(done_time - remap_start_time).count() / 1'000'000.0);

    auto show = options_vars["show"].as<unsigned>();
    unsigned shown = 0;
    for (const auto & key : mapped.keys()) {
        if (shown++ == show)
            break;

        print("\n{}:\n", key);
        for (auto idx : mapped.indices(key)) {
            const auto & c = mapped[idx];
            print("    {} member of [", c.member_region_vid);
            bool first = true;
            for (auto & r : mapped.choice_regions(idx)) {
                print("{}{}", first ? "" : ", ", r);
                first = false;
            }
            print("] from {} in {} at {}\n", c.key, c.hidden_ty, c.definition_span);
        }
    }

    if (options_vars.contains("json")) {
        auto file_name = options_vars["json"].as<string>();
        ofstream json_file{file_name};
        if (! json_file) {
            cerr << "Error: couldn't open " << file_name << " for writing" << endl;
            return EXIT_FAILURE;
        }
        json_file << member_constraints_as_json(mapped) << endl;
    }

    return EXIT_SUCCESS;
}
