// Copyright 2018 Chia Network Inc

// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at

//    http://www.apache.org/licenses/LICENSE-2.0

// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "cxxopts.hpp"
#include "compare.hpp"
#include "cpu_count.hpp"
#include "parallel_sort.hpp"
#include "sequential_sort.hpp"
#include "util.hpp"

using std::string;
using std::vector;
using std::endl;
using std::cout;

using Comparator = Compare::Function<int64_t>;
using Options = ParallelSort::SortOptions<int64_t, Comparator>;

struct Suite {
    string name;
    uint32_t num_cases;
    uint64_t min_elems;
    uint64_t max_elems;
};

static const vector<Suite> kSuites = {
    {"small", 400, 10, 200},
    {"medium", 200, 500, 10000},
    {"large", 50, 20000, 400000},
    {"huge", 10, 800000, 2000000},
};

void HelpAndQuit(cxxopts::Options options)
{
    cout << options.help({""}) << endl;
    cout << "./SortBench bench [seed]" << endl;
    cout << "./SortBench sort < numbers.txt" << endl;
    cout << "./SortBench sort -- 5 -1 3" << endl;
    exit(0);
}

// Random arrays with sizes drawn uniformly from [min_elems, max_elems].
vector<ParallelSort::SharedArray<int64_t>> GenCasesOfSize(
    std::mt19937_64 &rng,
    uint32_t num_cases,
    uint64_t min_elems,
    uint64_t max_elems)
{
    vector<ParallelSort::SharedArray<int64_t>> targets;
    targets.reserve(num_cases);
    std::uniform_int_distribution<uint64_t> size_dist(min_elems, max_elems);

    for (uint32_t i = 0; i < num_cases; i++) {
        uint64_t const size = size_dist(rng);
        vector<int64_t> target;
        target.reserve(size);
        for (uint64_t j = 0; j < size; j++) {
            target.push_back(static_cast<int64_t>(rng()));
        }
        targets.push_back(ParallelSort::Share(std::move(target)));
    }
    return targets;
}

void RunCases(
    const string &name,
    const vector<ParallelSort::SharedArray<int64_t>> &cases,
    const Options &options)
{
    {
        Comparator compare = options.GetComparator();
        Timer timer;
        for (const auto &target : cases) {
            SequentialSort::SortBy(*target, compare);
        }
        timer.PrintElapsed("Sequential took for " + name + ":");
    }
    {
        Timer timer;
        for (const auto &target : cases) {
            options.Run(target);
        }
        timer.PrintElapsed("Parallel took for " + name + ":");
    }
}

uint64_t ChooseSeed(const cxxopts::ParseResult &result, const vector<string> &params)
{
    if (params.size() > 1) {
        std::cerr << "No more than one argument is allowed (the seed)" << endl;
        exit(1);
    }
    string seed_str;
    if (!params.empty()) {
        seed_str = params[0];
    } else if (result.count("seed")) {
        seed_str = result["seed"].as<string>();
    } else {
        std::random_device device;
        return (static_cast<uint64_t>(device()) << 32) | device();
    }

    uint64_t seed = 0;
    if (!Util::ParseUnsigned(seed_str, seed)) {
        std::cerr << "Invalid seed " << seed_str << endl;
        exit(1);
    }
    return seed;
}

int64_t ParseValue(const string &token)
{
    size_t parsed = 0;
    int64_t const value = std::stoll(token, &parsed);
    if (parsed != token.size()) {
        throw std::invalid_argument("Not an integer: " + token);
    }
    return value;
}

vector<int64_t> ReadValues(std::istream &in)
{
    vector<int64_t> values;
    string token;
    while (in >> token) {
        values.push_back(ParseValue(token));
    }
    return values;
}

int main(int argc, char *argv[]) try {
    cxxopts::Options options(
        "SortBench", "Runs and compares the sequential and the parallel merge sort.");
    options.positional_help("(bench/sort) param1").show_positional_help();

    // Default values
    uint32_t num_threads = 0;
    uint64_t begin = 0;
    uint64_t end = 0;
    uint64_t min_chunk = ParallelSort::kDefaultMinChunk;
    bool physical = false;
    bool reverse = false;
    string suites = "small,medium,large,huge";
    string operation = "help";

    options.allow_unrecognised_options().add_options()(
        "r, threads", "Number of threads (default: one per logical CPU)",
        cxxopts::value<uint32_t>(num_threads))(
        "physical", "One thread per physical CPU", cxxopts::value<bool>(physical))(
        "reverse", "Sort in descending order", cxxopts::value<bool>(reverse))(
        "b, begin", "First index of the range to sort", cxxopts::value<uint64_t>(begin))(
        "e, end", "One past the last index of the range to sort", cxxopts::value<uint64_t>(end))(
        "c, chunk", "Smallest upper half that gets its own thread",
        cxxopts::value<uint64_t>(min_chunk))(
        "s, seed", "Seed for the random cases", cxxopts::value<string>())(
        "suites", "Comma separated suites to run (small,medium,large,huge)",
        cxxopts::value<string>(suites))(
        "help", "Print help")(
        "operation", "Operation", cxxopts::value<string>(operation))(
        "params", "Operation parameters", cxxopts::value<vector<string>>());
    options.parse_positional({"operation", "params"});

    auto result = options.parse(argc, argv);

    if (result.count("help") || argc < 2) {
        HelpAndQuit(options);
    }
    vector<string> params;
    if (result.count("params")) {
        params = result["params"].as<vector<string>>();
    }

    Options sort_options(
        reverse ? Comparator(Compare::ReverseOrder<int64_t>())
                : Comparator(Compare::NaturalOrder<int64_t>()));
    if (physical) {
        sort_options.ThreadPerPhysicalCpu();
    } else if (result.count("threads")) {
        sort_options.Threads(num_threads);
    }
    sort_options.MinChunkSize(min_chunk);

    if (operation == "help") {
        HelpAndQuit(options);
    } else if (operation == "bench") {
        uint64_t const seed = ChooseSeed(result, params);
        cout << "Using seed " << seed << endl;
        cout << "Using " << sort_options.GetThreads() << " threads ("
             << CpuCount::Logical() << " logical, " << CpuCount::Physical() << " physical CPUs)"
             << endl << endl;

        std::mt19937_64 rng(seed);
        for (const auto &suite : kSuites) {
            // Cases are generated even for skipped suites, so a seed always
            // produces the same arrays for a given suite.
            auto cases = GenCasesOfSize(rng, suite.num_cases, suite.min_elems, suite.max_elems);
            if (("," + suites + ",").find("," + suite.name + ",") == string::npos) {
                continue;
            }
            RunCases(suite.name, cases, sort_options);
            cout << endl;
        }
    } else if (operation == "sort") {
        // Values come from the command line after "--", or from stdin.
        vector<int64_t> values;
        if (params.empty()) {
            values = ReadValues(std::cin);
        } else {
            for (const auto &param : params) {
                values.push_back(ParseValue(param));
            }
        }
        auto array = ParallelSort::Share(std::move(values));
        if (result.count("begin") || result.count("end")) {
            if (!result.count("end")) {
                end = array->size();
            }
            sort_options.SetRange(begin, end);
        }
        vector<int64_t> sorted = sort_options.Run(array);
        cout << Util::Join(sorted) << endl;
    } else {
        cout << "Invalid operation. Use bench/sort" << endl;
        return 1;
    }
    return 0;
} catch (const cxxopts::OptionException &e) {
    cout << "error parsing options: " << e.what() << endl;
    return 1;
} catch (const std::exception &e) {
    std::cerr << "Caught exception: " << e.what() << endl;
    return 1;
}
