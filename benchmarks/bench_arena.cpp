#include <cstdint>
#include <cstdio>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "workloads.hpp"

static void print_metadata()
{
    std::fprintf(stderr, "# build: %s %s\n", __DATE__, __TIME__);
#if defined(__clang__)
    std::fprintf(stderr, "# compiler: clang %d\n", __clang_major__);
#elif defined(__GNUC__)
    std::fprintf(stderr, "# compiler: gcc %d\n", __GNUC__);
#endif
#ifdef NDEBUG
    std::fprintf(stderr, "# mode: Release\n");
#else
    std::fprintf(stderr, "# mode: Debug (handle checks on)\n");
#endif
}

struct Args
{
    std::vector<std::size_t> counts{1024, 4096, 16384, 65536, 262144, 1048576};
    int trials = 8;
    int rounds = 16;
    std::uint64_t seed0 = 42;
};

Args parse(int argc, char **argv)
{
    Args a;
    for (int i = 1; i < argc; ++i)
    {
        std::string s = argv[i];
        auto next = [&](std::string &out)
        { if (i+1<argc){ out = argv[++i]; } };
        if (s == "--trials")
        {
            std::string v;
            next(v);
            a.trials = std::stoi(v);
        }
        else if (s == "--rounds")
        {
            std::string v;
            next(v);
            a.rounds = std::stoi(v);
        }
        else if (s == "--seed")
        {
            std::string v;
            next(v);
            a.seed0 = std::stoull(v);
        }
        else if (s == "--counts")
        {
            std::string v;
            next(v);
            a.counts.clear();
            std::size_t start = 0;
            while (true)
            {
                auto pos = v.find(',', start);
                std::string tok = (pos == std::string::npos) ? v.substr(start) : v.substr(start, pos - start);
                if (!tok.empty())
                    a.counts.push_back(std::stoull(tok));
                if (pos == std::string::npos)
                    break;
                start = pos + 1;
            }
        }
        else
        {
            std::fprintf(stderr, "unknown option: %s\n", s.c_str());
        }
    }
    return a;
}

int main(int argc, char **argv)
{
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    Args a;
    try
    {
        a = parse(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "bad argument: %s\n", e.what());
        return 2;
    }
    print_metadata();
    print_csv_header();

    int trial = 0;
    for (int t = 0; t < a.trials; ++t)
    {
        for (auto N : a.counts)
        {
            std::uint64_t seed = a.seed0 + t * 1315423911ull + N;

            if (N > std::numeric_limits<std::size_t>::max() / sizeof(Record))
            {
                std::fprintf(stderr, "# skip N=%zu: arena size overflows\n", N);
                continue;
            }
            auto arena = Arena::create(N * sizeof(Record));
            if (!arena)
            {
                std::fprintf(stderr, "# skip N=%zu: %s\n", N, to_string(arena.error()));
                continue;
            }

            print_row(run_arena_phase(*arena, N, a.rounds, trial, seed));
            print_row(run_arena_bulk(*arena, N, a.rounds, trial, seed + 1));
            print_row(run_heap_phase(N, a.rounds, trial, seed + 2));

            ++trial;
        }
    }
    return 0;
}
