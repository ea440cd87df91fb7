#pragma once
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "../src/arena.hpp"

// Minimal checksum sink to prevent dead-code elimination.
struct Sink
{
    volatile std::uint64_t acc = 0;
    void eat(std::uint64_t x) { acc ^= x + 0x9e3779b97f4a7c15ull + (acc << 6) + (acc >> 2); }
};

// timing helper
template <class F>
std::uint64_t time_ns(F &&f)
{
    auto t0 = std::chrono::high_resolution_clock::now();
    f();
    auto t1 = std::chrono::high_resolution_clock::now();
    return (std::uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
}

// Payload for every workload: 16 bytes, trivially destructible.
struct Record
{
    std::uint64_t id;
    std::uint64_t value;
};

struct Row
{
    std::string impl, workload;
    std::size_t N;
    int rounds;
    int trial;
    std::uint64_t seed, ns;
    std::uint64_t checksum;
};

inline void print_csv_header()
{
    std::cout << "impl,workload,N,rounds,trial,seed,ns,checksum\n";
}

inline void print_row(const Row &r)
{
    std::cout << r.impl << "," << r.workload << "," << r.N << "," << r.rounds << "," << r.trial << ","
              << r.seed << "," << r.ns << "," << r.checksum << "\n";
}

// ---- Workloads ----

// Arena: N construct() calls, walk them, reset. Repeated `rounds` times.
inline Row run_arena_phase(Arena &arena, std::size_t N, int rounds, int trial, std::uint64_t seed)
{
    Sink s;
    std::vector<Record *> ptrs;
    ptrs.reserve(N);

    std::uint64_t ns = time_ns([&]
                               {
        for (int r = 0; r < rounds; ++r) {
            ptrs.clear();
            for (std::size_t i = 0; i < N; ++i) {
                auto h = arena.construct<Record>(seed + i, static_cast<std::uint64_t>(r));
                if (!h) break;
                ptrs.push_back(h->get());
            }
            for (Record *p : ptrs) s.eat(p->id ^ p->value);
            arena.reset();
        } });

    return Row{"arena", "construct+scan+reset", N, rounds, trial, seed, ns, s.acc};
}

// Arena: one allocate_array per round instead of N single requests.
inline Row run_arena_bulk(Arena &arena, std::size_t N, int rounds, int trial, std::uint64_t seed)
{
    Sink s;
    std::uint64_t ns = time_ns([&]
                               {
        for (int r = 0; r < rounds; ++r) {
            auto h = arena.allocate_array<Record>(N);
            if (!h) break;
            std::uint64_t i = 0;
            for (Record &rec : *h) { rec.id = seed + i; rec.value = static_cast<std::uint64_t>(r); ++i; }
            for (const Record &rec : *h) s.eat(rec.id ^ rec.value);
            arena.reset();
        } });

    return Row{"arena", "array+scan+reset", N, rounds, trial, seed, ns, s.acc};
}

// Baseline: the same records through new/delete.
inline Row run_heap_phase(std::size_t N, int rounds, int trial, std::uint64_t seed)
{
    Sink s;
    std::vector<std::unique_ptr<Record>> owned;
    owned.reserve(N);

    std::uint64_t ns = time_ns([&]
                               {
        for (int r = 0; r < rounds; ++r) {
            for (std::size_t i = 0; i < N; ++i)
                owned.push_back(std::unique_ptr<Record>(new Record{seed + i, static_cast<std::uint64_t>(r)}));
            for (const auto &p : owned) s.eat(p->id ^ p->value);
            owned.clear();
        } });

    return Row{"heap", "new+scan+delete", N, rounds, trial, seed, ns, s.acc};
}
