#include "ph/analysis.hpp"
#include "ph/ph.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_round(const ph::Round& r) {
  std::cout << "  round " << r.round << ": " << r.input_hash_outputs.size()
            << " -> " << r.output_hash_outputs.size() << "\n"
            << "    iv      " << r.computed_new_iv << "\n";
  for (const auto& b : r.new_blocks) std::cout << "    block   " << b << "\n";
  for (const auto& h : r.output_hash_outputs) std::cout << "    out     " << h << "\n";
}

int run_analysis(std::uint32_t samples, std::uint32_t buckets, std::uint64_t seed,
                 unsigned threads) {
  ph::AnalysisConfig cfg;
  cfg.samples = samples;
  cfg.buckets = buckets;
  cfg.seed = seed;
  cfg.threads = threads;
  auto res = ph::analyze(cfg);
  auto mm = std::minmax_element(res.bucket_counts.begin(), res.bucket_counts.end());
  std::cout << "samples=" << res.samples << " | collisions=" << res.collisions
            << " | buckets=" << buckets << " min=" << *mm.first << " max=" << *mm.second
            << " | avalanche mean=" << res.avalanche_mean << " bits"
            << " | core(ns)=" << res.ns_elapsed << "\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  // Flags: --threads=N, --bench=N (repeat), --lossy, --quiet,
  //        --analyze=N [--buckets=B] [--seed=S]
  unsigned repeats = 1, threads = 0;
  bool strict = true, quiet = false;
  std::uint32_t analyze = 0, buckets = 64;
  std::uint64_t seed = 0;
  std::vector<std::string> messages;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    try {
      if (a.rfind("--threads=", 0) == 0) {
        threads = std::stoul(a.substr(10));
      } else if (a.rfind("--bench=", 0) == 0) {
        repeats = std::max(1ul, std::stoul(a.substr(8)));
      } else if (a.rfind("--analyze=", 0) == 0) {
        analyze = std::stoul(a.substr(10));
      } else if (a.rfind("--buckets=", 0) == 0) {
        buckets = std::stoul(a.substr(10));
      } else if (a.rfind("--seed=", 0) == 0) {
        seed = std::stoull(a.substr(7));
      } else if (a == "--lossy") {
        strict = false;
      } else if (a == "--quiet") {
        quiet = true;
      } else {
        messages.push_back(a);
      }
    } catch (const std::exception&) {
      std::cerr << "skip '" << a << "': bad number\n";
    }
  }

  try {
    if (analyze) return run_analysis(analyze, buckets, seed, threads);
  } catch (const std::invalid_argument& e) {
    std::cerr << "analysis: " << e.what() << "\n";
    return 2;
  }

  if (messages.empty()) messages = {"abc"};

  for (const auto& msg : messages) {
    ph::HashConfig cfg{threads, strict};
    std::uint64_t best = UINT64_MAX, sum = 0;
    try {
      for (unsigned r = 0; r < repeats; ++r) {
        auto t0 = std::chrono::steady_clock::now();
        auto res = ph::compute(msg, cfg);
        auto t1 = std::chrono::steady_clock::now();
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
        sum += ns; if ((std::uint64_t)ns < best) best = ns;
        if (repeats == 1) {
          std::cout << "\"" << res.trace.original_message << "\"\n"
                    << "  final   " << res.final_digest << "\n"
                    << "  sha256  " << res.normal_hash << "\n"
                    << "  blocks=" << res.trace.blocks.size()
                    << " | rounds=" << res.trace.rounds.size()
                    << " | core(ns)=" << ns << "\n";
          if (!quiet)
            for (const auto& round : res.trace.rounds) print_round(round);
        }
      }
    } catch (const ph::InputEncodingError& e) {
      std::cerr << "bad input: " << e.what() << "\n";
      return 2;
    } catch (const ph::InvariantViolation& e) {
      std::cerr << "internal error: " << e.what() << "\n";
      return 3;
    }
    if (repeats > 1) {
      std::cout << "len=" << msg.size() << " bench repeats=" << repeats
                << " | best(ns)=" << best << " | avg(ns)=" << (sum / repeats) << "\n";
    }
  }
  return 0;
}
