#include <pybind11/pybind11.h>
#include <pybind11/pytypes.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <string>
#include <vector>

#include "ph/analysis.hpp"
#include "ph/ph.hpp"
#include "ph/sha256.hpp"

namespace py = pybind11;

static py::list str_list(const std::vector<std::string>& xs) {
  py::list out;
  for (const auto& x : xs) out.append(x);
  return out;
}

// Same keys the HTTP response carries.
static py::dict trace_to_dict(const ph::Trace& t) {
  py::list rounds;
  for (const auto& r : t.rounds) {
    py::dict d;
    d["round"] = r.round;
    d["inputHashOutputs"] = str_list(r.input_hash_outputs);
    d["computedNewIV"] = r.computed_new_iv;
    d["newBlocks"] = str_list(r.new_blocks);
    d["outputHashOutputs"] = str_list(r.output_hash_outputs);
    rounds.append(d);
  }
  py::dict out;
  out["originalMessage"] = t.original_message;
  out["padded"] = t.padded;
  out["blocks"] = str_list(t.blocks);
  out["initialHashOutputs"] = str_list(t.initial_hash_outputs);
  out["rounds"] = rounds;
  out["finalDigest"] = t.final_digest;
  return out;
}

static py::dict compute_py(const std::string& input, unsigned threads, bool strict_utf8) {
  ph::HashResponse res;
  {
    py::gil_scoped_release nogil;
    res = ph::compute(input, ph::HashConfig{threads, strict_utf8});
  }
  py::dict out;
  out["finalDigest"] = res.final_digest;
  out["normalHash"] = res.normal_hash;
  out["trace"] = trace_to_dict(res.trace);
  return out;
}

static std::string sha256_hex_py(const std::string& data) {
  return ph::to_hex(ph::sha256(data));
}

static py::dict analyze_py(std::uint32_t samples, std::uint32_t buckets, std::uint64_t seed,
                           std::size_t min_length, std::size_t max_length) {
  ph::AnalysisConfig cfg;
  cfg.samples = samples;
  cfg.buckets = buckets;
  cfg.seed = seed;
  cfg.min_length = min_length;
  cfg.max_length = max_length;

  ph::AnalysisResult res;
  {
    py::gil_scoped_release nogil;
    res = ph::analyze(cfg);
  }
  py::dict out;
  out["samples"] = res.samples;
  out["collisions"] = res.collisions;
  out["buckets"] = res.bucket_counts;
  out["avalanche_bits"] = res.avalanche_bits;
  out["avalanche_mean"] = res.avalanche_mean;
  out["ns_elapsed"] = py::int_(res.ns_elapsed);
  return out;
}

PYBIND11_MODULE(phcore, m) {
  m.doc() = "Parallel reducible SHA-256 core (pybind11)";

  py::register_exception<ph::InputEncodingError>(m, "InputEncodingError", PyExc_ValueError);
  py::register_exception<ph::InvariantViolation>(m, "InvariantViolation", PyExc_RuntimeError);

  m.def("compute", &compute_py,
      py::arg("input"),
      py::arg("threads") = 0,           // 0 => hardware concurrency
      py::arg("strict_utf8") = true,
      R"pbdoc(
Hash `input` with reference SHA-256 and the parallel reduction construction.

Args:
  input (str | bytes): message; bytes must be UTF-8 unless strict_utf8=False.
  threads (int): worker count, 0 for hardware concurrency.
  strict_utf8 (bool): reject invalid UTF-8 instead of echoing it with U+FFFD.

Returns:
  dict { finalDigest, normalHash, trace } with the trace keys
  originalMessage, padded, blocks, initialHashOutputs, rounds, finalDigest.
)pbdoc");

  m.def("sha256_hex", &sha256_hex_py, py::arg("data"),
        R"pbdoc(Reference SHA-256 of `data` as 64 lowercase hex characters.)pbdoc");

  m.def("analyze", &analyze_py,
        py::arg("samples"), py::arg("buckets") = 64, py::arg("seed") = 0,
        py::arg("min_length") = 120, py::arg("max_length") = 1300,
        R"pbdoc(Collision, bucket uniformity and avalanche sweep over random messages.)pbdoc");
}
