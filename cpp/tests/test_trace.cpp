#include "ph/ph.hpp"
#include "ph/sha256.hpp"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <string>
#include <vector>

static bool is_hex(const std::string& s, std::size_t width) {
  return s.size() == width && std::all_of(s.begin(), s.end(), [](char c) {
           return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
         });
}

static bool same_response(const ph::HashResponse& a, const ph::HashResponse& b) {
  if (a.final_digest != b.final_digest || a.normal_hash != b.normal_hash) return false;
  const auto& x = a.trace;
  const auto& y = b.trace;
  if (x.original_message != y.original_message || x.padded != y.padded ||
      x.blocks != y.blocks || x.initial_hash_outputs != y.initial_hash_outputs ||
      x.final_digest != y.final_digest || x.rounds.size() != y.rounds.size())
    return false;
  for (std::size_t i = 0; i < x.rounds.size(); ++i) {
    const auto& p = x.rounds[i];
    const auto& q = y.rounds[i];
    if (p.round != q.round || p.input_hash_outputs != q.input_hash_outputs ||
        p.computed_new_iv != q.computed_new_iv || p.new_blocks != q.new_blocks ||
        p.output_hash_outputs != q.output_hash_outputs)
      return false;
  }
  return true;
}

TEST_CASE("\"abc\" is a single-block trace") {
  auto res = ph::compute("abc");
  REQUIRE(res.normal_hash ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  REQUIRE(res.trace.original_message == "abc");
  REQUIRE(res.trace.blocks.size() == 1);
  REQUIRE(res.trace.rounds.empty());
  REQUIRE(res.trace.initial_hash_outputs.size() == 1);
  REQUIRE(res.final_digest == res.trace.initial_hash_outputs[0]);
  REQUIRE(res.final_digest == res.trace.final_digest);
  // One block from H(0) is plain SHA-256.
  REQUIRE(res.final_digest == res.normal_hash);
  REQUIRE(res.trace.padded ==
          "61626380" + std::string(52 * 2, '0') + "0000000000000018");
}

TEST_CASE("Empty input still yields a well-formed trace") {
  auto res = ph::compute("");
  REQUIRE(res.trace.original_message.empty());
  REQUIRE(res.trace.padded == "80" + std::string(126, '0'));
  REQUIRE(res.trace.blocks == std::vector<std::string>{res.trace.padded});
  REQUIRE(res.trace.rounds.empty());
  REQUIRE(res.normal_hash ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  REQUIRE(res.final_digest == res.normal_hash);
}

TEST_CASE("Multi-block trace has consistent shapes and chaining") {
  const std::string msg(300, 'q'); // 5 blocks
  auto res = ph::compute(msg);
  const auto& t = res.trace;

  REQUIRE(res.normal_hash == ph::to_hex(ph::sha256(msg)));
  REQUIRE(t.padded.size() % 128 == 0);
  REQUIRE(t.blocks.size() == 5);
  REQUIRE(t.initial_hash_outputs.size() == 5);
  for (const auto& b : t.blocks) REQUIRE(is_hex(b, 128));
  for (const auto& h : t.initial_hash_outputs) REQUIRE(is_hex(h, 64));

  std::string joined;
  for (const auto& b : t.blocks) joined += b;
  REQUIRE(joined == t.padded);

  REQUIRE(t.rounds.size() == 3);
  std::vector<std::string> prev = t.initial_hash_outputs;
  const std::size_t expected_out[] = {3, 2, 1};
  for (std::size_t r = 0; r < t.rounds.size(); ++r) {
    const auto& round = t.rounds[r];
    REQUIRE(round.round == r + 1);
    REQUIRE(round.input_hash_outputs == prev);
    REQUIRE(is_hex(round.computed_new_iv, 64));
    REQUIRE(round.new_blocks.size() == prev.size() / 2);
    REQUIRE(round.output_hash_outputs.size() == expected_out[r]);
    for (const auto& b : round.new_blocks) REQUIRE(is_hex(b, 128));
    for (const auto& h : round.output_hash_outputs) REQUIRE(is_hex(h, 64));
    // A pair block is the two input hex strings side by side.
    for (std::size_t j = 0; j < round.new_blocks.size(); ++j)
      REQUIRE(round.new_blocks[j] == prev[2 * j] + prev[2 * j + 1]);
    prev = round.output_hash_outputs;
  }
  REQUIRE(res.final_digest == prev.front());
  REQUIRE(t.final_digest == res.final_digest);
  REQUIRE(is_hex(res.final_digest, 64));
}

TEST_CASE("Three blocks: one pair plus a carried output, then one more round") {
  const std::string msg(150, 'z');
  auto res = ph::compute(msg);
  REQUIRE(res.trace.blocks.size() == 3);
  REQUIRE(res.trace.rounds.size() == 2);
  const auto& r1 = res.trace.rounds[0];
  REQUIRE(r1.input_hash_outputs.size() == 3);
  REQUIRE(r1.new_blocks.size() == 1);
  REQUIRE(r1.output_hash_outputs.size() == 2);
  REQUIRE(r1.output_hash_outputs[1] == r1.input_hash_outputs[2]);
  const auto& r2 = res.trace.rounds[1];
  REQUIRE(r2.input_hash_outputs.size() == 2);
  REQUIRE(r2.output_hash_outputs.size() == 1);
}

TEST_CASE("Repeated and differently threaded runs are byte-identical") {
  const std::string msg(1000, 'm');
  auto a = ph::compute(msg, ph::HashConfig{1, true});
  auto b = ph::compute(msg, ph::HashConfig{1, true});
  auto c = ph::compute(msg, ph::HashConfig{8, true});
  auto d = ph::compute(msg);
  REQUIRE(same_response(a, b));
  REQUIRE(same_response(a, c));
  REQUIRE(same_response(a, d));
}

TEST_CASE("Reference path matches SHA-256 on a two-block vector") {
  auto res = ph::compute("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq");
  REQUIRE(res.normal_hash ==
          "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
  REQUIRE(res.trace.blocks.size() == 2);
  REQUIRE(res.trace.rounds.size() == 1);
  REQUIRE(res.final_digest != res.normal_hash);
}

TEST_CASE("UTF-8 input is echoed unmodified") {
  const std::string msg = "h\xC3\xA9llo w\xC3\xB6rld \xE2\x9C\x93";
  auto res = ph::compute(msg);
  REQUIRE(res.trace.original_message == msg);
  REQUIRE(res.normal_hash == ph::to_hex(ph::sha256(msg)));
}

TEST_CASE("Invalid UTF-8 is rejected unless lossy") {
  const std::string raw = "ab\xFF";
  REQUIRE_THROWS_AS(ph::compute(raw), ph::InputEncodingError);

  auto res = ph::compute(raw, ph::HashConfig{1, false});
  REQUIRE(res.trace.original_message == "ab\xEF\xBF\xBD");
  REQUIRE(res.normal_hash == ph::to_hex(ph::sha256(raw)));
  REQUIRE(res.trace.padded.substr(0, 8) == "6162ff80");
}
