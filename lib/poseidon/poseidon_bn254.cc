// Copyright 2025 Google LLC.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "poseidon/poseidon_bn254.h"

#include <stddef.h>
#include <stdint.h>

#include <cctype>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "algebra/fp_bn254.h"
#include "util/crypto.h"
#include "util/log.h"
#include "util/panic.h"

namespace noctis {
namespace {

constexpr char kMagic[] = "poseidon_bn254";

std::vector<std::string> tokenize(const std::string& text) {
  std::vector<std::string> tokens;
  std::string cur;
  bool comment = false;
  for (char c : text) {
    if (c == '\n') comment = false;
    if (comment) continue;
    if (c == '#') {
      comment = true;
    } else if (!std::isspace(static_cast<unsigned char>(c))) {
      cur.push_back(c);
      continue;
    }
    if (!cur.empty()) {
      tokens.push_back(std::move(cur));
      cur.clear();
    }
  }
  if (!cur.empty()) tokens.push_back(std::move(cur));
  return tokens;
}

// Small decimal counts only.
bool parse_count(const std::string& s, size_t* out) {
  if (s.empty() || s.size() > 6) return false;
  size_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    v = 10 * v + static_cast<size_t>(c - '0');
  }
  *out = v;
  return true;
}

// Reads constants from tokens[*pos] up to, not including, the token
// STOP.
PoseidonParamsStatus parse_constants(const std::vector<std::string>& tokens,
                                     size_t* pos, const char* stop,
                                     size_t want, const Fp254& F,
                                     std::vector<Fp254::Elt>* out) {
  out->clear();
  while (*pos < tokens.size() && tokens[*pos] != stop) {
    std::optional<Fp254::Elt> e = F.of_untrusted_string(tokens[*pos].c_str());
    if (!e.has_value()) {
      log(ERROR, "poseidon_bn254: bad constant \"%s\" at token %zu",
          tokens[*pos].c_str(), *pos);
      return POSEIDON_PARAMS_BAD_CONSTANT;
    }
    out->push_back(*e);
    ++*pos;
  }
  if (*pos == tokens.size()) return POSEIDON_PARAMS_MALFORMED;
  ++*pos;  // STOP
  if (out->size() != want) {
    log(ERROR, "poseidon_bn254: %zu constants before \"%s\", want %zu",
        out->size(), stop, want);
    return POSEIDON_PARAMS_WRONG_COUNT;
  }
  return POSEIDON_PARAMS_OK;
}

}  // namespace

const char* poseidon_params_status_name(PoseidonParamsStatus s) {
  switch (s) {
    case POSEIDON_PARAMS_OK:
      return "ok";
    case POSEIDON_PARAMS_IO_ERROR:
      return "io error";
    case POSEIDON_PARAMS_MALFORMED:
      return "malformed asset";
    case POSEIDON_PARAMS_BAD_SCHEDULE:
      return "unexpected round schedule";
    case POSEIDON_PARAMS_BAD_CONSTANT:
      return "bad constant";
    case POSEIDON_PARAMS_WRONG_COUNT:
      return "wrong number of constants";
    case POSEIDON_PARAMS_DIGEST_MISMATCH:
      return "digest mismatch";
  }
  return "unknown";
}

size_t poseidon_bn254_partial_rounds(size_t width) {
  switch (width) {
    case 3:
      return 57;
    case 4:
      return 56;
    default:
      return 0;
  }
}

PoseidonParamsStatus parse_poseidon_bn254_params(const std::string& text,
                                                 size_t width, const Fp254& F,
                                                 PoseidonBn254Params* params) {
  std::vector<std::string> tokens = tokenize(text);
  PoseidonBn254Params p;

  // magic, version, then four (key, count) pairs, then "ark".
  if (tokens.size() < 11 || tokens[0] != kMagic) {
    return POSEIDON_PARAMS_MALFORMED;
  }
  p.version = tokens[1];
  const char* keys[4] = {"width", "full_rounds", "partial_rounds", "alpha"};
  size_t vals[4];
  for (size_t i = 0; i < 4; ++i) {
    if (tokens[2 + 2 * i] != keys[i] ||
        !parse_count(tokens[3 + 2 * i], &vals[i])) {
      return POSEIDON_PARAMS_MALFORMED;
    }
  }
  p.width = vals[0];
  p.full_rounds = vals[1];
  p.partial_rounds = vals[2];
  if (p.width != width || p.full_rounds != kPoseidonBn254FullRounds ||
      p.partial_rounds != poseidon_bn254_partial_rounds(width) ||
      vals[3] != kPoseidonBn254Alpha) {
    log(ERROR,
        "poseidon_bn254: schedule t=%zu RF=%zu RP=%zu alpha=%zu, "
        "want t=%zu RF=%zu RP=%zu alpha=%zu",
        p.width, p.full_rounds, p.partial_rounds, vals[3], width,
        kPoseidonBn254FullRounds, poseidon_bn254_partial_rounds(width),
        kPoseidonBn254Alpha);
    return POSEIDON_PARAMS_BAD_SCHEDULE;
  }
  if (tokens[10] != "ark") return POSEIDON_PARAMS_MALFORMED;

  size_t pos = 11;
  PoseidonParamsStatus st =
      parse_constants(tokens, &pos, "mds",
                      (p.full_rounds + p.partial_rounds) * p.width, F, &p.ark);
  if (st != POSEIDON_PARAMS_OK) return st;
  st = parse_constants(tokens, &pos, "end", p.width * p.width, F, &p.mds);
  if (st != POSEIDON_PARAMS_OK) return st;
  if (pos != tokens.size()) return POSEIDON_PARAMS_MALFORMED;

  p.sha256 = sha256_hex(text);
  *params = std::move(p);
  return POSEIDON_PARAMS_OK;
}

PoseidonParamsStatus load_poseidon_bn254_params(const std::string& path,
                                                size_t width,
                                                const std::string& sha256_hex,
                                                const Fp254& F,
                                                PoseidonBn254Params* params) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    log(ERROR, "poseidon_bn254: cannot open %s", path.c_str());
    return POSEIDON_PARAMS_IO_ERROR;
  }
  std::string text((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  if (in.bad()) {
    log(ERROR, "poseidon_bn254: error reading %s", path.c_str());
    return POSEIDON_PARAMS_IO_ERROR;
  }

  PoseidonBn254Params p;
  PoseidonParamsStatus st = parse_poseidon_bn254_params(text, width, F, &p);
  if (st != POSEIDON_PARAMS_OK) {
    log(ERROR, "poseidon_bn254: %s: %s", path.c_str(),
        poseidon_params_status_name(st));
    return st;
  }

  if (!sha256_hex.empty()) {
    std::string want;
    for (char c : sha256_hex) {
      want.push_back(
          static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (want != p.sha256) {
      log(ERROR, "poseidon_bn254: %s has sha256 %s, want %s", path.c_str(),
          p.sha256.c_str(), want.c_str());
      return POSEIDON_PARAMS_DIGEST_MISMATCH;
    }
  }

  log(INFO, "poseidon_bn254: loaded t=%zu version %s sha256 %s", p.width,
      p.version.c_str(), p.sha256.c_str());
  *params = std::move(p);
  return POSEIDON_PARAMS_OK;
}

std::string poseidon_bn254_params_to_text(const PoseidonBn254Params& params,
                                          const Fp254& F) {
  std::string s = std::string(kMagic) + " " + params.version + "\n";
  s += "width " + std::to_string(params.width) + "\n";
  s += "full_rounds " + std::to_string(params.full_rounds) + "\n";
  s += "partial_rounds " + std::to_string(params.partial_rounds) + "\n";
  s += "alpha " + std::to_string(kPoseidonBn254Alpha) + "\n";
  s += "ark\n";
  for (const auto& e : params.ark) s += F.to_hex(e) + "\n";
  s += "mds\n";
  for (const auto& e : params.mds) s += F.to_hex(e) + "\n";
  s += "end\n";
  return s;
}

PoseidonBn254::PoseidonBn254(const PoseidonBn254Params& t3,
                             const PoseidonBn254Params& t4, const Fp254& F)
    : f_(F),
      t3_(t3.full_rounds, t3.partial_rounds, t3.ark, t3.mds, F),
      t4_(t4.full_rounds, t4.partial_rounds, t4.ark, t4.mds, F) {
  check(t3.width == 3 && t3.partial_rounds == poseidon_bn254_partial_rounds(3),
        "PoseidonBn254: wrong t=3 parameters");
  check(t4.width == 4 && t4.partial_rounds == poseidon_bn254_partial_rounds(4),
        "PoseidonBn254: wrong t=4 parameters");
}

PoseidonBn254::Elt PoseidonBn254::hash1(const Elt& a) const {
  return hash2(a, f_.zero());
}

PoseidonBn254::Elt PoseidonBn254::hash2(const Elt& a, const Elt& b) const {
  T3::State s = {f_.zero(), a, b};
  t3_.permute(s);
  return s[0];
}

PoseidonBn254::Elt PoseidonBn254::hash3(const Elt& a, const Elt& b,
                                        const Elt& c) const {
  T4::State s = {f_.zero(), a, b, c};
  t4_.permute(s);
  return s[0];
}

}  // namespace noctis
