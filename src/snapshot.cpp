#include "enoch/snapshot.hpp"
#include "enoch/notation.hpp"

#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <string>

namespace enoch {

static constexpr char MAGIC[] = "enoch-snapshot";
static constexpr int VERSION = 1;

static inline std::string hex64(U64 v) {
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(v));
  return buf;
}

static inline const char* controller_token(Controller c) {
  return c == Controller::PlayerOne ? "1" : "2";
}

std::string write_snapshot(const Snapshot& s) {
  std::ostringstream out;
  out << MAGIC << ' ' << VERSION << '\n';
  out << "turn " << s.turn_index << '\n';

  out << "order";
  for (Army a : s.config.turn_order) out << ' ' << army_token(a);
  out << '\n';

  out << "controllers";
  for (Controller c : s.config.controllers) out << ' ' << controller_token(c);
  out << '\n';

  for (Army a : ALL_ARMIES) {
    const ArmyState& st = s.armies[idx(a)];
    out << "army " << army_token(a)
        << " controller " << controller_token(st.controller)
        << " frozen " << (st.frozen ? 1 : 0)
        << " stalemated " << (s.stalemated[idx(a)] ? 1 : 0)
        << " thrones " << square_name(st.thrones[0]) << ' ' << square_name(st.thrones[1])
        << " zone " << hex64(s.promotion_zones[idx(a)])
        << " pieces";
    for (PieceKind k : ALL_KINDS) out << ' ' << hex64(s.pieces[idx(a)][idx(k)]);
    out << '\n';
  }
  return out.str();
}

// ------------ parsing ------------
namespace {

struct Reader {
  std::istringstream in;

  explicit Reader(std::string_view text) : in(std::string(text)) {}

  std::string next(const char* what) {
    std::string tok;
    if (!(in >> tok)) throw SnapshotError(std::string("snapshot truncated, expected ") + what);
    return tok;
  }

  void expect(const char* keyword) {
    if (next(keyword) != keyword) throw SnapshotError(std::string("snapshot: expected '") + keyword + "'");
  }

  int integer(const char* what) {
    const std::string tok = next(what);
    try {
      std::size_t used = 0;
      const int v = std::stoi(tok, &used);
      if (used != tok.size()) throw SnapshotError(std::string("snapshot: bad ") + what);
      return v;
    } catch (const std::logic_error&) {
      throw SnapshotError(std::string("snapshot: bad ") + what);
    }
  }

  bool flag(const char* what) {
    const std::string tok = next(what);
    if (tok == "0") return false;
    if (tok == "1") return true;
    throw SnapshotError(std::string("snapshot: bad ") + what);
  }

  U64 mask(const char* what) {
    const std::string tok = next(what);
    if (tok.size() != 16) throw SnapshotError(std::string("snapshot: bad ") + what);
    try {
      std::size_t used = 0;
      const U64 v = std::stoull(tok, &used, 16);
      if (used != tok.size()) throw SnapshotError(std::string("snapshot: bad ") + what);
      return v;
    } catch (const std::logic_error&) {
      throw SnapshotError(std::string("snapshot: bad ") + what);
    }
  }

  Army army(const char* what) {
    try {
      return parse_army(next(what));
    } catch (const std::invalid_argument&) {
      throw SnapshotError(std::string("snapshot: bad ") + what);
    }
  }

  Controller controller(const char* what) {
    const std::string tok = next(what);
    if (tok == "1") return Controller::PlayerOne;
    if (tok == "2") return Controller::PlayerTwo;
    throw SnapshotError(std::string("snapshot: bad ") + what);
  }

  Square square(const char* what) {
    const std::string tok = next(what);
    if (tok == "-") return NO_SQUARE;
    try {
      return parse_square(tok);
    } catch (const std::invalid_argument&) {
      throw SnapshotError(std::string("snapshot: bad ") + what);
    }
  }
};

} // namespace

Snapshot read_snapshot(std::string_view text) {
  Reader r(text);
  Snapshot s;

  r.expect(MAGIC);
  if (r.integer("version") != VERSION) throw SnapshotError("snapshot: unsupported version");

  r.expect("turn");
  s.turn_index = r.integer("turn index");
  if (s.turn_index < 0 || s.turn_index >= ARMY_N) throw SnapshotError("snapshot: turn index out of range");

  r.expect("order");
  for (auto& a : s.config.turn_order) a = r.army("turn order");

  r.expect("controllers");
  for (auto& c : s.config.controllers) c = r.controller("controller");

  for (Army a : ALL_ARMIES) {
    r.expect("army");
    if (r.army("army name") != a) throw SnapshotError("snapshot: armies out of order");

    ArmyState& st = s.armies[idx(a)];
    r.expect("controller");
    st.controller = r.controller("controller");
    r.expect("frozen");
    st.frozen = r.flag("frozen flag");
    r.expect("stalemated");
    s.stalemated[idx(a)] = r.flag("stalemate flag");
    r.expect("thrones");
    st.thrones[0] = r.square("throne");
    st.thrones[1] = r.square("throne");
    r.expect("zone");
    s.promotion_zones[idx(a)] = r.mask("promotion zone");
    r.expect("pieces");
    for (PieceKind k : ALL_KINDS) s.pieces[idx(a)][idx(k)] = r.mask("piece mask");
  }

  std::string extra;
  if (r.in >> extra) throw SnapshotError("snapshot: trailing data");
  return s;
}

bool operator==(const Snapshot& a, const Snapshot& b) {
  if (a.pieces != b.pieces || a.promotion_zones != b.promotion_zones) return false;
  if (a.turn_index != b.turn_index || a.stalemated != b.stalemated) return false;
  if (a.config.turn_order != b.config.turn_order || a.config.controllers != b.config.controllers) return false;
  for (Army x : ALL_ARMIES) {
    const ArmyState& p = a.armies[idx(x)];
    const ArmyState& q = b.armies[idx(x)];
    if (p.thrones != q.thrones || p.controller != q.controller || p.frozen != q.frozen) return false;
  }
  return true;
}

} // namespace enoch
