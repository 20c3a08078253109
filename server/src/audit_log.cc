#include "audit_log.h"

#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <openssl/sha.h>

namespace cidgate {

/*
Audit log (hash-chained JSONL)
=============================

The gateway records what it decided and why: which CID was requested, which
block rule matched, how each denylist sync went, who switched the jurisdiction,
which copyright notices were accepted.

Line format (field order is fixed; the hash preimage depends on it):

  {"ts":..,"event":..,"outcome":..,"level":..,"prev_hash":..,"line_hash":..,"f":{..}}

  line_hash = SHA256(prev_hash + <same line without the line_hash member>)

Threading model
---------------
append() is called from request handlers and from the denylist scheduler.
Writes are serialized with mu_ to keep the chain linear.

Failure model
-------------
The audit sink must never fail a request. append() is noexcept and reports
I/O problems through its return value and stderr only.
*/

static const char* level_name(int lvl) {
  switch (lvl) {
    case 0: return "DEBUG";
    case 1: return "INFO";
    case 2: return "ADMIN";
    case 3: return "SECURITY";
  }
  return "INFO";
}

static std::string to_hex(const unsigned char* p, size_t n) {
  static const char* kHex = "0123456789abcdef";
  std::string out;
  out.resize(n * 2);
  for (size_t i = 0; i < n; i++) {
    out[i*2+0] = kHex[(p[i] >> 4) & 0xF];
    out[i*2+1] = kHex[(p[i] >> 0) & 0xF];
  }
  return out;
}

AuditLog::AuditLog(std::string jsonl_path, std::string state_path)
  : jsonl_path_(std::move(jsonl_path)), state_path_(std::move(state_path)) {}

std::string AuditLog::now_iso_utc() {
  using namespace std::chrono;
  auto now = system_clock::now();
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

  std::time_t tt = system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&tt, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
      << "." << std::setw(3) << std::setfill('0') << ms.count()
      << "Z";
  return oss.str();
}

std::string AuditLog::sha256_hex(const std::string& s) {
  unsigned char h[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(s.data()), s.size(), h);
  return to_hex(h, sizeof(h));
}

bool AuditLog::set_min_level_str(const std::string& s) {
  std::string u;
  for (char c : s) u.push_back((char)std::toupper((unsigned char)c));

  for (int lvl = 0; lvl <= 3; lvl++) {
    if (u == level_name(lvl)) {
      min_level_.store(lvl);
      return true;
    }
  }
  return false;
}

std::string AuditLog::min_level_str() const {
  return level_name(min_level_.load());
}

// Missing or invalid state starts a new chain from genesis.
std::string AuditLog::load_prev_hash_() const {
  std::ifstream f(state_path_);
  if (!f.good()) return std::string(64, '0');
  std::string line;
  std::getline(f, line);
  if (line.size() != 64) return std::string(64, '0');
  return line;
}

bool AuditLog::store_prev_hash_(const std::string& h) {
  std::ofstream f(state_path_, std::ios::trunc);
  f << h << "\n";
  f.flush();
  return f.good();
}

std::string AuditLog::json_escape_(const std::string& s) {
  std::ostringstream o;
  for (char c : s) {
    switch (c) {
      case '\"': o << "\\\""; break;
      case '\\': o << "\\\\"; break;
      case '\b': o << "\\b"; break;
      case '\f': o << "\\f"; break;
      case '\n': o << "\\n"; break;
      case '\r': o << "\\r"; break;
      case '\t': o << "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          o << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << (int)(unsigned char)c << std::dec;
        } else {
          o << c;
        }
    }
  }
  return o.str();
}

std::string AuditLog::build_json_(const AuditEvent& e,
                                 const std::string& prev_hash,
                                 const std::string* line_hash) {
  std::ostringstream js;
  js << "{"
     << "\"ts\":\"" << json_escape_(e.ts_utc) << "\""
     << ",\"event\":\"" << json_escape_(e.event) << "\""
     << ",\"outcome\":\"" << json_escape_(e.outcome) << "\""
     << ",\"level\":\"" << level_name(e.level) << "\""
     << ",\"prev_hash\":\"" << prev_hash << "\"";

  if (line_hash) js << ",\"line_hash\":\"" << *line_hash << "\"";

  if (!e.f.empty()) {
    js << ",\"f\":{";
    bool first = true;
    for (const auto& kv : e.f) {
      if (!first) js << ",";
      first = false;
      js << "\"" << json_escape_(kv.first) << "\":"
         << "\"" << json_escape_(kv.second) << "\"";
    }
    js << "}";
  }

  js << "}";
  return js.str();
}

bool AuditLog::append(const AuditEvent& e_in) noexcept {
  if (e_in.level < min_level_.load()) return true;

  try {
    std::lock_guard<std::mutex> lk(mu_);

    AuditEvent e = e_in;
    if (e.ts_utc.empty()) e.ts_utc = now_iso_utc();

    const std::string prev = load_prev_hash_();

    // The preimage must not contain line_hash itself.
    const std::string content_hash = sha256_hex(prev + build_json_(e, prev, nullptr));
    const std::string line = build_json_(e, prev, &content_hash);

    std::ofstream out(jsonl_path_, std::ios::app);
    out << line << "\n";
    out.flush();
    if (!out.good()) {
      std::cerr << "[audit] append failed: " << jsonl_path_ << std::endl;
      return false;
    }

    if (!store_prev_hash_(content_hash)) {
      std::cerr << "[audit] state write failed: " << state_path_ << std::endl;
      return false;
    }
    return true;
  } catch (const std::exception& ex) {
    std::cerr << "[audit] append error: " << ex.what() << std::endl;
    return false;
  }
}

AuditLog::VerifyResult AuditLog::verify_chain() const {
  VerifyResult vr;
  vr.state_hash = load_prev_hash_();

  std::ifstream f(jsonl_path_);
  std::string expected_prev(64, '0');
  std::string line;
  static const std::string kMarker = ",\"line_hash\":\"";

  while (f.good() && std::getline(f, line)) {
    if (line.empty()) continue;
    vr.lines++;

    std::string prev, stored;
    try {
      const nlohmann::json j = nlohmann::json::parse(line);
      prev = j.value("prev_hash", "");
      stored = j.value("line_hash", "");
    } catch (const std::exception&) {
      vr.first_bad_line = vr.lines;
      vr.detail = "unparseable line";
      return vr;
    }

    const auto pos = line.find(kMarker);
    if (prev != expected_prev || pos == std::string::npos || stored.size() != 64) {
      vr.first_bad_line = vr.lines;
      vr.detail = "prev_hash mismatch";
      return vr;
    }

    std::string without = line;
    without.erase(pos, kMarker.size() + 64 + 1);
    if (sha256_hex(prev + without) != stored) {
      vr.first_bad_line = vr.lines;
      vr.detail = "line_hash mismatch";
      return vr;
    }

    expected_prev = stored;
    vr.last_line_hash = stored;
  }

  if (vr.lines == 0) {
    vr.ok = true;
    vr.detail = "empty log";
    return vr;
  }

  vr.ok = (vr.state_hash == vr.last_line_hash);
  vr.detail = vr.ok ? "chain ok" : "state file does not match last line";
  return vr;
}

} // namespace cidgate
