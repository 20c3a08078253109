#include "blocklist_file.h"
#include "cid_util.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace cidgate {

std::vector<BlockEntry> parse_blocklist_text(const std::string& text,
                                             const std::string& default_reason) {
    std::vector<BlockEntry> out;
    std::istringstream in(text);
    std::string line;

    while (std::getline(in, line)) {
        line = trim_ws(line);
        if (line.empty() || line[0] == '#') continue;

        const auto sep = line.find_first_of(" \t");
        BlockEntry e;
        if (sep == std::string::npos) {
            e.cid = line;
            e.reason = default_reason;
        } else {
            e.cid = line.substr(0, sep);
            e.reason = trim_ws(line.substr(sep + 1));
            if (e.reason.empty()) e.reason = default_reason;
        }
        out.push_back(std::move(e));
    }
    return out;
}

bool load_blocklist_file(const std::string& path,
                         const std::string& default_reason,
                         BlockMap* out,
                         std::string* err) {
    out->clear();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        // Absent list is a normal state (fresh install, sync never ran).
        return true;
    }
    if (std::filesystem::is_directory(path, ec)) {
        if (err) *err = path + " is a directory";
        return false;
    }

    std::ifstream f(path, std::ios::binary);
    if (!f.good()) {
        if (err) *err = "cannot open " + path + ": " + std::strerror(errno);
        return false;
    }

    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        if (err) *err = "read failed: " + path;
        return false;
    }

    BlockMap tmp;
    for (auto& e : parse_blocklist_text(ss.str(), default_reason)) {
        tmp[e.cid] = std::move(e.reason);
    }
    out->swap(tmp);
    return true;
}

bool write_blocklist_file_atomic(const std::string& path,
                                 const std::vector<std::string>& header_comments,
                                 const std::vector<BlockEntry>& entries,
                                 std::string* err) {
    std::filesystem::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            if (err) *err = "mkdir failed: " + ec.message();
            return false;
        }
    }

    // tmp must live next to the target: rename is only atomic within one filesystem.
    auto tmp = p;
    tmp += ".tmp";

    {
        std::ofstream o(tmp.string(), std::ios::trunc | std::ios::binary);
        if (!o.good()) {
            if (err) *err = "cannot open " + tmp.string();
            return false;
        }
        for (const auto& h : header_comments) o << "# " << h << "\n";
        if (!header_comments.empty()) o << "\n";
        for (const auto& e : entries) o << e.cid << " " << e.reason << "\n";
        o.flush();
        if (!o.good()) {
            if (err) *err = "write failed: " + tmp.string();
            o.close();
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    std::filesystem::rename(tmp, p, ec);
    if (ec) {
        if (err) *err = "rename failed: " + ec.message();
        std::error_code ec_rm;
        std::filesystem::remove(tmp, ec_rm);
        return false;
    }
    return true;
}

} // namespace cidgate
