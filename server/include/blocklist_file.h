#pragma once
#include <string>
#include <unordered_map>
#include <vector>

namespace cidgate {

/*
Block-list file format
======================

Both the operator override list and the denylist snapshot use the same
line-oriented shape:

    # comment
    <cid> [reason]

- Lines are trimmed; blank lines and lines starting with '#' are ignored.
- The first whitespace-separated token is the CID (case-sensitive, opaque).
- The remainder of the line (trimmed) is the reason tag.
- A missing reason is replaced by the caller-supplied default.
- Later duplicates of a CID overwrite earlier ones; last line wins.
*/

struct BlockEntry {
    std::string cid;
    std::string reason;
};

using BlockMap = std::unordered_map<std::string, std::string>;

// Parse block-list text. Never throws on malformed lines; they are skipped.
std::vector<BlockEntry> parse_blocklist_text(const std::string& text,
                                             const std::string& default_reason);

// Load a block-list file into `out`.
//
// Return value:
// - true  if the file was read, or if it does not exist (out is left empty)
// - false on a read error for an existing path, or when it is a directory
//   (err filled, out left empty)
bool load_blocklist_file(const std::string& path,
                         const std::string& default_reason,
                         BlockMap* out,
                         std::string* err);

// Replace `path` with a complete new block-list file.
//
// The data is written to "<path>.tmp", flushed, then renamed over `path`, so a
// reader sees either the previous file or the new one in full.
bool write_blocklist_file_atomic(const std::string& path,
                                 const std::vector<std::string>& header_comments,
                                 const std::vector<BlockEntry>& entries,
                                 std::string* err);

} // namespace cidgate
