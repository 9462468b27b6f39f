#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace gstree {

// One record per shape of `git status --porcelain=v2 -z`, see git-status(1).

struct OrdinaryRecord {
    std::string xy;
    std::string submodule;
    std::string path;
};

struct RenameRecord {
    std::string xy;
    std::string submodule;
    char operation = 'R'; // 'R'ename or 'C'opy
    int score = 0;
    std::string path;
    std::string original_path;
};

struct UnmergedRecord {
    std::string xy;
    std::string submodule;
    std::string path;
};

struct UntrackedRecord {
    std::string path;
};

struct IgnoredRecord {
    std::string path;
};

// "# branch.oid ...", "# stash 3", ... emitted for --branch / --show-stash.
struct HeaderRecord {
    std::string text;
};

using StatusRecord =
    std::variant<OrdinaryRecord, RenameRecord, UnmergedRecord, UntrackedRecord, IgnoredRecord, HeaderRecord>;

class MalformedRecordError : public std::runtime_error {
public:
    MalformedRecordError(std::size_t offset, const std::string& what);

    std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

class StatusParser {
public:
    explicit StatusParser(std::string_view data);

    // Returns std::nullopt once the buffer is exhausted.
    // Throws MalformedRecordError when no record shape matches.
    std::optional<StatusRecord> next();

    std::size_t offset() const noexcept { return pos_; }

private:
    OrdinaryRecord parse_ordinary();
    RenameRecord parse_rename();
    UnmergedRecord parse_unmerged();

    char take_tag();
    std::string take_xy();
    std::string take_submodule();
    void take_modes(int count);
    void take_object_ids(int count);
    void take_score(RenameRecord& record);
    std::string take_path(std::string_view what);
    void expect_space(std::string_view after);

    [[noreturn]] void fail(std::string_view expected) const;

    std::string_view data_;
    std::size_t pos_ = 0;
    std::size_t record_start_ = 0;
};

std::vector<StatusRecord> parse_records(std::string_view data);

struct StatusMap {
    std::unordered_map<std::string, std::string> statuses;
    std::unordered_map<std::string, std::string> rename_sources;
};

// Folds all records into path -> status and new path -> old path. A path
// reported twice keeps the last record.
StatusMap collect_statuses(std::string_view data);

} // namespace gstree
