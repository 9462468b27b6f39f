#include "gstree/status_parser.h"

#include <cctype>
#include <format>
#include <utility>

#include "gstree/logger.h"

namespace gstree {
namespace {

constexpr std::string_view kRecordTags = "12u?!#";
constexpr std::string_view kStatusLetters = "MTADRCU.";

bool is_octal(char ch) {
    return ch >= '0' && ch <= '7';
}

bool is_lower_hex(char ch) {
    return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');
}

std::string printable(char ch) {
    if (ch == '\0') {
        return "NUL";
    }
    if (std::isprint(static_cast<unsigned char>(ch))) {
        return std::string{'\'', ch, '\''};
    }
    return std::format("0x{:02x}", static_cast<unsigned>(static_cast<unsigned char>(ch)));
}

} // namespace

MalformedRecordError::MalformedRecordError(std::size_t offset, const std::string& what)
    : std::runtime_error{what}, offset_{offset} {}

StatusParser::StatusParser(std::string_view data)
    : data_{data} {}

std::optional<StatusRecord> StatusParser::next() {
    if (pos_ >= data_.size()) {
        return std::nullopt;
    }

    record_start_ = pos_;
    const char tag = take_tag();
    switch (tag) {
        case '1':
            return parse_ordinary();
        case '2':
            return parse_rename();
        case 'u':
            return parse_unmerged();
        case '?':
            return UntrackedRecord{take_path("untracked path")};
        case '!':
            return IgnoredRecord{take_path("ignored path")};
        case '#':
            return HeaderRecord{take_path("header text")};
        default:
            break;
    }
    fail("known record tag");
}

OrdinaryRecord StatusParser::parse_ordinary() {
    OrdinaryRecord record;
    record.xy = take_xy();
    record.submodule = take_submodule();
    take_modes(3);
    take_object_ids(2);
    record.path = take_path("path");
    return record;
}

RenameRecord StatusParser::parse_rename() {
    RenameRecord record;
    record.xy = take_xy();
    record.submodule = take_submodule();
    take_modes(3);
    take_object_ids(2);
    take_score(record);
    record.path = take_path("new path");
    record.original_path = take_path("original path");
    return record;
}

UnmergedRecord StatusParser::parse_unmerged() {
    UnmergedRecord record;
    record.xy = take_xy();
    record.submodule = take_submodule();
    take_modes(4);
    take_object_ids(3);
    record.path = take_path("path");
    return record;
}

char StatusParser::take_tag() {
    const char tag = data_[pos_];
    if (kRecordTags.find(tag) == std::string_view::npos) {
        fail("record tag (one of 1, 2, u, ?, !, #)");
    }
    ++pos_;
    expect_space("record tag");
    return tag;
}

std::string StatusParser::take_xy() {
    if (data_.size() - pos_ < 2) {
        fail("two-letter status code");
    }
    for (std::size_t i = 0; i < 2; ++i) {
        if (kStatusLetters.find(data_[pos_ + i]) == std::string_view::npos) {
            pos_ += i;
            fail("status letter (one of MTADRCU.)");
        }
    }
    std::string xy{data_.substr(pos_, 2)};
    pos_ += 2;
    expect_space("status code");
    return xy;
}

// "N..." for plain entries, "S<c><m><u>" for submodules.
std::string StatusParser::take_submodule() {
    if (data_.size() - pos_ < 4) {
        fail("submodule state");
    }
    std::string_view field = data_.substr(pos_, 4);
    const bool plain = field == "N...";
    const bool submodule = field[0] == 'S' && (field[1] == 'C' || field[1] == '.') &&
                           (field[2] == 'M' || field[2] == '.') && (field[3] == 'U' || field[3] == '.');
    if (!plain && !submodule) {
        fail("submodule state (N... or S[C.][M.][U.])");
    }
    pos_ += 4;
    expect_space("submodule state");
    return std::string{field};
}

void StatusParser::take_modes(int count) {
    for (int n = 0; n < count; ++n) {
        for (int i = 0; i < 6; ++i) {
            if (pos_ >= data_.size() || !is_octal(data_[pos_])) {
                fail("six-digit octal file mode");
            }
            ++pos_;
        }
        expect_space("file mode");
    }
}

void StatusParser::take_object_ids(int count) {
    for (int n = 0; n < count; ++n) {
        const std::size_t start = pos_;
        while (pos_ < data_.size() && is_lower_hex(data_[pos_])) {
            ++pos_;
        }
        if (pos_ == start) {
            fail("hexadecimal object name");
        }
        expect_space("object name");
    }
}

void StatusParser::take_score(RenameRecord& record) {
    if (pos_ >= data_.size() || (data_[pos_] != 'R' && data_[pos_] != 'C')) {
        fail("rename or copy score (R<n> or C<n>)");
    }
    record.operation = data_[pos_++];

    int digits = 0;
    int score = 0;
    while (pos_ < data_.size() && digits < 3 && std::isdigit(static_cast<unsigned char>(data_[pos_]))) {
        score = score * 10 + (data_[pos_] - '0');
        ++pos_;
        ++digits;
    }
    if (digits == 0) {
        fail("similarity score digits");
    }
    record.score = score;
    expect_space("similarity score");
}

std::string StatusParser::take_path(std::string_view what) {
    const std::size_t end = data_.find('\0', pos_);
    if (end == std::string_view::npos) {
        fail(std::format("NUL-terminated {}", what));
    }
    if (end == pos_) {
        fail(std::format("non-empty {}", what));
    }
    std::string path{data_.substr(pos_, end - pos_)};
    pos_ = end + 1;
    return path;
}

void StatusParser::expect_space(std::string_view after) {
    if (pos_ >= data_.size() || data_[pos_] != ' ') {
        fail(std::format("space after {}", after));
    }
    ++pos_;
}

void StatusParser::fail(std::string_view expected) const {
    std::string found = pos_ < data_.size() ? printable(data_[pos_]) : std::string{"end of input"};
    throw MalformedRecordError{
        record_start_,
        std::format("malformed status record at byte {}: expected {} at byte {}, found {}", record_start_,
                    expected, pos_, found)};
}

std::vector<StatusRecord> parse_records(std::string_view data) {
    std::vector<StatusRecord> records;
    StatusParser parser{data};
    while (auto record = parser.next()) {
        records.push_back(std::move(*record));
    }
    return records;
}

StatusMap collect_statuses(std::string_view data) {
    StatusMap map;
    auto& logger = Logger::instance();

    auto assign = [&map](std::string path, std::string status) {
        map.rename_sources.erase(path);
        map.statuses.insert_or_assign(std::move(path), std::move(status));
    };

    StatusParser parser{data};
    while (auto record = parser.next()) {
        if (auto* ordinary = std::get_if<OrdinaryRecord>(&*record)) {
            assign(std::move(ordinary->path), std::move(ordinary->xy));
        } else if (auto* renamed = std::get_if<RenameRecord>(&*record)) {
            map.rename_sources.insert_or_assign(renamed->path, std::move(renamed->original_path));
            map.statuses.insert_or_assign(std::move(renamed->path), std::move(renamed->xy));
        } else if (auto* unmerged = std::get_if<UnmergedRecord>(&*record)) {
            assign(std::move(unmerged->path), std::move(unmerged->xy));
        } else if (auto* untracked = std::get_if<UntrackedRecord>(&*record)) {
            assign(std::move(untracked->path), "??");
        } else if (auto* ignored = std::get_if<IgnoredRecord>(&*record)) {
            assign(std::move(ignored->path), "!!");
        } else if (auto* header = std::get_if<HeaderRecord>(&*record)) {
            logger.trace("skipping header: {}", header->text);
        }
    }

    logger.debug("parsed {} status entries ({} renames) from {} bytes", map.statuses.size(),
                 map.rename_sources.size(), data.size());
    return map;
}

} // namespace gstree
