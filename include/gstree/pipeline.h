#pragma once

#include <iosfwd>
#include <string_view>

#include "gstree/config.h"

namespace gstree {

// Parses a complete porcelain v2 -z buffer, folds it into a tree and writes
// one line per node. Throws MalformedRecordError before anything is written
// when the buffer does not parse.
void render_status(std::string_view raw, const Config::Options& options, bool use_color, std::ostream& out);

} // namespace gstree
